#pragma once

#include "vouchnet/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vouchnet::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    static Value boolean(bool value);
    static Value integer(std::int64_t value);
    static Value number(double value);
    static Value string(std::string value);
    static Value object();
    static Value array();

    bool is_null() const noexcept { return type == ValueType::Null; }
    bool is_object() const noexcept { return type == ValueType::Object; }
    bool is_array() const noexcept { return type == ValueType::Array; }
    bool is_string() const noexcept { return type == ValueType::String; }

    const Value* find(const std::string& key) const;
};

// Codes: E_CONFIG_NOT_FOUND, E_CONFIG_PARSE, E_CONFIG_STRUCTURE,
// E_CONFIG_PROFILE, E_CONFIG_TYPE, E_CONFIG_VALUE.
struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

Value parse_json(const std::string& text);
// Indentation-based subset: nested mappings, scalars, "- item" lists.
Value parse_yaml(const std::string& text);
Value load_document(const std::filesystem::path& path);

Value merge_objects(const Value& base, const Value& overlay);
// Resolves profiles.<name>, following `extends` chains.
Value resolve_profile(const Value& document, const std::string& profile_name);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);
std::optional<double> get_double(const Value& root, const std::vector<std::string>& path);

// Overlays the keys present in `profile` onto `config`.
void apply_profile(const Value& profile, Config& config);

Config load_config(const std::filesystem::path& path, const std::string& profile_name = "default");

}  // namespace vouchnet::config
