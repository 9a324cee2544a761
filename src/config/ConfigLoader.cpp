#include "vouchnet/config/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string_view>

namespace vouchnet::config {

Value Value::boolean(bool value) {
    Value v;
    v.type = ValueType::Boolean;
    v.boolean_value = value;
    return v;
}

Value Value::integer(std::int64_t value) {
    Value v;
    v.type = ValueType::Integer;
    v.integer_value = value;
    return v;
}

Value Value::number(double value) {
    Value v;
    v.type = ValueType::Double;
    v.double_value = value;
    return v;
}

Value Value::string(std::string value) {
    Value v;
    v.type = ValueType::String;
    v.string_value = std::move(value);
    return v;
}

Value Value::object() {
    Value v;
    v.type = ValueType::Object;
    return v;
}

Value Value::array() {
    Value v;
    v.type = ValueType::Array;
    return v;
}

const Value* Value::find(const std::string& key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
}

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)),
      message(std::move(m)),
      hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

namespace {

[[noreturn]] void parse_failure(const std::string& message) {
    throw ConfigError("E_CONFIG_PARSE", message);
}

std::optional<Value> parse_number_token(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    const bool fractional = token.find_first_of(".eE") != std::string_view::npos;
    const auto* begin = token.data();
    const auto* end = token.data() + token.size();
    if (*begin == '+') {
        ++begin;
    }
    if (fractional) {
        // from_chars for double is not available on every standard library we target.
        std::istringstream iss{std::string(begin, end)};
        iss.imbue(std::locale::classic());
        double value = 0.0;
        iss >> value;
        if (iss.fail() || !iss.eof()) {
            return std::nullopt;
        }
        return Value::number(value);
    }
    std::int64_t value = 0;
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return Value::integer(value);
}

class JsonReader {
public:
    explicit JsonReader(std::string_view text)
        : text_(text) {}

    Value read_document() {
        auto value = read_value();
        skip_space();
        if (pos_ != text_.size()) {
            parse_failure("Trailing characters after JSON document");
        }
        return value;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char expected) {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_word(std::string_view word) {
        if (text_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    Value read_value() {
        skip_space();
        if (pos_ >= text_.size()) {
            parse_failure("Unexpected end of JSON input");
        }
        const char ch = text_[pos_];
        if (ch == '{') {
            return read_object();
        }
        if (ch == '[') {
            return read_array();
        }
        if (ch == '"') {
            return Value::string(read_string());
        }
        if (consume_word("true")) {
            return Value::boolean(true);
        }
        if (consume_word("false")) {
            return Value::boolean(false);
        }
        if (consume_word("null")) {
            return Value{};
        }
        const auto start = pos_;
        while (pos_ < text_.size() && (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                                       text_[pos_] == '-' || text_[pos_] == '+' || text_[pos_] == '.' ||
                                       text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
        }
        auto number = parse_number_token(text_.substr(start, pos_ - start));
        if (!number) {
            parse_failure("Invalid JSON value at offset " + std::to_string(start));
        }
        return *number;
    }

    Value read_object() {
        ++pos_;
        auto object = Value::object();
        if (consume('}')) {
            return object;
        }
        do {
            skip_space();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                parse_failure("Expected string key in JSON object");
            }
            auto key = read_string();
            if (!consume(':')) {
                parse_failure("Expected ':' after JSON object key '" + key + "'");
            }
            object.object_value[std::move(key)] = read_value();
        } while (consume(','));
        if (!consume('}')) {
            parse_failure("Expected ',' or '}' in JSON object");
        }
        return object;
    }

    Value read_array() {
        ++pos_;
        auto array = Value::array();
        if (consume(']')) {
            return array;
        }
        do {
            array.array_value.push_back(read_value());
        } while (consume(','));
        if (!consume(']')) {
            parse_failure("Expected ',' or ']' in JSON array");
        }
        return array;
    }

    std::string read_string() {
        ++pos_;
        std::string out;
        while (pos_ < text_.size()) {
            const char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                parse_failure("Unescaped control character in JSON string");
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'u':
                    append_code_point(out);
                    break;
                default:
                    parse_failure("Unsupported escape in JSON string");
            }
        }
        parse_failure("Unterminated JSON string");
    }

    void append_code_point(std::string& out) {
        if (pos_ + 4 > text_.size()) {
            parse_failure("Truncated unicode escape in JSON string");
        }
        unsigned int code = 0;
        const auto result = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, code, 16);
        if (result.ec != std::errc{} || result.ptr != text_.data() + pos_ + 4) {
            parse_failure("Invalid unicode escape in JSON string");
        }
        pos_ += 4;
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view strip_comment(std::string_view line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

Value yaml_scalar(std::string_view raw) {
    const auto text = trim(raw);
    if (text.empty() || text == "~" || text == "null") {
        return Value{};
    }
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        if (text.front() == '"') {
            return Value::string(JsonReader(text).read_document().string_value);
        }
        return Value::string(std::string(text.substr(1, text.size() - 2)));
    }
    if (text == "true" || text == "True" || text == "yes") {
        return Value::boolean(true);
    }
    if (text == "false" || text == "False" || text == "no") {
        return Value::boolean(false);
    }
    if (auto number = parse_number_token(text)) {
        return *number;
    }
    return Value::string(std::string(text));
}

std::string join_path(const std::vector<std::string>& path) {
    std::string joined;
    for (const auto& segment : path) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined += segment;
    }
    return joined.empty() ? std::string{"<root>"} : joined;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        node = node->find(segment);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

Value resolve_profile_chain(const Value& profiles, const std::string& name, std::set<std::string>& visiting) {
    const auto* profile = profiles.find(name);
    if (profile == nullptr) {
        std::string available;
        for (const auto& [key, _] : profiles.object_value) {
            available += available.empty() ? key : ", " + key;
        }
        throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + name,
                          "Available profiles: " + (available.empty() ? std::string{"<none>"} : available));
    }
    if (!profile->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + name);
    }
    if (!visiting.insert(name).second) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + name);
    }

    Value base = Value::object();
    if (const auto* parent = profile->find("extends")) {
        if (!parent->is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + name);
        }
        base = resolve_profile_chain(profiles, parent->string_value, visiting);
    }

    Value own = *profile;
    own.object_value.erase("extends");
    visiting.erase(name);
    return merge_objects(base, own);
}

template <typename T>
T checked_range(std::int64_t value, std::int64_t min, std::int64_t max, const std::string& key) {
    if (value < min || value > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          key + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<T>(value);
}

double checked_fraction(double value, const std::string& key) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be between 0 and 1");
    }
    return value;
}

}  // namespace

Value parse_json(const std::string& text) {
    return JsonReader(text).read_document();
}

Value parse_yaml(const std::string& text) {
    Value root = Value::object();
    struct Frame {
        std::size_t indent;
        Value* node;
    };
    std::vector<Frame> stack{{0, &root}};

    std::istringstream input(text);
    std::string raw_line;
    std::size_t line_number = 0;
    while (std::getline(input, raw_line)) {
        ++line_number;
        const auto without_comment = strip_comment(raw_line);
        if (trim(without_comment).empty()) {
            continue;
        }
        std::size_t indent = 0;
        while (indent < without_comment.size() && without_comment[indent] == ' ') {
            ++indent;
        }
        if (indent < without_comment.size() && without_comment[indent] == '\t') {
            parse_failure("Tabs are not allowed for YAML indentation (line " + std::to_string(line_number) + ")");
        }
        const auto content = trim(without_comment);

        while (stack.size() > 1 && indent < stack.back().indent) {
            stack.pop_back();
        }
        Value* parent = stack.back().node;

        if (content.front() == '-') {
            if (parent->type == ValueType::Object && parent->object_value.empty()) {
                *parent = Value::array();
            }
            if (!parent->is_array()) {
                parse_failure("List item outside of a list (line " + std::to_string(line_number) + ")");
            }
            parent->array_value.push_back(yaml_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string_view::npos) {
            parse_failure("Expected 'key: value' (line " + std::to_string(line_number) + ")");
        }
        if (!parent->is_object()) {
            parse_failure("Mapping entry inside a list (line " + std::to_string(line_number) + ")");
        }
        const std::string key(trim(content.substr(0, colon)));
        const auto rest = trim(content.substr(colon + 1));
        if (rest.empty()) {
            auto& child = parent->object_value[key];
            child = Value::object();
            stack.push_back({indent + 1, &child});
        } else {
            parent->object_value[key] = yaml_scalar(rest);
        }
    }
    return root;
}

Value load_document(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const auto contents = buffer.str();

    const auto first = std::find_if(contents.begin(), contents.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    const bool json = path.extension() == ".json" || (first != contents.end() && *first == '{');
    auto document = json ? parse_json(contents) : parse_yaml(contents);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be a mapping");
    }
    return document;
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }
    Value merged = base;
    for (const auto& [key, value] : overlay.object_value) {
        auto it = merged.object_value.find(key);
        if (it != merged.object_value.end() && it->second.is_object() && value.is_object()) {
            it->second = merge_objects(it->second, value);
        } else {
            merged.object_value[key] = value;
        }
    }
    return merged;
}

Value resolve_profile(const Value& document, const std::string& profile_name) {
    const auto* profiles = document.find("profiles");
    if (profiles == nullptr) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration file is missing 'profiles' section");
    }
    if (!profiles->is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    std::set<std::string> visiting;
    return resolve_profile_chain(*profiles, profile_name, visiting);
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const auto* node = find_path(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (!node->is_string()) {
        throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
    }
    return node->string_value;
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const auto* node = find_path(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->type == ValueType::Boolean) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "on" || lowered == "true") {
            return true;
        }
        if (lowered == "off" || lowered == "false") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const auto* node = find_path(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->type == ValueType::Integer) {
        return node->integer_value;
    }
    if (node->type == ValueType::Double && std::trunc(node->double_value) == node->double_value &&
        std::abs(node->double_value) < 9.0e15) {
        return static_cast<std::int64_t>(node->double_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::optional<double> get_double(const Value& root, const std::vector<std::string>& path) {
    const auto* node = find_path(root, path);
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->type == ValueType::Double) {
        return node->double_value;
    }
    if (node->type == ValueType::Integer) {
        return static_cast<double>(node->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected number at config path " + join_path(path));
}

void apply_profile(const Value& profile, Config& config) {
    if (!profile.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile configuration must be a mapping");
    }
    constexpr auto kMax32 = static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());

    if (auto threshold = get_int64(profile, {"trust", "min_vouch_threshold"})) {
        config.group_policy.min_vouch_threshold = checked_range<std::uint32_t>(*threshold, 1, 1024, "trust.min_vouch_threshold");
    }
    if (auto mode = get_string(profile, {"trust", "cross_cluster_mode"})) {
        const auto parsed = trust::parse_cross_cluster_mode(*mode);
        if (!parsed) {
            throw ConfigError("E_CONFIG_VALUE", "trust.cross_cluster_mode must be one of off, admission, strict");
        }
        config.group_policy.cross_cluster_mode = *parsed;
    }
    if (auto policy = get_string(profile, {"trust", "bridge_vouch_policy"})) {
        const auto parsed = trust::parse_bridge_vouch_policy(*policy);
        if (!parsed) {
            throw ConfigError("E_CONFIG_VALUE",
                              "trust.bridge_vouch_policy must be one of reject, count-single-bridge, count-all");
        }
        config.group_policy.bridge_vouch_policy = *parsed;
    }

    if (auto size = get_int64(profile, {"persistence", "chunk_size"})) {
        config.chunk_size = checked_range<std::size_t>(*size, 256, 16ll * 1024 * 1024, "persistence.chunk_size");
    }
    if (auto replicas = get_int64(profile, {"persistence", "replica_factor"})) {
        config.replica_factor = checked_range<std::uint16_t>(*replicas, 1, 64, "persistence.replica_factor");
    }
    if (auto timeout = get_int64(profile, {"persistence", "transfer_timeout_ms"})) {
        config.transfer_timeout = std::chrono::milliseconds(
            checked_range<std::int64_t>(*timeout, 1, 600'000, "persistence.transfer_timeout_ms"));
    }
    if (auto depth = get_int64(profile, {"persistence", "fallback_depth"})) {
        config.distribution_fallback_depth = checked_range<std::uint16_t>(*depth, 0, 1024, "persistence.fallback_depth");
    }
    if (auto probes = get_int64(profile, {"persistence", "probes_per_chunk"})) {
        config.probes_per_chunk = checked_range<std::uint8_t>(*probes, 0, 64, "persistence.probes_per_chunk");
    }
    if (auto assemblies = get_int64(profile, {"persistence", "recovery_max_assemblies"})) {
        config.recovery_max_assemblies =
            checked_range<std::uint32_t>(*assemblies, 1, 65'536, "persistence.recovery_max_assemblies");
    }
    if (auto capacity = get_int64(profile, {"persistence", "holder_capacity_bytes"})) {
        config.holder_capacity_bytes = checked_range<std::size_t>(*capacity, 0, std::numeric_limits<std::int64_t>::max(),
                                                                  "persistence.holder_capacity_bytes");
    }

    if (auto shards = get_int64(profile, {"registry", "shards"})) {
        config.registry_shards = checked_range<std::uint16_t>(*shards, 1, 256, "registry.shards");
    }
    if (auto stale = get_int64(profile, {"registry", "stale_after_failures"})) {
        config.registry_stale_after_failures = checked_range<std::uint8_t>(*stale, 1, 255, "registry.stale_after_failures");
    }
    if (auto churn = get_double(profile, {"registry", "epoch_churn_ratio"})) {
        config.registry_epoch_churn_ratio = checked_fraction(*churn, "registry.epoch_churn_ratio");
    }

    if (auto pow = get_int64(profile, {"sybil", "pow_difficulty"})) {
        config.registration_pow_difficulty = checked_range<std::uint8_t>(*pow, 0, 24, "sybil.pow_difficulty");
    }
    if (auto attempts = get_int64(profile, {"sybil", "pow_max_attempts"})) {
        config.registration_pow_max_attempts = checked_range<std::uint64_t>(
            *attempts, 1, std::numeric_limits<std::int64_t>::max(), "sybil.pow_max_attempts");
    }
    if (auto buffer = get_int64(profile, {"sybil", "capacity_buffer_bytes"})) {
        config.capacity_buffer_bytes = checked_range<std::uint64_t>(*buffer, 1, 1ll << 34, "sybil.capacity_buffer_bytes");
    }
    if (auto window = get_int64(profile, {"sybil", "capacity_window_seconds"})) {
        config.capacity_challenge_window = std::chrono::seconds(
            checked_range<std::int64_t>(*window, 1, kMax32, "sybil.capacity_window_seconds"));
    }
    if (auto age = get_int64(profile, {"sybil", "min_holder_age_seconds"})) {
        config.min_holder_age = std::chrono::seconds(
            checked_range<std::int64_t>(*age, 0, kMax32, "sybil.min_holder_age_seconds"));
    }
    if (auto floor = get_double(profile, {"sybil", "reputation_floor"})) {
        config.reputation_floor = checked_fraction(*floor, "sybil.reputation_floor");
    }
    if (auto weight = get_double(profile, {"sybil", "weights", "success"})) {
        config.reputation_weight_success = checked_fraction(*weight, "sybil.weights.success");
    }
    if (auto weight = get_double(profile, {"sybil", "weights", "age"})) {
        config.reputation_weight_age = checked_fraction(*weight, "sybil.weights.age");
    }
    if (auto weight = get_double(profile, {"sybil", "weights", "activity"})) {
        config.reputation_weight_activity = checked_fraction(*weight, "sybil.weights.activity");
    }
    if (config.reputation_weight_success + config.reputation_weight_age + config.reputation_weight_activity <= 0.0) {
        throw ConfigError("E_CONFIG_VALUE", "sybil.weights must not all be zero");
    }
    if (auto saturation = get_int64(profile, {"sybil", "age_saturation_seconds"})) {
        config.reputation_age_saturation = std::chrono::seconds(
            checked_range<std::int64_t>(*saturation, 1, kMax32, "sybil.age_saturation_seconds"));
    }
    if (auto saturation = get_int64(profile, {"sybil", "chunk_saturation"})) {
        config.reputation_chunk_saturation = checked_range<std::uint32_t>(*saturation, 1, kMax32, "sybil.chunk_saturation");
    }
    if (auto failures = get_int64(profile, {"sybil", "max_consecutive_failures"})) {
        config.max_consecutive_failures = checked_range<std::uint16_t>(*failures, 1, 1000, "sybil.max_consecutive_failures");
    }

    if (auto length = get_int64(profile, {"possession", "sample_length"})) {
        config.possession_sample_length = checked_range<std::uint32_t>(*length, 1, 1 << 20, "possession.sample_length");
    }
    if (auto freshness = get_int64(profile, {"possession", "freshness_seconds"})) {
        config.possession_freshness = std::chrono::seconds(
            checked_range<std::int64_t>(*freshness, 1, kMax32, "possession.freshness_seconds"));
    }
    if (auto max_age = get_int64(profile, {"possession", "attestation_max_age_seconds"})) {
        config.attestation_max_age = std::chrono::seconds(
            checked_range<std::int64_t>(*max_age, 1, kMax32, "possession.attestation_max_age_seconds"));
    }

    if (auto enabled = get_bool(profile, {"logging", "enabled"})) {
        config.logging_enabled = *enabled;
    }
}

Config load_config(const std::filesystem::path& path, const std::string& profile_name) {
    const auto document = load_document(path);
    Config config{};
    if (document.find("profiles") != nullptr) {
        apply_profile(resolve_profile(document, profile_name), config);
    } else if (profile_name == "default") {
        apply_profile(document, config);
    } else {
        throw ConfigError("E_CONFIG_PROFILE", "Profile requested but file has no 'profiles' section: " + profile_name);
    }
    return config;
}

}  // namespace vouchnet::config
