#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vouchnet::log {

class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void info(std::string_view event, FieldList fields = {}) { log(Level::Info, event, std::move(fields)); }
    void warning(std::string_view event, FieldList fields = {}) { log(Level::Warning, event, std::move(fields)); }
    void error(std::string_view event, FieldList fields = {}) { log(Level::Error, event, std::move(fields)); }

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const;

    void set_minimum_level(Level level);
    // nullptr restores std::clog.
    void set_sink(std::ostream* sink);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string_view level_name(Level level);
    static std::string escape(std::string_view value);
    static std::string timestamp_now();

    bool enabled_{true};
    Level minimum_level_{Level::Info};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace vouchnet::log
