#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cortexnet::diagnostics {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);
    [[nodiscard]] Level minimum_level() const noexcept;

    // nullptr restores std::clog. The stream must outlive its registration.
    void set_sink(std::ostream* sink);

    static std::string level_to_string(Level level);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string escape_json(std::string_view value);
    static std::string format_timestamp();

    bool enabled_{true};
    Level minimum_{Level::Info};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

// Shorthand used throughout the library.
inline void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace cortexnet::diagnostics
