#include "cortexnet/diagnostics/StructuredLogger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cortexnet::diagnostics {

namespace {

int severity(StructuredLogger::Level level) {
    return static_cast<int>(level);
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || severity(level) < severity(minimum_)) {
        return;
    }

    std::ostringstream line;
    line << "{\"ts\":\"" << format_timestamp() << "\","
         << "\"level\":\"" << level_to_string(level) << "\","
         << "\"event\":\"" << escape_json(event) << "\"";

    if (!fields.empty()) {
        line << ",\"fields\":{";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line << ',';
            }
            first = false;
            line << '"' << escape_json(key) << "\":\"" << escape_json(value) << '"';
        }
        line << '}';
    }
    line << "}\n";

    auto& out = sink_ != nullptr ? *sink_ : std::clog;
    out << line.str();
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_ = level;
}

StructuredLogger::Level StructuredLogger::minimum_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return minimum_;
}

void StructuredLogger::set_sink(std::ostream* sink) {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::escape_json(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    for (const unsigned char ch : value) {
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
            escaped.push_back(static_cast<char>(ch));
        } else if (ch == '\n') {
            escaped.append("\\n");
        } else if (ch == '\r') {
            escaped.append("\\r");
        } else if (ch == '\t') {
            escaped.append("\\t");
        } else if (ch < 0x20) {
            static constexpr char kHex[] = "0123456789abcdef";
            escaped.append("\\u00");
            escaped.push_back(kHex[ch >> 4]);
            escaped.push_back(kHex[ch & 0x0F]);
        } else {
            escaped.push_back(static_cast<char>(ch));
        }
    }
    return escaped;
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t as_time_t = std::chrono::system_clock::to_time_t(seconds);

    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &as_time_t);
#else
    gmtime_r(&as_time_t, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace cortexnet::diagnostics
