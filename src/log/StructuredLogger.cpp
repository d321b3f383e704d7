#include "zkpig/log/StructuredLogger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace zkpig::log {

namespace {

std::string escape_control_characters(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

bool needs_quoting(std::string_view value) {
    if (value.empty()) {
        return true;
    }
    return value.find_first_of(" \t\r\n\"=") != std::string_view::npos;
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (level < level_) {
        return;
    }

    const auto timestamp = format_timestamp();
    const auto record = format_ == Format::Json ? render_json(timestamp, level, event, fields)
                                                : render_text(timestamp, level, event, fields);

    std::ostream& out = sink_ ? *sink_ : std::clog;
    out << record;
    out.flush();
}

std::string StructuredLogger::render_json(const std::string& timestamp,
                                          Level level,
                                          std::string_view event,
                                          const FieldList& fields) {
    std::ostringstream oss;
    oss << '{'
        << "\"ts\":\"" << escape_json(timestamp) << "\",";
    oss << "\"level\":\"" << escape_json(level_to_string(level)) << "\",";
    oss << "\"event\":\"" << escape_json(event) << "\"";

    if (!fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto& [key, value] = fields[i];
            oss << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
            if (i + 1 < fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }

    oss << "}\n";
    return oss.str();
}

std::string StructuredLogger::render_text(const std::string& timestamp,
                                          Level level,
                                          std::string_view event,
                                          const FieldList& fields) {
    std::string label = level_to_string(level);
    for (auto& ch : label) {
        ch = static_cast<char>(ch - 'a' + 'A');
    }

    std::ostringstream oss;
    oss << timestamp << ' ' << std::left << std::setw(7) << label << ' ' << event;
    for (const auto& [key, value] : fields) {
        oss << ' ' << key << '=';
        if (needs_quoting(value)) {
            oss << '"' << escape_json(value) << '"';
        } else {
            oss << value;
        }
    }
    oss << '\n';
    return oss.str();
}

void StructuredLogger::set_level(Level level) {
    std::scoped_lock lock(mutex_);
    level_ = level;
}

StructuredLogger::Level StructuredLogger::level() const noexcept {
    std::scoped_lock lock(mutex_);
    return level_;
}

void StructuredLogger::set_format(Format format) {
    std::scoped_lock lock(mutex_);
    format_ = format;
}

StructuredLogger::Format StructuredLogger::format() const noexcept {
    std::scoped_lock lock(mutex_);
    return format_;
}

void StructuredLogger::set_sink(std::ostream* sink) {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view text) {
    if (text == "debug") {
        return Level::Debug;
    }
    if (text == "info") {
        return Level::Info;
    }
    if (text == "warn" || text == "warning") {
        return Level::Warning;
    }
    if (text == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

std::optional<StructuredLogger::Format> StructuredLogger::parse_format(std::string_view text) {
    if (text == "text") {
        return Format::Text;
    }
    if (text == "json") {
        return Format::Json;
    }
    return std::nullopt;
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
    return escape_control_characters(value);
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace zkpig::log
