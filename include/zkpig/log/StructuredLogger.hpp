#pragma once

#include "zkpig/Export.hpp"

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zkpig::log {

class ZKPIG_API StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    enum class Format {
        Text,
        Json
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_level(Level level);
    [[nodiscard]] Level level() const noexcept;

    void set_format(Format format);
    [[nodiscard]] Format format() const noexcept;

    // Redirects records to `sink`; nullptr restores std::clog. The stream must outlive its use.
    void set_sink(std::ostream* sink);

    static std::optional<Level> parse_level(std::string_view text);
    static std::optional<Format> parse_format(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();
    std::string render_json(const std::string& timestamp, Level level, std::string_view event, const FieldList& fields);
    std::string render_text(const std::string& timestamp, Level level, std::string_view event, const FieldList& fields);

    Level level_{Level::Info};
    Format format_{Format::Text};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

inline void debug(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Debug, event, std::move(fields));
}

inline void info(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Info, event, std::move(fields));
}

inline void warning(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Warning, event, std::move(fields));
}

inline void error(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Error, event, std::move(fields));
}

}  // namespace zkpig::log
