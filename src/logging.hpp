// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace binauthz {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& level);

class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message, const char* file, int line);

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, uint64_t value);
    LogEntry& field(const std::string& key, int value) { return field(key, static_cast<int64_t>(value)); }
    LogEntry& field(const std::string& key, uint32_t value) { return field(key, static_cast<uint64_t>(value)); }
    LogEntry& field(const std::string& key, double value);
    LogEntry& field(const std::string& key, bool value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const char* file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }

    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };
    [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }

  private:
    LogLevel level_;
    std::string message_;
    const char* file_;
    int line_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    Logger();

    void log(const LogEntry& entry);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    void set_json_format(bool json);
    void set_journald(bool enabled);

    // Redirect output (tests). nullptr restores stderr.
    void set_output(std::ostream* out);

    // Apply BINAUTHZ_LOG_LEVEL / BINAUTHZ_LOG_FORMAT / BINAUTHZ_LOG_JOURNALD.
    void configure_from_env();

  private:
    std::string format_text(const LogEntry& entry) const;
    std::string format_json(const LogEntry& entry) const;

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    bool json_ = false;
    bool journald_ = false;
    std::ostream* out_ = nullptr;
};

Logger& logger();

} // namespace binauthz

#define SLOG_DEBUG(msg) ::binauthz::LogEntry(::binauthz::LogLevel::Debug, (msg), __FILE__, __LINE__)
#define SLOG_INFO(msg) ::binauthz::LogEntry(::binauthz::LogLevel::Info, (msg), __FILE__, __LINE__)
#define SLOG_WARN(msg) ::binauthz::LogEntry(::binauthz::LogLevel::Warn, (msg), __FILE__, __LINE__)
#define SLOG_ERROR(msg) ::binauthz::LogEntry(::binauthz::LogLevel::Error, (msg), __FILE__, __LINE__)
