// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>

#ifdef HAVE_SYSTEMD
#include <syslog.h>
#include <systemd/sd-journal.h>
#endif

#include "utils.hpp"

namespace binauthz {

namespace {

std::string json_escape(const std::string& in)
{
    std::string out;
    out.reserve(in.size() + 2);
    for (char c : in) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string iso8601_now()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

#ifdef HAVE_SYSTEMD
int journal_priority(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warn:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
    }
    return LOG_INFO;
}
#endif

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& level)
{
    const std::string v = to_lower(trim(value));
    if (v == "debug") {
        level = LogLevel::Debug;
    } else if (v == "info") {
        level = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        level = LogLevel::Warn;
    } else if (v == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

LogEntry::LogEntry(LogLevel level, std::string message, const char* file, int line)
    : level_(level), message_(std::move(message)), file_(file), line_(line)
{
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back(Field{key, value ? value : "", true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, uint64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

Logger::Logger()
{
    configure_from_env();
}

void Logger::configure_from_env()
{
    const std::string level = env_or_default("BINAUTHZ_LOG_LEVEL", "");
    if (!level.empty()) {
        LogLevel parsed = LogLevel::Info;
        if (parse_log_level(level, parsed)) {
            set_level(parsed);
        }
    }
    const std::string format = to_lower(env_or_default("BINAUTHZ_LOG_FORMAT", ""));
    if (format == "json") {
        set_json_format(true);
    } else if (format == "text") {
        set_json_format(false);
    }
    set_journald(env_or_default("BINAUTHZ_LOG_JOURNALD", "") == "1");
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

void Logger::set_journald(bool enabled)
{
    std::lock_guard<std::mutex> lock(mu_);
#ifdef HAVE_SYSTEMD
    journald_ = enabled;
#else
    (void)enabled;
    journald_ = false;
#endif
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

std::string Logger::format_text(const LogEntry& entry) const
{
    std::string line = iso8601_now();
    line += " ";
    line += log_level_name(entry.level());
    line += " ";
    line += entry.message();
    for (const auto& f : entry.fields()) {
        line += " " + f.key + "=";
        if (f.quoted) {
            line += "\"" + json_escape(f.value) + "\"";
        } else {
            line += f.value;
        }
    }
    return line;
}

std::string Logger::format_json(const LogEntry& entry) const
{
    std::string line = "{\"ts\":\"" + iso8601_now() + "\",\"level\":\"" + log_level_name(entry.level()) +
                       "\",\"message\":\"" + json_escape(entry.message()) + "\"";
    for (const auto& f : entry.fields()) {
        line += ",\"" + json_escape(f.key) + "\":";
        if (f.quoted) {
            line += "\"" + json_escape(f.value) + "\"";
        } else {
            line += f.value;
        }
    }
    line += "}";
    return line;
}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (entry.level() < level_) {
        return;
    }

#ifdef HAVE_SYSTEMD
    if (journald_) {
        std::string fields;
        for (const auto& f : entry.fields()) {
            fields += " " + f.key + "=" + f.value;
        }
        sd_journal_send("MESSAGE=%s%s", entry.message().c_str(), fields.c_str(), "PRIORITY=%i",
                        journal_priority(entry.level()), "CODE_FILE=%s", entry.file(), "CODE_LINE=%d", entry.line(),
                        "SYSLOG_IDENTIFIER=binauthz", nullptr);
        return;
    }
#endif

    std::ostream& out = out_ ? *out_ : std::cerr;
    out << (json_ ? format_json(entry) : format_text(entry)) << '\n';
    out.flush();
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

} // namespace binauthz
