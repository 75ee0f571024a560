#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace visionsync {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

enum class LogCategory : std::uint8_t {
    General = 0,
    Discovery,
    Connection,
    Conversation,
    Terminal,
    FileManager
};

struct LogMessage {
    LogLevel level;
    LogCategory category;
    std::string timestamp;
    std::string message;
};

const char *log_level_name(LogLevel level);
const char *log_category_name(LogCategory category);
bool parse_log_level(const std::string &name, LogLevel &out);

class Logger {
public:
    static Logger& get();

    bool should_log(LogLevel level) const;
    void log(LogLevel level, LogCategory category, const std::string& msg);
    std::vector<LogMessage> get_recent_logs(size_t count = 100);
    void clear_recent_logs();
    void set_level(LogLevel level);
    LogLevel level() const;

    // When false, entries are only kept in the in-memory ring.
    void set_console_output(bool enabled);

private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_ = true;
    std::vector<LogMessage> buffer_;
    static constexpr size_t MAX_LOGS = 200;
};

#define VS_LOG_AT_LEVEL(level, cat, msg) \
    do { if (visionsync::Logger::get().should_log(level)) visionsync::Logger::get().log(level, cat, msg); } while(0)

#define VS_LOG_TRACE(cat, msg) VS_LOG_AT_LEVEL(visionsync::LogLevel::TRACE, cat, msg)
#define VS_LOG_DEBUG(cat, msg) VS_LOG_AT_LEVEL(visionsync::LogLevel::DEBUG, cat, msg)
#define VS_LOG_INFO(cat, msg)  VS_LOG_AT_LEVEL(visionsync::LogLevel::INFO, cat, msg)
#define VS_LOG_WARN(cat, msg)  VS_LOG_AT_LEVEL(visionsync::LogLevel::WARN, cat, msg)
#define VS_LOG_ERROR(cat, msg) VS_LOG_AT_LEVEL(visionsync::LogLevel::ERR, cat, msg)

} // namespace visionsync
