#include "visionsync/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace visionsync {

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        default: return "UNKNOWN";
    }
}

const char *log_category_name(LogCategory category) {
    switch (category) {
        case LogCategory::General:      return "General";
        case LogCategory::Discovery:    return "Discovery";
        case LogCategory::Connection:   return "Connection";
        case LogCategory::Conversation: return "Conversation";
        case LogCategory::Terminal:     return "Terminal";
        case LogCategory::FileManager:  return "FileManager";
        default: return "Unknown";
    }
}

bool parse_log_level(const std::string &name, LogLevel &out) {
    static const std::pair<const char *, LogLevel> table[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
        {"error", LogLevel::ERR},
    };
    for (const auto &[n, l] : table) {
        if (name == n) {
            out = l;
            return true;
        }
    }
    return false;
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, LogCategory category, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    std::string ts = ss.str();

    if (console_ && level >= min_level_) {
        std::cerr << "[" << ts << "] [" << log_level_name(level) << "] ["
                  << log_category_name(category) << "] " << msg << std::endl;
    }

    buffer_.push_back(LogMessage{level, category, ts, msg});
    if (buffer_.size() > MAX_LOGS) {
        buffer_.erase(buffer_.begin());
    }
}

std::vector<LogMessage> Logger::get_recent_logs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= buffer_.size()) return buffer_;
    return std::vector<LogMessage>(buffer_.end() - count, buffer_.end());
}

void Logger::clear_recent_logs() {
    std::lock_guard<std::mutex> lk(mu_);
    buffer_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return min_level_;
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lk(mu_);
    console_ = enabled;
}

} // namespace visionsync
