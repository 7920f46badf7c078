#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <sstream>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // Case-insensitive; anything unrecognised maps to INFO.
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

    void setLevel(LogLevel level);
    LogLevel getLevel();
    void log(LogLevel level, const std::string& msg);

    bool isEnabled(LogLevel level);

private:
    Logger() = default;
    LogLevel currentLevel_ = LogLevel::INFO;
    std::mutex mutex_;
};


#define LOG_AT(level, msg) \
  do { \
    if (Logger::instance().isEnabled(level)) { \
      std::ostringstream oss_; \
      oss_ << msg; \
      Logger::instance().log(level, oss_.str()); \
    } \
  } while (0)

#define LOG_DEBUG(msg) LOG_AT(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) LOG_AT(LogLevel::INFO, msg)
#define LOG_WARN(msg) LOG_AT(LogLevel::WARN, msg)
#define LOG_ERROR(msg) LOG_AT(LogLevel::ERROR, msg)
