#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <thread>

Logger &Logger::instance() {
  static Logger instance;
  return instance;
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(::toupper(c));
  });
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  return LogLevel::INFO;
}

const char *Logger::levelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "INFO";
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  currentLevel_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return currentLevel_;
}

void Logger::log(LogLevel level, const std::string &msg) {
  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&in_time_t, &local);

  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;

  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << " ";

  switch (level) {
  case LogLevel::DEBUG:
    out << "[DEBUG] ";
    break;
  case LogLevel::INFO:
    out << "[INFO]  ";
    break;
  case LogLevel::WARN:
    out << "[WARN]  ";
    break;
  case LogLevel::ERROR:
    out << "[ERROR] ";
    break;
  }

  out << "[" << std::hex << std::setw(4)
      << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFF)
      << std::dec << "] " << msg << std::endl;
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= currentLevel_;
}
