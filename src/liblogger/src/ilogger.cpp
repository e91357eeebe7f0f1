#include "ifx/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool ifx::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "Invalid time format: empty string" << std::endl;
    return false;
  }
  globalFormat_ = fmt;
  return true;
}

std::string ifx::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto now_time = std::chrono::system_clock::to_time_t(tp);
  std::tm now_tm{};
  if (localtime_r(&now_time, &now_tm) == nullptr) {
    return "[INVALID_TIME]";
  }

  std::ostringstream oss;
  oss << std::put_time(&now_tm, globalFormat_.c_str());
  return oss.str();
}

void ifx::ILogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

ifx::LogLevel ifx::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void ifx::ILogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void ifx::ILogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void ifx::ILogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void ifx::ILogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void ifx::ILogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

bool ifx::ILogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string ifx::ILogger::formatLine(LogLevel level,
                                     const std::string& message) {
  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;
  return formatted.str();
}

std::string ifx::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

ifx::LogLevel ifx::stringToLogLevel(const std::string& level) {
  std::string lower = level;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") return LogLevel::LOG_DEBUG;
  if (lower == "info") return LogLevel::LOG_INFO;
  if (lower == "warning" || lower == "warn") return LogLevel::LOG_WARNING;
  if (lower == "error") return LogLevel::LOG_ERROR;
  if (lower == "critical") return LogLevel::LOG_CRITICAL;
  throw std::invalid_argument("Unknown log level: " + level);
}
