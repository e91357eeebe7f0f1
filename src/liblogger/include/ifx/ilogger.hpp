/**
 * @file ilogger.hpp
 * @date October 2026
 * @brief Базовый интерфейс логгеров и вспомогательные компоненты.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace ifx {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

class TimeFormatter {
 public:
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

/**
 * @class ILogger
 * @brief Общий интерфейс приёмников логов
 *
 * @details Фильтрация по уровню выполняется в log() конкретной реализации,
 * методы debug()..critical() только выбирают уровень.
 */
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void setLogLevel(LogLevel level);
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel level, const std::string& message) = 0;
  bool shouldSkipLog(LogLevel level) const;
  static std::string formatLine(LogLevel level, const std::string& message);
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразует имя уровня ("debug", "info", ...) в LogLevel
 * @throw std::invalid_argument Для неизвестного имени
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace ifx
