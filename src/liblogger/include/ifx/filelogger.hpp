#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "ifx/ilogger.hpp"

namespace ifx {

/**
 * @class FileLogger
 * @brief Синхронная запись логов в файл с резервным файлом
 *
 * @details Если основной файл не открывается, строки пишутся в резервный.
 * Если недоступны оба, перед каждой записью делается попытка переоткрыть их,
 * а сообщение уходит в std::cerr.
 */
class FileLogger : public ILogger {
 public:
  explicit FileLogger(std::string mainLogPath,
                      std::string fallbackLogPath = "");
  ~FileLogger() override;

  void flush() override;

  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

 protected:
  void log(LogLevel level, const std::string& message) override;

 private:
  void reopenFiles();

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_;
  std::string fallbackLogPath_;
  bool warnedAboutFallback_ = false;
};

}  // namespace ifx
