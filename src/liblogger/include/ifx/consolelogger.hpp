#pragma once

#include <iostream>
#include <mutex>

#include "ifx/ilogger.hpp"

#define IFX_ANSI_COLOR_RESET "\033[0m"

namespace ifx {

class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  explicit ConsoleLogger(std::ostream& out = std::cout);

  /// Раскрашивать строки по уровню (по умолчанию только для терминала)
  void setColored(bool colored);
  void flush() override;

 protected:
  void log(LogLevel level, const std::string& message) override;

 private:
  static const char* colorFor(LogLevel level);

  std::ostream& out_;
  bool colored_ = false;
  mutable std::mutex mutex_;
};

}  // namespace ifx
