#include "ifx/consolelogger.hpp"

#include <unistd.h>

ifx::ConsoleLogger& ifx::ConsoleLogger::instance() {
  static ifx::ConsoleLogger instance;
  return instance;
}

ifx::ConsoleLogger::ConsoleLogger(std::ostream& out)
    : out_(out), colored_(&out == &std::cout && isatty(STDOUT_FILENO) == 1) {}

void ifx::ConsoleLogger::setColored(bool colored) {
  std::lock_guard<std::mutex> lock(mutex_);
  colored_ = colored;
}

void ifx::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

void ifx::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::string formattedMsg;
  try {
    formattedMsg = formatLine(level, message);
  } catch (const std::exception& e) {
    formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "] " + message;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (colored_) {
    out_ << colorFor(level) << formattedMsg << IFX_ANSI_COLOR_RESET
         << std::endl;
  } else {
    out_ << formattedMsg << std::endl;
  }
}

const char* ifx::ConsoleLogger::colorFor(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return IFX_ANSI_COLOR_RESET;
}
