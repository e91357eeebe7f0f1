#include "ifx/filelogger.hpp"

#include <iostream>

namespace ifx {

FileLogger::FileLogger(std::string mainLogPath, std::string fallbackLogPath)
    : mainLogPath_(std::move(mainLogPath)),
      fallbackLogPath_(fallbackLogPath.empty() ? mainLogPath_ + ".fallback"
                                               : std::move(fallbackLogPath)) {
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFiles();
}

FileLogger::~FileLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void FileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

std::string FileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string FileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

void FileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  const std::string line = formatLine(level, message) + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
    reopenFiles();
  }

  if (mainLogFile_.is_open()) {
    mainLogFile_ << line;
    mainLogFile_.flush();
    warnedAboutFallback_ = false;
  } else if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to "
                   "fallback log file: "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << line;
    fallbackLogFile_.flush();
  } else {
    std::cerr << "[LOGGER ERROR] No log file is open for writing: " << line;
  }
}

// Вызывается под mutex_
void FileLogger::reopenFiles() {
  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) return;

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

}  // namespace ifx
