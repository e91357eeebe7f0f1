#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

#include "ifx/ilogger.hpp"

namespace ifx {

/**
 * @class CompositeLogger
 * @brief Рассылает каждое сообщение всем вложенным логгерам
 *
 * @note Собственный уровень не применяется: фильтрацию выполняет каждый
 * вложенный логгер. setLogLevel() задаёт уровень всем вложенным сразу.
 */
class CompositeLogger : public ILogger {
 public:
  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}

  void addLogger(const std::shared_ptr<ILogger>& logger);
  std::size_t size() const;

  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  void log(LogLevel level, const std::string& message) override;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace ifx
