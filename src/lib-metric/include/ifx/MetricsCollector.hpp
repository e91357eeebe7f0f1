/**
 * @file MetricsCollector.hpp
 * @brief Реестр метрик и экспорт в текстовом формате Prometheus
 *
 * @date October 2026
 * @version 2.0
 * @license MIT
 *
 * @details Реализует потокобезопасный сбор:
 * - Счетчиков (Counter) и датчиков (Gauge) с атомарными значениями
 * - Динамических семейств метрик через callback-коллекторы
 * - Экспорт в Prometheus text format 0.0.4
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ifx {

enum class MetricType { Counter, Gauge, Untyped };

/// Имя типа для строки "# TYPE"
std::string metricTypeName(MetricType type);

/// Одно значение метрики внутри семейства
struct MetricPoint {
  std::map<std::string, std::string> labels;
  double value = 0.0;
  std::optional<int64_t> timestampMs;  ///< Unix-время в миллисекундах
};

/// Семейство метрик с общим именем, типом и описанием
struct MetricFamily {
  std::string name;
  std::string help;
  MetricType type = MetricType::Untyped;
  std::vector<MetricPoint> metrics;
};

/**
 * @class Gauge
 * @brief Датчик: значение может как расти, так и уменьшаться
 */
class Gauge {
 public:
  void set(double value) { value_.store(value, std::memory_order_relaxed); }
  double value() const { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<double> value_{0.0};
};

/**
 * @class Counter
 * @brief Монотонный счетчик
 */
class Counter {
 public:
  void increment(double value = 1.0);
  double value() const { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<double> value_{0.0};
};

/// Проверка имени метрики: [a-zA-Z_:][a-zA-Z0-9_:]*
bool isValidMetricName(const std::string& name);

/// Проверка имени метки: [a-zA-Z_][a-zA-Z0-9_]*, без префикса "__"
bool isValidLabelName(const std::string& name);

/**
 * @class MetricsCollector
 * @brief Потокобезопасный реестр метрик с поддержкой Prometheus
 *
 * @note Один экземпляр на процесс собирается при старте и передаётся
 * компонентам явно; тесты создают собственные изолированные экземпляры.
 */
class MetricsCollector {
 public:
  /// Callback, дописывающий семейства метрик при каждом сборе
  using Collector = std::function<void(std::vector<MetricFamily>&)>;
  /// Получатель сообщений о пропущенных при сборе семействах
  using ErrorHandler = std::function<void(const std::string&)>;

  /**
   * @brief Зарегистрировать новый счетчик
   * @param name Уникальное имя счетчика
   * @param help Описание метрики (для Prometheus)
   * @throw std::runtime_error Если имя занято или некорректно
   */
  std::shared_ptr<Counter> registerCounter(const std::string& name,
                                           const std::string& help = "");

  /**
   * @brief Зарегистрировать новый датчик
   * @throw std::runtime_error Если имя занято или некорректно
   */
  std::shared_ptr<Gauge> registerGauge(const std::string& name,
                                       const std::string& help = "");

  /// Добавить коллектор динамических метрик
  void addCollector(Collector collector);

  /// Задать получателя сообщений о пропущенных семействах
  void setErrorHandler(ErrorHandler handler);

  /// Имена зарегистрированных счетчиков и датчиков
  bool isRegistered(const std::string& name) const;

  /**
   * @brief Собрать все семейства
   *
   * @details Зарегистрированные метрики идут первыми. Семейства коллекторов
   * с одинаковым именем объединяются; семейства с некорректными именами,
   * метками или с именем зарегистрированной метрики отбрасываются с
   * сообщением в ErrorHandler. Результат отсортирован по имени, значения
   * внутри семейства - по меткам.
   */
  std::vector<MetricFamily> collect() const;

  /**
   * @brief Экспорт метрик в формате Prometheus
   * @return Строка с метриками в Prometheus text-based формате
   *
   * @code
   * GET /metrics HTTP/1.1
   * Content-Type: text/plain; version=0.0.4
   * ...
   * @endcode
   */
  std::string exportPrometheus() const;

  /// Сериализация уже собранных семейств
  static std::string render(const std::vector<MetricFamily>& families);

  /// Форматирование числа как в Prometheus: 42, 0.5, 1e+18, NaN, +Inf
  static std::string formatValue(double value);

 private:
  void checkName(const std::string& name) const;
  void reportError(const std::string& message) const;

  mutable std::mutex mutex_;
  std::map<std::string, std::pair<std::string, std::shared_ptr<Counter>>>
      counters_;
  std::map<std::string, std::pair<std::string, std::shared_ptr<Gauge>>>
      gauges_;
  std::vector<Collector> collectors_;
  ErrorHandler onError_;
};

}  // namespace ifx
