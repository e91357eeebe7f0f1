/**
 * @file samplecollector.hpp
 * @brief Публикация содержимого SampleStore в реестре метрик
 */

#pragma once

#include <vector>

#include "../include/samplestore.hpp"
#include "ifx/MetricsCollector.hpp"

/**
 * @class SampleCollector
 * @brief Коллектор, превращающий снимок хранилища в семейства untyped-метрик
 *
 * @details Хранилище не изменяется. Каждый свежий Sample даёт одну точку
 * в семействе с его именем; проверка имён и меток выполняется реестром.
 */
class SampleCollector {
 public:
  static constexpr const char* kHelp = "InfluxDB Metric";

  /**
   * @param store Источник данных
   * @param exportTimestamps Добавлять ли временную метку Sample (мс)
   */
  SampleCollector(const SampleStore& store, bool exportTimestamps = false);

  /// Дописать семейства в out; сигнатура совместима с MetricsCollector::Collector
  void operator()(std::vector<ifx::MetricFamily>& out) const;

  /// Зарегистрировать коллектор в реестре; store должен пережить registry
  static void attach(ifx::MetricsCollector& registry, const SampleStore& store,
                     bool exportTimestamps);

 private:
  const SampleStore& store_;
  bool exportTimestamps_;
};
