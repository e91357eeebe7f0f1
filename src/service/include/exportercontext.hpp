/**
 * @file exportercontext.hpp
 * @brief Общее состояние экспортера, передаваемое компонентам явно
 */

#pragma once

#include <memory>

#include "ifx/MetricsCollector.hpp"
#include "ifx/ilogger.hpp"

/**
 * @struct ExporterContext
 * @brief Реестр метрик процесса, его собственные метрики и логгер
 *
 * @details Создаётся один раз при старте. В тестах каждый тест создаёт
 * свой экземпляр, поэтому глобального состояния нет.
 */
struct ExporterContext {
  static constexpr const char* kLastPushMetric =
      "influxdb_last_push_timestamp_seconds";
  static constexpr const char* kUdpParseErrorsMetric =
      "influxdb_udp_parse_errors_total";

  explicit ExporterContext(ifx::ILogger& log);

  ExporterContext(const ExporterContext&) = delete;
  ExporterContext& operator=(const ExporterContext&) = delete;

  /// Записать в датчик время приёма текущего запроса (Unix, секунды)
  void markPush();

  ifx::ILogger& logger;
  ifx::MetricsCollector registry;
  std::shared_ptr<ifx::Gauge> lastPush;
  std::shared_ptr<ifx::Counter> udpParseErrors;
};
