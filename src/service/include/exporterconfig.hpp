/**
 * @file exporterconfig.hpp
 * @brief Типизированная конфигурация экспортера
 *
 * @details Раздел конфигурации после слияния defaults и окружения:
 * @code
 * {
 *   "web":      {"listen_address": ":9122", "telemetry_path": "/metrics"},
 *   "udp":      {"bind_address": ":9122"},
 *   "influxdb": {"sample_expiry": "5m"},
 *   "exporter": {"timestamps": false},
 *   "logging":  [{"type": "console", "level": "info"},
 *                {"type": "file", "level": "debug", "file": "exporter.log"}]
 * }
 * @endcode
 * Отсутствующие ключи принимают значения по умолчанию.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @struct ListenAddress
 * @brief Адрес вида host:port; пустой host означает все интерфейсы
 */
struct ListenAddress {
  std::string host;
  uint16_t port = 0;

  std::string toString() const;
};

/**
 * @brief Разбор адреса "host:port", ":port" или "[v6]:port"
 * @throw std::invalid_argument При отсутствии порта или порте вне 1-65535
 */
ListenAddress parseListenAddress(const std::string &address);

/**
 * @brief Разбор длительности в формате Go: "300ms", "10s", "5m", "1h30m"
 *
 * @details Единицы: ns, us (µs), ms, s, m, h. Допускаются дробные значения
 * ("1.5h") и знак. Строка "0" означает нулевую длительность.
 * @throw std::invalid_argument Для некорректной строки
 */
std::chrono::nanoseconds parseDuration(const std::string &text);

/// Описание одного приёмника логов
struct LoggerConfig {
  std::string type = "console";  ///< "console" или "file"
  std::string level = "info";
  std::string file;  ///< Только для type == "file"
};

/**
 * @struct ExporterConfig
 * @brief Настройки, используемые при запуске экспортера
 */
struct ExporterConfig {
  ListenAddress webListenAddress{"", 9122};
  std::string telemetryPath = "/metrics";
  ListenAddress udpBindAddress{"", 9122};
  std::chrono::nanoseconds sampleExpiry = std::chrono::minutes(5);
  bool exportTimestamps = false;
  std::vector<LoggerConfig> logging;

  /**
   * @brief Построить конфигурацию из объединённого раздела
   * @throw std::invalid_argument Для неположительного sample_expiry,
   *        telemetry_path без ведущего '/' или некорректного адреса
   * @throw nlohmann::json::type_error Если тип значения не совпадает
   */
  static ExporterConfig fromJson(const nlohmann::json &section);

  /// Раздел defaults со значениями по умолчанию
  static nlohmann::json defaultsJson();
};
