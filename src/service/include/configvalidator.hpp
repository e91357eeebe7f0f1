/**
 * @file configvalidator.hpp
 * @brief Проверка структуры JSON-конфигурации экспортера
 *
 * @details
 * Структура файла:
 * @code
 * {
 *   "defaults": { ...раздел... },
 *   "environments": {
 *     "production":  { ...раздел... },
 *     "development": { ...раздел... }
 *   }
 * }
 * @endcode
 * Оба ключа необязательны. Раздел состоит из подразделов web, udp,
 * influxdb, exporter и массива logging (см. ExporterConfig).
 *
 * Все методы при ошибке выбрасывают std::runtime_error с префиксом
 * "ConfigValidator:" и в случае успеха возвращают true.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigValidator
 * @brief Валидатор структуры конфигурации
 * @ingroup Configuration
 */
class ConfigValidator {
 public:
  /**
   * @brief Проверка корня документа
   * @param[in] config Загруженный документ
   * @throw std::runtime_error Если корень не объект, defaults или
   *        environments имеют неверный тип, либо раздел некорректен
   */
  bool validateRoot(const nlohmann::json &config) const;

  /// Проверка одного раздела (defaults, окружения или результата слияния)
  bool validateSection(const nlohmann::json &section) const;

  /**
   * @brief Проверка массива приёмников логов
   *
   * @details Тип "console" или "file"; для "file" обязателен строковый
   * ключ "file"; level, если задан, должен быть известным уровнем.
   */
  bool validateLogging(const nlohmann::json &logging) const;

 private:
  void requireObject(const nlohmann::json &section, const char *name) const;
  void requireString(const nlohmann::json &object, const char *section,
                     const char *key) const;
};
