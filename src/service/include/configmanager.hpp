/**
 * @file configmanager.hpp
 * @brief Фасад для загрузки, обработки и слияния конфигурации экспортера
 *
 * @details
 * Класс ConfigManager объединяет подсистемы загрузки (ConfigLoader),
 * подстановки переменных окружения (EnvironmentProcessor) и валидации
 * (ConfigValidator). Итоговая конфигурация окружения получается слиянием
 * (merge_patch) в следующем порядке:
 *  1. встроенные значения по умолчанию (ExporterConfig::defaultsJson)
 *  2. раздел "defaults" файла
 *  3. раздел "environments.<env>" файла
 *  4. переопределения из командной строки
 *
 * Без файла конфигурации используются встроенные значения и
 * переопределения.
 */

#pragma once

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/environmentprocessor.hpp"
#include "../include/exporterconfig.hpp"

/**
 * @class ConfigManager
 * @brief Класс управления жизненным циклом конфигурации
 * @ingroup Configuration
 *
 * @note Методы потокобезопасны
 */
class ConfigManager {
 public:
  /**
   * @brief Загружает конфигурацию из указанного JSON-файла
   *
   * @param[in] filename Путь к JSON-файлу конфигурации
   * @throw std::runtime_error В случае ошибок чтения, парсинга или валидации
   *
   * @details
   * 1. Читает файл через ConfigLoader::loadFromFile()
   * 2. Подставляет переменные среды через EnvironmentProcessor::process()
   * 3. Валидирует структуру через ConfigValidator::validateRoot()
   */
  void initialize(const std::string &filename);

  /// Использовать уже разобранный документ (те же шаги 2 и 3)
  void initializeFromJson(nlohmann::json config);

  /**
   * @brief Переопределения вида "web.listen_address" -> ":9100"
   *
   * @details Значения "true", "false" и числа записываются как JSON-значения
   * соответствующего типа, остальные - как строки.
   */
  void applyCliOverrides(const std::map<std::string, std::string> &overrides);

  /**
   * @brief Объединённый раздел для окружения
   * @throw std::runtime_error Если в файле есть раздел environments, но
   *        нет окружения env, либо результат не проходит валидацию
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /// Типизированная конфигурация окружения
  ExporterConfig getExporterConfig(const std::string &env) const;

  /// Путь к загруженному файлу или пустая строка
  std::string getConfigFilePath() const;

 private:
  static void setByPath(nlohmann::json &root, const std::string &dottedKey,
                        const std::string &value);

  ConfigLoader loader_;
  EnvironmentProcessor envProcessor_;
  ConfigValidator validator_;

  nlohmann::json baseConfig_ = nlohmann::json::object();
  std::map<std::string, std::string> overrides_;
  mutable std::mutex configMutex_;
};
