/**
 * @file configloader.hpp
 * @brief Загрузчик конфигураций из JSON-файлов
 *
 * @details
 * Читает файл конфигурации экспортера и разбирает его с помощью
 * nlohmann/json. Ошибки ввода-вывода и синтаксиса превращаются в
 * std::runtime_error с именем файла и позицией ошибки.
 *
 * @see ConfigManager
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @defgroup Configuration Компоненты управления конфигурацией
 */

/**
 * @class ConfigLoader
 * @brief Загрузчик конфигураций из JSON-файлов
 * @ingroup Configuration
 */
class ConfigLoader {
 public:
  /**
   * @brief Загружает конфигурацию из файла
   *
   * @param[in] filename Путь к JSON-файлу
   * @return nlohmann::json Разобранный документ
   * @throw std::runtime_error Если файл не открывается или содержит
   *        некорректный JSON
   *
   * @code
   * ConfigLoader loader;
   * auto config = loader.loadFromFile("influxdb_exporter.json");
   * @endcode
   */
  nlohmann::json loadFromFile(const std::string &filename);

  /// Разбор JSON из строки (для встроенных конфигураций и тестов)
  nlohmann::json loadFromString(const std::string &content) const;

  /// Путь к последнему загруженному файлу или пустая строка
  std::string getLastLoadedFile() const;

  bool hasLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile;
};
