/**
 * @file environmentprocessor.hpp
 * @brief Подстановка значений переменных окружения в JSON-конфигурацию
 *
 * @details
 * Во всех строковых узлах документа, включая вложенные объекты и массивы,
 * шаблон `$ENV{VAR}` заменяется значением переменной окружения VAR.
 * Форма `$ENV{VAR:-default}` подставляет default, если VAR не задана.
 *
 * @warning Шаблоны вида `$ENV{VAR}` остаются неизменными, если переменная
 *          не установлена в окружении и значение по умолчанию не указано
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class EnvironmentProcessor
 * @brief Обработка шаблонов переменных окружения в конфиге
 * @ingroup Configuration
 */
class EnvironmentProcessor {
 public:
  /**
   * @brief Выполняет подстановку переменных среды в JSON
   * @param[in,out] config Документ, строковые узлы которого изменяются
   *
   * @code
   * // {"udp": {"bind_address": "$ENV{UDP_ADDR}"}}
   * EnvironmentProcessor().process(config);
   * @endcode
   */
  void process(nlohmann::json &config) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
  void resolveVariable(std::string &value) const;
};
