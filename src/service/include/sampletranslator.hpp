/**
 * @file sampletranslator.hpp
 * @brief Преобразование точек line protocol в Sample
 *
 * @details
 * Для каждого поля точки создаётся отдельный Sample:
 *  - поле "value" даёт метрику с именем измерения, любое другое поле -
 *    "<измерение>_<поле>"
 *  - float передаётся как есть, integer расширяется до double,
 *    boolean даёт 1.0/0.0, unsigned и string пропускаются
 *  - в имени и ключах меток все символы вне [a-zA-Z0-9_] заменяются на '_',
 *    значения меток копируются без изменений
 *
 * Класс не хранит состояния и безопасен для вызова из любых потоков.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../include/sample.hpp"
#include "ifx/LineProtocol.hpp"

class SampleTranslator {
 public:
  /// Поле, значение которого экспортируется под именем самого измерения
  static constexpr std::string_view kValueField = "value";

  /**
   * @brief Заменяет каждый символ вне [a-zA-Z0-9_] на '_'
   * @note Идемпотентна: sanitize(sanitize(x)) == sanitize(x)
   */
  static std::string sanitize(std::string_view raw);

  /**
   * @brief Вычисляет fingerprint для имени и меток
   *
   * @param rawName Имя до санитизации ("measurement" или "measurement_field")
   * @param labels Метки с уже санитизированными ключами
   * @return Строка вида ["cpu" "host" "a"]: имя, затем пары ключ-значение в
   *         лексикографическом порядке ключей, каждая в кавычках
   */
  static std::string fingerprint(
      const std::string& rawName,
      const std::map<std::string, std::string>& labels);

  /**
   * @brief Приводит значение поля к double
   * @return std::nullopt для неподдерживаемых типов (unsigned, string)
   */
  static std::optional<double> coerce(
      const ifx::lineprotocol::FieldValue& value);

  /// Все Sample одной точки; точка без подходящих полей даёт пустой вектор
  static std::vector<Sample> translate(const ifx::lineprotocol::Point& point);

  /// Строка в кавычках с экранированием управляющих символов
  static std::string quote(std::string_view raw);
};
