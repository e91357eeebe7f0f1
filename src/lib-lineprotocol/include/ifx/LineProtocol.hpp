/**
 * @file LineProtocol.hpp
 * @brief Разбор текстового протокола InfluxDB (line protocol)
 *
 * @date October 2026
 * @version 1.0
 * @license MIT
 *
 * @details Формат строки:
 * @code
 * measurement[,tag=value...] field=value[,field=value...] [timestamp]
 * @endcode
 * Запятые и пробелы в имени измерения, а также запятые, пробелы и знаки
 * равенства в ключах и значениях тегов и в ключах полей экранируются
 * обратной косой чертой. Строки, начинающиеся с '#', и пустые строки
 * пропускаются.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ifx::lineprotocol {

/// Значение поля: float, integer (42i), unsigned (42u), boolean, string
using FieldValue = std::variant<double, int64_t, uint64_t, bool, std::string>;

/**
 * @struct Point
 * @brief Одна разобранная точка
 */
struct Point {
  std::string measurement;
  std::map<std::string, std::string> tags;  ///< Упорядочены по ключу
  std::map<std::string, FieldValue> fields;
  std::chrono::system_clock::time_point timestamp;
};

/// Единица измерения временных меток во входных данных
enum class Precision {
  Nanoseconds,
  Microseconds,
  Milliseconds,
  Seconds,
  Minutes,
  Hours
};

/**
 * @brief Разбирает параметр precision запроса записи
 *
 * @details "", "n", "ns" - наносекунды; "u", "us", "µ" - микросекунды;
 * "ms", "s", "m", "h". Неизвестное значение трактуется как наносекунды.
 */
Precision parsePrecision(std::string_view value);

/// Множитель перевода единицы точности в наносекунды
int64_t precisionMultiplier(Precision precision);

/**
 * @class ParseError
 * @brief Ошибка разбора одной или нескольких строк
 *
 * @details what() содержит по одной записи вида
 * "unable to parse '<line>': <reason>" на каждую ошибочную строку,
 * разделённых '\n'.
 */
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * @brief Разбирает буфер в список точек
 *
 * @param buf Полезная нагрузка (одна или несколько строк)
 * @param now Время для точек без временной метки (усекается до precision)
 * @param precision Единица временных меток в buf
 * @return Точки в порядке следования строк
 * @throw ParseError Если хотя бы одна строка некорректна; в этом случае
 *                   не возвращается ни одной точки
 */
std::vector<Point> parsePoints(std::string_view buf,
                               std::chrono::system_clock::time_point now,
                               Precision precision = Precision::Nanoseconds);

}  // namespace ifx::lineprotocol
