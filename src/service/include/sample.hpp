/**
 * @file sample.hpp
 * @brief Единица хранимых данных экспортера
 */

#pragma once

#include <chrono>
#include <map>
#include <string>

/**
 * @struct Sample
 * @brief Именованное значение с метками и временем события
 *
 * @details fingerprint однозначно определяется парой (имя, метки) и служит
 * ключом в SampleStore: более поздний Sample с тем же fingerprint заменяет
 * предыдущий.
 */
struct Sample {
  std::string fingerprint;
  std::string name;  ///< Только [a-zA-Z0-9_]
  std::map<std::string, std::string> labels;
  double value = 0.0;
  std::chrono::system_clock::time_point timestamp;  ///< Время точки, не приёма
};
