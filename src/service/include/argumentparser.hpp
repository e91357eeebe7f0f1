/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки экспортера
 *
 * @details Поддерживаются формы "--flag=value" и "--flag value".
 * Флаги, соответствующие ключам конфигурации, превращаются в
 * переопределения (ParsedArgs::overrides) и применяются после файла.
 */

#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct ParsedArgs {
  std::optional<std::string> config_path;
  std::string environment = "production";
  std::map<std::string, std::string> overrides;  ///< "web.listen_address" -> ":9122"
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
};

class ArgumentParser {
 public:
  /// @throw std::invalid_argument Для неизвестного флага или неверного значения
  ParsedArgs parse(int argc, char **argv);

  /// Текст справки
  static std::string helpText();

 private:
  static const std::vector<std::string> validLogTypes;

  std::string takeValue(const std::string &name, const std::string &arg,
                        int &i, int argc, char **argv) const;
  void parseOverride(const std::string &value, ParsedArgs &args) const;
  void parseLogTypes(const std::string &value, ParsedArgs &args) const;
};
