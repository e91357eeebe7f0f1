/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора структуры JSON-конфигурации
 */
#include "../include/configvalidator.hpp"

#include <algorithm>
#include <vector>

#include "ifx/ilogger.hpp"

using namespace std;

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Root must be an object");
  }

  if (config.contains("defaults")) {
    if (!config["defaults"].is_object()) {
      throw runtime_error("ConfigValidator: Section 'defaults' must be an object");
    }
    validateSection(config["defaults"]);
  }

  if (config.contains("environments")) {
    const auto &environments = config["environments"];
    if (!environments.is_object()) {
      throw runtime_error(
          "ConfigValidator: Section 'environments' must be an object");
    }
    for (const auto &[name, env] : environments.items()) {
      if (!env.is_object()) {
        throw runtime_error("ConfigValidator: Environment '" + name +
                            "' must be an object");
      }
      validateSection(env);
    }
  }

  return true;
}

bool ConfigValidator::validateSection(const nlohmann::json &section) const {
  for (const char *name : {"web", "udp", "influxdb", "exporter"}) {
    requireObject(section, name);
  }

  requireString(section, "web", "listen_address");
  requireString(section, "web", "telemetry_path");
  requireString(section, "udp", "bind_address");
  requireString(section, "influxdb", "sample_expiry");

  if (section.contains("exporter") &&
      section["exporter"].contains("timestamps") &&
      !section["exporter"]["timestamps"].is_boolean()) {
    throw runtime_error(
        "ConfigValidator: 'exporter.timestamps' must be a boolean");
  }

  if (section.contains("logging")) {
    validateLogging(section["logging"]);
  }
  return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "file"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level")) {
      if (!logger["level"].is_string()) {
        throw runtime_error("ConfigValidator: Invalid log level type");
      }
      try {
        ifx::stringToLogLevel(logger["level"].get<string>());
      } catch (const invalid_argument &e) {
        throw runtime_error(string("ConfigValidator: ") + e.what());
      }
    }

    if (type == "file" &&
        (!logger.contains("file") || !logger["file"].is_string())) {
      throw runtime_error("ConfigValidator: File logger missing file path");
    }
  }
  return true;
}

void ConfigValidator::requireObject(const nlohmann::json &section,
                                    const char *name) const {
  if (section.contains(name) && !section[name].is_object()) {
    throw runtime_error(string("ConfigValidator: Section '") + name +
                        "' must be an object");
  }
}

void ConfigValidator::requireString(const nlohmann::json &object,
                                    const char *section,
                                    const char *key) const {
  if (!object.contains(section)) return;
  const auto &sub = object[section];
  if (sub.contains(key) && !sub[key].is_string()) {
    throw runtime_error(string("ConfigValidator: '") + section + "." + key +
                        "' must be a string");
  }
}
