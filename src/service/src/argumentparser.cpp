/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <sstream>

#include "../include/exporterconfig.hpp"
#include "ifx/ilogger.hpp"

using namespace std;

const vector<string> ArgumentParser::validLogTypes = {"console", "file"};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];
    const string name = arg.substr(0, arg.find('='));

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--timestamps") {
      args.overrides["exporter.timestamps"] = "true";
    } else if (name == "--override") {
      parseOverride(takeValue(name, arg, i, argc, argv), args);
    } else if (name == "--config-file") {
      args.config_path = takeValue(name, arg, i, argc, argv);
    } else if (name == "--environment") {
      args.environment = takeValue(name, arg, i, argc, argv);
    } else if (name == "--web.listen-address") {
      const string value = takeValue(name, arg, i, argc, argv);
      parseListenAddress(value);
      args.overrides["web.listen_address"] = value;
    } else if (name == "--web.telemetry-path") {
      const string value = takeValue(name, arg, i, argc, argv);
      if (value.empty() || value.front() != '/') {
        throw invalid_argument(
            "ArgumentParser: telemetry path must start with '/': " + value);
      }
      args.overrides["web.telemetry_path"] = value;
    } else if (name == "--udp.bind-address") {
      const string value = takeValue(name, arg, i, argc, argv);
      parseListenAddress(value);
      args.overrides["udp.bind_address"] = value;
    } else if (name == "--influxdb.sample-expiry") {
      const string value = takeValue(name, arg, i, argc, argv);
      if (parseDuration(value) <= chrono::nanoseconds::zero()) {
        throw invalid_argument(
            "ArgumentParser: sample expiry must be positive: " + value);
      }
      args.overrides["influxdb.sample_expiry"] = value;
    } else if (name == "--log-type") {
      parseLogTypes(takeValue(name, arg, i, argc, argv), args);
      args.use_cli_logging = true;
    } else if (name == "--log-level") {
      const string value = takeValue(name, arg, i, argc, argv);
      ifx::stringToLogLevel(value);
      args.log_level = value;
      args.use_cli_logging = true;
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  return args;
}

string ArgumentParser::takeValue(const string &name, const string &arg, int &i,
                                 int argc, char **argv) const {
  const size_t eqPos = arg.find('=');
  if (eqPos != string::npos) {
    return arg.substr(eqPos + 1);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw invalid_argument("ArgumentParser: " + name + " requires a value");
}

void ArgumentParser::parseOverride(const string &value,
                                   ParsedArgs &args) const {
  const size_t colonPos = value.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use --override=key.path:value");
  }
  args.overrides[value.substr(0, colonPos)] = value.substr(colonPos + 1);
}

void ArgumentParser::parseLogTypes(const string &value,
                                   ParsedArgs &args) const {
  stringstream ss(value);
  string type;
  while (getline(ss, type, ',')) {
    if (type.empty()) continue;
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
    args.logger_types.push_back(type);
  }
}

string ArgumentParser::helpText() {
  return "InfluxDB Exporter\n\n"
         "Usage:\n"
         " influxdb_exporter [options]\n\n"
         "Options:\n"
         " --help, -h                       Show this help message\n"
         " --version, -v                    Show version info\n"
         " --config-file=FILE               Configuration file path\n"
         " --environment=NAME               Configuration environment "
         "(default: production)\n"
         " --web.listen-address=ADDR        Address on which to expose metrics "
         "and web interface (default: :9122)\n"
         " --web.telemetry-path=PATH        Path under which to expose metrics "
         "(default: /metrics)\n"
         " --udp.bind-address=ADDR          Address on which to listen for udp "
         "packets (default: :9122)\n"
         " --influxdb.sample-expiry=DUR     How long a sample is valid for "
         "(default: 5m)\n"
         " --timestamps                     Export timestamps of samples\n"
         " --override=KEY.PATH:VAL          Override config parameter\n"
         " --log-type=TYPES                 Logger types (console,file)\n"
         " --log-level=LEVEL                Logging level "
         "[debug|info|warning|error|critical]\n";
}
