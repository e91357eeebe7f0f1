/**
 * @file exporterconfig.cpp
 * @brief Разбор типизированной конфигурации экспортера
 */

#include "../include/exporterconfig.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <unordered_map>

using namespace std;

namespace {

const nlohmann::json &sectionOf(const nlohmann::json &root, const char *name) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!root.is_object()) return empty;
  auto it = root.find(name);
  return it == root.end() ? empty : *it;
}

uint16_t parsePort(const string &text, const string &address) {
  if (text.empty() || text.size() > 5) {
    throw invalid_argument("invalid port in address '" + address + "'");
  }
  unsigned long port = 0;
  for (char c : text) {
    if (!isdigit(static_cast<unsigned char>(c))) {
      throw invalid_argument("invalid port in address '" + address + "'");
    }
    port = port * 10 + static_cast<unsigned long>(c - '0');
  }
  if (port == 0 || port > 65535) {
    throw invalid_argument("port out of range in address '" + address + "'");
  }
  return static_cast<uint16_t>(port);
}

}  // namespace

string ListenAddress::toString() const {
  const string p = to_string(port);
  if (host.find(':') != string::npos) return "[" + host + "]:" + p;
  return host + ":" + p;
}

ListenAddress parseListenAddress(const string &address) {
  ListenAddress result;
  string portText;

  if (!address.empty() && address.front() == '[') {
    const size_t close = address.find("]:");
    if (close == string::npos) {
      throw invalid_argument("missing port in address '" + address + "'");
    }
    result.host = address.substr(1, close - 1);
    portText = address.substr(close + 2);
  } else {
    const size_t colon = address.rfind(':');
    if (colon == string::npos) {
      throw invalid_argument("missing port in address '" + address + "'");
    }
    result.host = address.substr(0, colon);
    if (result.host.find(':') != string::npos) {
      throw invalid_argument("too many colons in address '" + address + "'");
    }
    portText = address.substr(colon + 1);
  }

  result.port = parsePort(portText, address);
  return result;
}

chrono::nanoseconds parseDuration(const string &text) {
  static const unordered_map<string, long double> units = {
      {"ns", 1.0L},
      {"us", 1e3L},
      {"\xC2\xB5s", 1e3L},  // µs (U+00B5)
      {"\xCE\xBCs", 1e3L},  // μs (U+03BC)
      {"ms", 1e6L},
      {"s", 1e9L},
      {"m", 60e9L},
      {"h", 3600e9L},
  };

  const auto fail = [&text](const string &reason) {
    return invalid_argument("invalid duration '" + text + "': " + reason);
  };

  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }
  if (text.substr(pos) == "0") return chrono::nanoseconds::zero();
  if (pos == text.size()) throw fail("empty");

  long double total = 0;
  while (pos < text.size()) {
    const size_t numberStart = pos;
    while (pos < text.size() && isdigit(static_cast<unsigned char>(text[pos])))
      ++pos;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      while (pos < text.size() &&
             isdigit(static_cast<unsigned char>(text[pos])))
        ++pos;
    }
    const string number = text.substr(numberStart, pos - numberStart);
    if (number.empty() || number == ".") throw fail("expected number");

    const size_t unitStart = pos;
    while (pos < text.size() && text[pos] != '.' &&
           !isdigit(static_cast<unsigned char>(text[pos])))
      ++pos;
    const string unit = text.substr(unitStart, pos - unitStart);
    if (unit.empty()) throw fail("missing unit");
    const auto it = units.find(unit);
    if (it == units.end()) throw fail("unknown unit '" + unit + "'");

    total += stold(number) * it->second;
    if (total > static_cast<long double>(numeric_limits<int64_t>::max())) {
      throw fail("overflow");
    }
  }

  const auto ns = static_cast<int64_t>(total);
  return chrono::nanoseconds(negative ? -ns : ns);
}

ExporterConfig ExporterConfig::fromJson(const nlohmann::json &section) {
  ExporterConfig config;

  const auto &web = sectionOf(section, "web");
  if (web.contains("listen_address")) {
    config.webListenAddress =
        parseListenAddress(web["listen_address"].get<string>());
  }
  config.telemetryPath = web.value("telemetry_path", config.telemetryPath);
  if (config.telemetryPath.empty() || config.telemetryPath.front() != '/') {
    throw invalid_argument("telemetry path must start with '/': '" +
                           config.telemetryPath + "'");
  }

  const auto &udp = sectionOf(section, "udp");
  if (udp.contains("bind_address")) {
    config.udpBindAddress = parseListenAddress(udp["bind_address"].get<string>());
  }

  const auto &influxdb = sectionOf(section, "influxdb");
  if (influxdb.contains("sample_expiry")) {
    config.sampleExpiry = parseDuration(influxdb["sample_expiry"].get<string>());
  }
  if (config.sampleExpiry <= chrono::nanoseconds::zero()) {
    throw invalid_argument("sample expiry must be positive");
  }

  config.exportTimestamps =
      sectionOf(section, "exporter").value("timestamps", false);

  if (section.is_object() && section.contains("logging")) {
    for (const auto &entry : section["logging"]) {
      LoggerConfig logger;
      logger.type = entry.value("type", logger.type);
      logger.level = entry.value("level", logger.level);
      logger.file = entry.value("file", logger.file);
      config.logging.push_back(std::move(logger));
    }
  }

  return config;
}

nlohmann::json ExporterConfig::defaultsJson() {
  return {
      {"web", {{"listen_address", ":9122"}, {"telemetry_path", "/metrics"}}},
      {"udp", {{"bind_address", ":9122"}}},
      {"influxdb", {{"sample_expiry", "5m"}}},
      {"exporter", {{"timestamps", false}}},
      {"logging", nlohmann::json::array({{{"type", "console"},
                                           {"level", "info"}}})},
  };
}
