#include "ifx/MetricsCollector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ifx {

namespace {

bool isNameStart(char c, bool allowColon) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         (allowColon && c == ':');
}

bool isNameChar(char c, bool allowColon) {
  return isNameStart(c, allowColon) || (c >= '0' && c <= '9');
}

std::string escapeLabelValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string escapeHelp(const std::string& help) {
  std::string out;
  out.reserve(help.size());
  for (char c : help) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace

std::string metricTypeName(MetricType type) {
  switch (type) {
    case MetricType::Counter:
      return "counter";
    case MetricType::Gauge:
      return "gauge";
    case MetricType::Untyped:
      return "untyped";
  }
  return "untyped";
}

void Counter::increment(double value) {
  if (value < 0) {
    throw std::invalid_argument("Counter cannot decrease");
  }
  double current = value_.load(std::memory_order_relaxed);
  while (!value_.compare_exchange_weak(current, current + value,
                                       std::memory_order_relaxed)) {
  }
}

bool isValidMetricName(const std::string& name) {
  if (name.empty() || !isNameStart(name[0], true)) return false;
  return std::all_of(name.begin(), name.end(),
                     [](char c) { return isNameChar(c, true); });
}

bool isValidLabelName(const std::string& name) {
  if (name.empty() || !isNameStart(name[0], false)) return false;
  if (name.compare(0, 2, "__") == 0) return false;
  return std::all_of(name.begin(), name.end(),
                     [](char c) { return isNameChar(c, false); });
}

void MetricsCollector::checkName(const std::string& name) const {
  if (!isValidMetricName(name)) {
    throw std::runtime_error("Invalid metric name: '" + name + "'");
  }
  if (counters_.count(name) || gauges_.count(name)) {
    throw std::runtime_error("Metric already registered: " + name);
  }
}

std::shared_ptr<Counter> MetricsCollector::registerCounter(
    const std::string& name, const std::string& help) {
  std::lock_guard lock(mutex_);
  checkName(name);
  auto counter = std::make_shared<Counter>();
  counters_.emplace(name, std::make_pair(help, counter));
  return counter;
}

std::shared_ptr<Gauge> MetricsCollector::registerGauge(
    const std::string& name, const std::string& help) {
  std::lock_guard lock(mutex_);
  checkName(name);
  auto gauge = std::make_shared<Gauge>();
  gauges_.emplace(name, std::make_pair(help, gauge));
  return gauge;
}

void MetricsCollector::addCollector(Collector collector) {
  std::lock_guard lock(mutex_);
  collectors_.push_back(std::move(collector));
}

void MetricsCollector::setErrorHandler(ErrorHandler handler) {
  std::lock_guard lock(mutex_);
  onError_ = std::move(handler);
}

bool MetricsCollector::isRegistered(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return counters_.count(name) > 0 || gauges_.count(name) > 0;
}

void MetricsCollector::reportError(const std::string& message) const {
  ErrorHandler handler;
  {
    std::lock_guard lock(mutex_);
    handler = onError_;
  }
  if (handler) handler(message);
}

std::vector<MetricFamily> MetricsCollector::collect() const {
  std::map<std::string, MetricFamily> families;
  std::vector<Collector> collectors;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [name, entry] : counters_) {
      MetricFamily& family = families[name];
      family.name = name;
      family.help = entry.first;
      family.type = MetricType::Counter;
      family.metrics.emplace_back();
      family.metrics.back().value = entry.second->value();
    }
    for (const auto& [name, entry] : gauges_) {
      MetricFamily& family = families[name];
      family.name = name;
      family.help = entry.first;
      family.type = MetricType::Gauge;
      family.metrics.emplace_back();
      family.metrics.back().value = entry.second->value();
    }
    collectors = collectors_;
  }
  std::set<std::string> registered;
  for (const auto& [name, family] : families) registered.insert(name);

  // Коллекторы вызываются без блокировки: они могут читать реестр сами
  std::vector<MetricFamily> dynamic;
  for (const auto& collector : collectors) {
    collector(dynamic);
  }

  std::map<std::string, std::set<std::map<std::string, std::string>>> seen;
  for (auto& family : dynamic) {
    if (!isValidMetricName(family.name)) {
      reportError("skipping metric family with invalid name '" + family.name +
                  "'");
      continue;
    }
    if (registered.count(family.name)) {
      reportError("metric family '" + family.name +
                  "' collides with a registered metric");
      continue;
    }

    auto [it, inserted] = families.try_emplace(family.name);
    MetricFamily& target = it->second;
    if (inserted) {
      target.name = family.name;
      target.help = family.help;
      target.type = family.type;
    } else if (target.type != family.type) {
      reportError("metric family '" + family.name +
                  "' collected with conflicting types");
      continue;
    }

    for (auto& point : family.metrics) {
      const auto badLabel =
          std::find_if(point.labels.begin(), point.labels.end(),
                       [](const auto& kv) { return !isValidLabelName(kv.first); });
      if (badLabel != point.labels.end()) {
        reportError("metric '" + family.name + "' has invalid label name '" +
                    badLabel->first + "'");
        continue;
      }
      if (!seen[family.name].insert(point.labels).second) {
        reportError("metric '" + family.name +
                    "' was collected twice with the same labels");
        continue;
      }
      target.metrics.push_back(std::move(point));
    }
  }

  std::vector<MetricFamily> result;
  result.reserve(families.size());
  for (auto& [name, family] : families) {
    if (family.metrics.empty()) continue;
    std::sort(family.metrics.begin(), family.metrics.end(),
              [](const MetricPoint& a, const MetricPoint& b) {
                return a.labels < b.labels;
              });
    result.push_back(std::move(family));
  }
  return result;
}

std::string MetricsCollector::exportPrometheus() const {
  return render(collect());
}

std::string MetricsCollector::render(
    const std::vector<MetricFamily>& families) {
  std::ostringstream ss;
  for (const auto& family : families) {
    if (!family.help.empty()) {
      ss << "# HELP " << family.name << " " << escapeHelp(family.help) << "\n";
    }
    ss << "# TYPE " << family.name << " " << metricTypeName(family.type)
       << "\n";

    for (const auto& point : family.metrics) {
      ss << family.name;
      if (!point.labels.empty()) {
        ss << "{";
        bool first = true;
        for (const auto& [key, value] : point.labels) {
          if (!first) ss << ",";
          first = false;
          ss << key << "=\"" << escapeLabelValue(value) << "\"";
        }
        ss << "}";
      }
      ss << " " << formatValue(point.value);
      if (point.timestampMs) {
        ss << " " << *point.timestampMs;
      }
      ss << "\n";
    }
  }
  return ss.str();
}

std::string MetricsCollector::formatValue(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

  // Кратчайшее представление, которое читается обратно без потерь;
  // экспонента используется при порядке < -4 или >= 6, как в Go 'g'
  char buf[40];
  int digits = 1;
  for (; digits < 17; ++digits) {
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
  const char* e = std::strchr(buf, 'e');
  const int exponent = e ? std::atoi(e + 1) : 0;
  if (exponent < -4 || exponent >= 6) {
    return buf;
  }
  std::snprintf(buf, sizeof(buf), "%.*f", std::max(digits - 1 - exponent, 0),
                value);
  return buf;
}

}  // namespace ifx
