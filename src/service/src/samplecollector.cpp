#include "../include/samplecollector.hpp"

#include <chrono>
#include <map>
#include <string>

SampleCollector::SampleCollector(const SampleStore& store,
                                 bool exportTimestamps)
    : store_(store), exportTimestamps_(exportTimestamps) {}

void SampleCollector::operator()(std::vector<ifx::MetricFamily>& out) const {
  std::map<std::string, ifx::MetricFamily> families;

  for (const auto& sample : store_.snapshot()) {
    auto& family = families[sample->name];
    if (family.name.empty()) {
      family.name = sample->name;
      family.help = kHelp;
      family.type = ifx::MetricType::Untyped;
    }

    ifx::MetricPoint point;
    point.labels = sample->labels;
    point.value = sample->value;
    if (exportTimestamps_) {
      point.timestampMs =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              sample->timestamp.time_since_epoch())
              .count();
    }
    family.metrics.push_back(std::move(point));
  }

  for (auto& [name, family] : families) {
    out.push_back(std::move(family));
  }
}

void SampleCollector::attach(ifx::MetricsCollector& registry,
                             const SampleStore& store, bool exportTimestamps) {
  registry.addCollector(SampleCollector(store, exportTimestamps));
}
