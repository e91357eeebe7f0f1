#include "../include/exportercontext.hpp"

#include <chrono>

ExporterContext::ExporterContext(ifx::ILogger& log) : logger(log) {
  lastPush = registry.registerGauge(
      kLastPushMetric,
      "Unix timestamp of the last received influxdb metrics push in seconds.");
  udpParseErrors = registry.registerCounter(
      kUdpParseErrorsMetric, "Current total udp parse errors.");
  registry.setErrorHandler(
      [this](const std::string& message) { logger.warning(message); });
}

void ExporterContext::markPush() {
  using namespace std::chrono;
  const auto now = system_clock::now().time_since_epoch();
  lastPush->set(duration_cast<duration<double>>(now).count());
}
