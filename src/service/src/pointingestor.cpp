#include "../include/pointingestor.hpp"

#include <chrono>

#include "../include/sampletranslator.hpp"

PointIngestor::PointIngestor(ExporterContext& ctx, SampleStore& store)
    : ctx_(ctx), store_(store) {}

size_t PointIngestor::ingest(std::string_view payload,
                             ifx::lineprotocol::Precision precision) {
  const auto points = ifx::lineprotocol::parsePoints(
      payload, std::chrono::system_clock::now(), precision);

  size_t forwarded = 0;
  for (const auto& point : points) {
    for (auto& sample : SampleTranslator::translate(point)) {
      ctx_.logger.debug("Sample " + sample.fingerprint + " = " +
                        ifx::MetricsCollector::formatValue(sample.value));
      if (!store_.submit(std::move(sample))) {
        ctx_.logger.warning("PointIngestor: store is stopped, sample dropped");
        continue;
      }
      ++forwarded;
    }
  }
  return forwarded;
}
