#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <string>

#include "../include/exportercontext.hpp"
#include "../include/pointingestor.hpp"
#include "../include/samplecollector.hpp"
#include "../include/samplestore.hpp"
#include "testlogger.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::Not;

class ExpositionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.start();
    SampleCollector::attach(ctx_.registry, store_, false);
  }

  // Временные метки тестовых точек - 1 с от эпохи, поэтому окно
  // свежести охватывает всё время с эпохи
  static std::chrono::nanoseconds wideExpiry() {
    return std::chrono::hours(24 * 365 * 100);
  }

  std::string scrape() {
    store_.flush();
    return ctx_.registry.exportPrometheus();
  }

  MemoryLogger logger_;
  ExporterContext ctx_{logger_};
  SampleStore store_{wideExpiry(), logger_};
  PointIngestor ingestor_{ctx_, store_};
};

TEST_F(ExpositionTest, ContextRegistersOwnMetrics) {
  EXPECT_TRUE(ctx_.registry.isRegistered("influxdb_last_push_timestamp_seconds"));
  EXPECT_TRUE(ctx_.registry.isRegistered("influxdb_udp_parse_errors_total"));

  const std::string metrics = scrape();
  EXPECT_THAT(metrics,
              HasSubstr("# HELP influxdb_last_push_timestamp_seconds Unix "
                        "timestamp of the last received influxdb metrics push "
                        "in seconds.\n"
                        "# TYPE influxdb_last_push_timestamp_seconds gauge\n"
                        "influxdb_last_push_timestamp_seconds 0\n"));
  EXPECT_THAT(metrics, HasSubstr("influxdb_udp_parse_errors_total 0\n"));
}

TEST_F(ExpositionTest, MarkPushStoresCurrentTime) {
  const double before = std::chrono::duration<double>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  ctx_.markPush();
  const double after = std::chrono::duration<double>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  EXPECT_GE(ctx_.lastPush->value(), before);
  EXPECT_LE(ctx_.lastPush->value(), after);
}

TEST_F(ExpositionTest, SingleValuePoint) {
  EXPECT_EQ(ingestor_.ingest("cpu,host=a value=42 1000000000"), 1u);
  store_.flush();

  const auto snapshot = store_.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0]->name, "cpu");
  EXPECT_EQ(snapshot[0]->value, 42.0);
  EXPECT_EQ(snapshot[0]->timestamp, std::chrono::system_clock::time_point(1s));

  const std::string metrics = scrape();
  EXPECT_THAT(metrics, HasSubstr("# HELP cpu InfluxDB Metric\n"
                                 "# TYPE cpu untyped\n"
                                 "cpu{host=\"a\"} 42\n"));
  EXPECT_THAT(metrics, HasSubstr("influxdb_last_push_timestamp_seconds"));
}

TEST_F(ExpositionTest, FieldSuffixes) {
  EXPECT_EQ(ingestor_.ingest("cpu,host=a idle=10,used=5 1000000000"), 2u);
  const std::string metrics = scrape();
  EXPECT_THAT(metrics, HasSubstr("cpu_idle{host=\"a\"} 10\n"));
  EXPECT_THAT(metrics, HasSubstr("cpu_used{host=\"a\"} 5\n"));
  EXPECT_THAT(metrics, Not(HasSubstr("\ncpu{")));
}

TEST_F(ExpositionTest, SanitizedNames) {
  ingestor_.ingest("my.metric,host-name=web-1 value=1 1000000000");
  EXPECT_THAT(scrape(), HasSubstr("my_metric{host_name=\"web-1\"} 1\n"));
}

TEST_F(ExpositionTest, SeriesOfOneMetricShareFamily) {
  ingestor_.ingest(
      "cpu,host=b value=2 1000000000\n"
      "cpu,host=a value=1 1000000000\n");
  EXPECT_THAT(scrape(), HasSubstr("# TYPE cpu untyped\n"
                                  "cpu{host=\"a\"} 1\n"
                                  "cpu{host=\"b\"} 2\n"));
}

TEST_F(ExpositionTest, ParseErrorForwardsNothing) {
  EXPECT_THROW(ingestor_.ingest("cpu value=1 1000000000\ncpu value="),
               ifx::lineprotocol::ParseError);
  store_.flush();
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(ExpositionTest, PrecisionIsApplied) {
  ingestor_.ingest("cpu value=1 2", ifx::lineprotocol::Precision::Seconds);
  store_.flush();
  const auto snapshot = store_.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0]->timestamp, std::chrono::system_clock::time_point(2s));
}

TEST_F(ExpositionTest, ExpiredSamplesAreNotExposed) {
  MemoryLogger logger;
  ExporterContext ctx(logger);
  SampleStore store(5min, logger);
  SampleCollector::attach(ctx.registry, store, false);
  PointIngestor ingestor(ctx, store);
  store.start();

  // 1 с от эпохи - давно за пределами окна в 5 минут
  ingestor.ingest("stale value=1 1000000000");
  ingestor.ingest("fresh value=2");
  store.flush();

  const std::string metrics = ctx.registry.exportPrometheus();
  EXPECT_THAT(metrics, Not(HasSubstr("stale")));
  EXPECT_THAT(metrics, HasSubstr("fresh 2\n"));
}

TEST_F(ExpositionTest, TimestampsAreExportedWhenEnabled) {
  MemoryLogger logger;
  ExporterContext ctx(logger);
  SampleStore store(wideExpiry(), logger);
  SampleCollector::attach(ctx.registry, store, true);
  PointIngestor ingestor(ctx, store);
  store.start();

  ingestor.ingest("cpu,host=a value=42 1500000000");
  store.flush();
  EXPECT_THAT(ctx.registry.exportPrometheus(),
              HasSubstr("cpu{host=\"a\"} 42 1500\n"));
}

TEST_F(ExpositionTest, InvalidMetricNamesAreSkippedWithWarning) {
  ingestor_.ingest(
      "1cpu value=1 1000000000\n"
      "influxdb_udp_parse_errors_total value=5 1000000000\n"
      "ok value=3 1000000000\n");

  const std::string metrics = scrape();
  EXPECT_THAT(metrics, Not(HasSubstr("1cpu")));
  EXPECT_THAT(metrics, HasSubstr("influxdb_udp_parse_errors_total 0\n"));
  EXPECT_THAT(metrics, HasSubstr("ok 3\n"));
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_WARNING, "1cpu"));
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_WARNING,
                               "influxdb_udp_parse_errors_total"));
}

TEST_F(ExpositionTest, SanitizedDuplicatesAreReportedOnce) {
  // Разные исходные имена дают одно и то же имя после замены символов
  ingestor_.ingest(
      "a.b value=1 1000000000\n"
      "a-b value=2 1000000000\n");
  store_.flush();
  EXPECT_EQ(store_.size(), 2u);

  const std::string metrics = scrape();
  EXPECT_THAT(metrics, HasSubstr("# TYPE a_b untyped\n"));
  EXPECT_EQ(logger_.count(ifx::LogLevel::LOG_WARNING), 1u);
}

TEST_F(ExpositionTest, IngestLogsSamplesAtDebug) {
  ingestor_.ingest("cpu,host=a value=42 1000000000");
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_DEBUG,
                               R"(["cpu" "host" "a"] = 42)"));
}
