#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ifx/MetricsCollector.hpp"

using namespace ifx;
using ::testing::HasSubstr;
using ::testing::Not;

class MetricsCollectorTest : public ::testing::Test {
 protected:
  MetricsCollector collector_;
};

// 1. Тест базовой функциональности счетчиков и датчиков
TEST_F(MetricsCollectorTest, CounterAndGaugeBasics) {
  auto requests = collector_.registerCounter("requests_total", "Total requests");
  auto last = collector_.registerGauge("last_seen_seconds", "Last seen");

  requests->increment();
  requests->increment(4.5);
  last->set(1700000000.25);

  const std::string metrics = collector_.exportPrometheus();
  EXPECT_THAT(metrics, HasSubstr("# HELP requests_total Total requests\n"
                                 "# TYPE requests_total counter\n"
                                 "requests_total 5.5\n"));
  EXPECT_THAT(metrics, HasSubstr("# TYPE last_seen_seconds gauge\n"
                                 "last_seen_seconds 1.70000000025e+09\n"));
}

// 2. Тест обработки ошибок регистрации
TEST_F(MetricsCollectorTest, ErrorHandling) {
  collector_.registerCounter("errors_total");
  EXPECT_THROW(collector_.registerCounter("errors_total"), std::runtime_error);
  EXPECT_THROW(collector_.registerGauge("errors_total"), std::runtime_error);
  EXPECT_THROW(collector_.registerGauge(""), std::runtime_error);
  EXPECT_THROW(collector_.registerGauge("1bad"), std::runtime_error);
  EXPECT_THROW(collector_.registerGauge("bad-name"), std::runtime_error);
  EXPECT_TRUE(collector_.isRegistered("errors_total"));
  EXPECT_FALSE(collector_.isRegistered("unknown"));
}

TEST_F(MetricsCollectorTest, CounterRejectsNegativeIncrement) {
  auto counter = collector_.registerCounter("monotonic_total");
  EXPECT_THROW(counter->increment(-1), std::invalid_argument);
  EXPECT_EQ(counter->value(), 0.0);
}

// 3. Тест многопоточной работы
TEST_F(MetricsCollectorTest, ConcurrentAccess) {
  constexpr int THREADS = 4;
  constexpr int ITERATIONS = 10000;

  auto counter = collector_.registerCounter("concurrent_total");

  std::vector<std::thread> threads;
  for (int i = 0; i < THREADS; ++i) {
    threads.emplace_back([&counter] {
      for (int j = 0; j < ITERATIONS; ++j) counter->increment();
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(counter->value(), THREADS * ITERATIONS);
  EXPECT_THAT(collector_.exportPrometheus(),
              HasSubstr("concurrent_total " +
                        std::to_string(THREADS * ITERATIONS) + "\n"));
}

// 4. Динамические семейства
TEST_F(MetricsCollectorTest, CollectorFamiliesAreMergedAndSorted) {
  collector_.addCollector([](std::vector<MetricFamily>& out) {
    out.push_back({"cpu", "InfluxDB Metric", MetricType::Untyped,
                   {{{{"host", "b"}}, 2.0, std::nullopt},
                    {{{"host", "a"}}, 1.0, std::nullopt}}});
    out.push_back({"cpu", "InfluxDB Metric", MetricType::Untyped,
                   {{{{"host", "c"}}, 3.0, std::nullopt}}});
    out.push_back({"alpha", "", MetricType::Untyped, {{{}, 7.0, 1000}}});
  });

  const auto families = collector_.collect();
  ASSERT_EQ(families.size(), 2u);
  EXPECT_EQ(families[0].name, "alpha");
  EXPECT_EQ(families[1].name, "cpu");
  ASSERT_EQ(families[1].metrics.size(), 3u);
  EXPECT_EQ(families[1].metrics[0].labels.at("host"), "a");
  EXPECT_EQ(families[1].metrics[2].labels.at("host"), "c");

  const std::string text = collector_.exportPrometheus();
  EXPECT_THAT(text, HasSubstr("# HELP cpu InfluxDB Metric\n"
                              "# TYPE cpu untyped\n"
                              "cpu{host=\"a\"} 1\n"
                              "cpu{host=\"b\"} 2\n"
                              "cpu{host=\"c\"} 3\n"));
  EXPECT_THAT(text, HasSubstr("# TYPE alpha untyped\nalpha 7 1000\n"));
  EXPECT_THAT(text, Not(HasSubstr("# HELP alpha")));
}

// 5. Отбрасывание некорректных семейств
TEST_F(MetricsCollectorTest, InvalidFamiliesAreReportedAndSkipped) {
  collector_.registerGauge("taken", "registered");
  std::vector<std::string> errors;
  collector_.setErrorHandler(
      [&errors](const std::string& msg) { errors.push_back(msg); });

  collector_.addCollector([](std::vector<MetricFamily>& out) {
    out.push_back({"9lives", "", MetricType::Untyped, {{{}, 1.0, {}}}});
    out.push_back({"taken", "", MetricType::Untyped, {{{}, 1.0, {}}}});
    out.push_back({"labels", "", MetricType::Untyped,
                   {{{{"__reserved", "x"}}, 1.0, {}},
                    {{{"ok", "x"}}, 2.0, {}},
                    {{{"ok", "x"}}, 3.0, {}}}});
  });

  const std::string text = collector_.exportPrometheus();
  EXPECT_THAT(text, Not(HasSubstr("9lives")));
  EXPECT_THAT(text, HasSubstr("taken 0\n"));
  EXPECT_THAT(text, HasSubstr("labels{ok=\"x\"} 2\n"));
  EXPECT_THAT(text, Not(HasSubstr("labels{ok=\"x\"} 3")));
  EXPECT_EQ(errors.size(), 4u);
}

// 6. Тест формата экспорта
TEST_F(MetricsCollectorTest, EscapesLabelValuesAndHelp) {
  collector_.addCollector([](std::vector<MetricFamily>& out) {
    out.push_back({"esc", "line\\one\nline two", MetricType::Untyped,
                   {{{{"path", "C:\\dir \"q\"\n"}}, 1.0, {}}}});
  });
  EXPECT_EQ(collector_.exportPrometheus(),
            "# HELP esc line\\\\one\\nline two\n"
            "# TYPE esc untyped\n"
            "esc{path=\"C:\\\\dir \\\"q\\\"\\n\"} 1\n");
}

TEST(FormatValueTest, MatchesPrometheusFloatFormatting) {
  EXPECT_EQ(MetricsCollector::formatValue(42), "42");
  EXPECT_EQ(MetricsCollector::formatValue(10), "10");
  EXPECT_EQ(MetricsCollector::formatValue(0), "0");
  EXPECT_EQ(MetricsCollector::formatValue(-10.5), "-10.5");
  EXPECT_EQ(MetricsCollector::formatValue(3.14), "3.14");
  EXPECT_EQ(MetricsCollector::formatValue(0.001), "0.001");
  EXPECT_EQ(MetricsCollector::formatValue(100000), "100000");
  EXPECT_EQ(MetricsCollector::formatValue(1e18), "1e+18");
  EXPECT_EQ(MetricsCollector::formatValue(1234567), "1.234567e+06");
  EXPECT_EQ(MetricsCollector::formatValue(1.5e-5), "1.5e-05");
  EXPECT_EQ(MetricsCollector::formatValue(std::nan("")), "NaN");
  EXPECT_EQ(MetricsCollector::formatValue(
                std::numeric_limits<double>::infinity()),
            "+Inf");
  EXPECT_EQ(MetricsCollector::formatValue(
                -std::numeric_limits<double>::infinity()),
            "-Inf");
}

TEST(NameValidationTest, MetricAndLabelNames) {
  EXPECT_TRUE(isValidMetricName("cpu_usage"));
  EXPECT_TRUE(isValidMetricName("job:rate5m"));
  EXPECT_FALSE(isValidMetricName("0cpu"));
  EXPECT_FALSE(isValidMetricName("cpu-usage"));
  EXPECT_TRUE(isValidLabelName("host_name"));
  EXPECT_FALSE(isValidLabelName("__name__"));
  EXPECT_FALSE(isValidLabelName("job:x"));
  EXPECT_FALSE(isValidLabelName(""));
}
