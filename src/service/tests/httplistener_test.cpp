#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <httplib.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <system_error>
#include <stdexcept>
#include <string>

#include "../include/exportercontext.hpp"
#include "../include/httplistener.hpp"
#include "../include/pointingestor.hpp"
#include "../include/samplecollector.hpp"
#include "../include/samplestore.hpp"
#include "testlogger.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

namespace {

// Отправить сырой запрос на 127.0.0.1, закрыть запись и прочитать ответ
std::string rawExchange(int port, const std::string& request) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::system_error(errno, std::system_category(), "socket() failed");
  }
  timeval timeout{5, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    ::close(fd);
    throw std::system_error(err, std::system_category(), "connect() failed");
  }

  size_t offset = 0;
  while (offset < request.size()) {
    const ssize_t sent =
        ::send(fd, request.data() + offset, request.size() - offset, 0);
    if (sent <= 0) break;
    offset += static_cast<size_t>(sent);
  }
  ::shutdown(fd, SHUT_WR);

  std::string response;
  char buf[4096];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
    response.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return response;
}

bool ipv6LoopbackAvailable() {
  const int fd = ::socket(AF_INET6, SOCK_STREAM, 0);
  if (fd < 0) return false;
  sockaddr_in6 addr{};
  addr.sin6_family = AF_INET6;
  addr.sin6_addr = in6addr_loopback;
  const bool ok =
      ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
  ::close(fd);
  return ok;
}

}  // namespace

class HttpListenerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.start();
    SampleCollector::attach(ctx_.registry, store_, false);
    port_ = listener_.bind("127.0.0.1", 0);
    listener_.start();
  }

  void TearDown() override { listener_.stop(); }

  httplib::Client client() const {
    httplib::Client cli("127.0.0.1", port_);
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(5, 0);
    return cli;
  }

  std::string scrape() {
    store_.flush();
    auto res = client().Get("/metrics");
    EXPECT_TRUE(res);
    return res ? res->body : std::string();
  }

  MemoryLogger logger_;
  ExporterContext ctx_{logger_};
  SampleStore store_{std::chrono::hours(24 * 365 * 100), logger_};
  PointIngestor ingestor_{ctx_, store_};
  HttpListener listener_{ctx_, ingestor_, "/metrics"};
  int port_ = 0;
};

TEST_F(HttpListenerTest, WriteThenScrape) {
  auto res = client().Post("/write", "cpu,host=a value=42 1000000000",
                           "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_TRUE(res->body.empty());

  const std::string metrics = scrape();
  EXPECT_THAT(metrics, HasSubstr("cpu{host=\"a\"} 42\n"));
  EXPECT_THAT(metrics, HasSubstr("influxdb_last_push_timestamp_seconds "));
  EXPECT_GT(ctx_.lastPush->value(), 0.0);
}

TEST_F(HttpListenerTest, MetricsContentType) {
  auto res = client().Get("/metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_THAT(res->get_header_value("Content-Type"),
              StartsWith("text/plain; version=0.0.4"));
}

TEST_F(HttpListenerTest, FieldSuffixesOverHttp) {
  auto res = client().Post("/write", "cpu,host=a idle=10,used=5 1000000000",
                           "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);

  const std::string metrics = scrape();
  EXPECT_THAT(metrics, HasSubstr("cpu_idle{host=\"a\"} 10\n"));
  EXPECT_THAT(metrics, HasSubstr("cpu_used{host=\"a\"} 5\n"));
}

TEST_F(HttpListenerTest, MalformedBodyReturns400AndStillMarksPush) {
  auto res = client().Post("/write", "cpu,host=a", "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_THAT(res->body, StartsWith("error parsing request: unable to parse"));

  store_.flush();
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_GT(ctx_.lastPush->value(), 0.0);
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_DEBUG, "error parsing"));
}

TEST_F(HttpListenerTest, PrecisionParameter) {
  auto res = client().Post("/write?precision=s", "cpu value=1 2", "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);

  store_.flush();
  const auto snapshot = store_.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0]->timestamp, std::chrono::system_clock::time_point(2s));
}

TEST_F(HttpListenerTest, UnknownPrecisionFallsBackToNanoseconds) {
  auto res = client().Post("/write?precision=weeks", "cpu value=1 2000000000",
                           "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);

  store_.flush();
  const auto snapshot = store_.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0]->timestamp, std::chrono::system_clock::time_point(2s));
}

TEST_F(HttpListenerTest, V2WriteEndpoint) {
  auto res = client().Post("/api/v2/write?org=o&bucket=b&precision=ms",
                           "mem value=3 5000", "text/plain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_THAT(scrape(), HasSubstr("mem 3\n"));
}

TEST_F(HttpListenerTest, QueryStub) {
  auto get = client().Get("/query?q=CREATE+DATABASE+x");
  ASSERT_TRUE(get);
  EXPECT_EQ(get->status, 200);
  EXPECT_EQ(get->body, R"({"results": []})");

  auto post = client().Post("/query", "q=CREATE DATABASE x",
                            "application/x-www-form-urlencoded");
  ASSERT_TRUE(post);
  EXPECT_EQ(post->status, 200);
  EXPECT_EQ(post->body, R"({"results": []})");

  store_.flush();
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(HttpListenerTest, Ping) {
  auto res = client().Get("/ping");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_EQ(res->get_header_value("X-Influxdb-Version"),
            HttpListener::kInfluxDbVersion);
}

TEST_F(HttpListenerTest, IndexLinksToMetrics) {
  auto res = client().Get("/");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_THAT(res->body, HasSubstr("<a href=\"/metrics\">Metrics</a>"));
}

TEST_F(HttpListenerTest, UnknownPathServesIndex) {
  auto res = client().Get("/nothing-here");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_THAT(res->body, HasSubstr("<a href=\"/metrics\">Metrics</a>"));
}

TEST_F(HttpListenerTest, TruncatedBodyReturns500) {
  // Заявлено 100 байт, отправлено 10, затем запись закрыта
  const std::string response = rawExchange(
      port_,
      "POST /write HTTP/1.1\r\n"
      "Host: 127.0.0.1\r\n"
      "Content-Type: text/plain\r\n"
      "Content-Length: 100\r\n"
      "\r\n"
      "cpu value=");

  EXPECT_THAT(response, StartsWith("HTTP/1.1 500"));
  const size_t bodyStart = response.find("\r\n\r\n");
  ASSERT_NE(bodyStart, std::string::npos);
  EXPECT_THAT(response.substr(bodyStart + 4), StartsWith("error reading body:"));

  store_.flush();
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_GT(ctx_.lastPush->value(), 0.0);
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_ERROR, "error reading body"));
}

TEST_F(HttpListenerTest, StartBeforeBindThrows) {
  HttpListener other(ctx_, ingestor_, "/metrics");
  EXPECT_THROW(other.start(), std::logic_error);
}

TEST(HttpListenerPathTest, CustomTelemetryPath) {
  MemoryLogger logger;
  ExporterContext ctx(logger);
  SampleStore store(std::chrono::minutes(5), logger);
  PointIngestor ingestor(ctx, store);
  HttpListener listener(ctx, ingestor, "/custom.metrics");
  const int port = listener.bind("127.0.0.1", 0);
  listener.start();

  httplib::Client cli("127.0.0.1", port);
  auto res = cli.Get("/custom.metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_THAT(res->body, HasSubstr("influxdb_last_push_timestamp_seconds"));

  // '.' в пути не должна трактоваться как произвольный символ
  auto other = cli.Get("/customXmetrics");
  ASSERT_TRUE(other);
  EXPECT_EQ(other->status, 200);
  EXPECT_THAT(other->body, HasSubstr("<a href=\"/custom.metrics\">"));
  EXPECT_THAT(other->body, Not(HasSubstr("influxdb_last_push_timestamp_seconds")));

  listener.stop();
}

TEST(HttpListenerBindTest, EmptyHostAcceptsIpv4AndIpv6) {
  MemoryLogger logger;
  ExporterContext ctx(logger);
  SampleStore store(std::chrono::minutes(5), logger);
  PointIngestor ingestor(ctx, store);
  HttpListener listener(ctx, ingestor, "/metrics");
  const int port = listener.bind("", 0);
  ASSERT_GT(port, 0);
  listener.start();

  httplib::Client v4("127.0.0.1", port);
  auto res = v4.Get("/ping");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);

  if (ipv6LoopbackAvailable()) {
    httplib::Client v6("::1", port);
    auto res6 = v6.Get("/ping");
    ASSERT_TRUE(res6);
    EXPECT_EQ(res6->status, 204);
  }

  listener.stop();
}
