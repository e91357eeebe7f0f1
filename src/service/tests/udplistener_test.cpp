#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include "../include/datagramsocket.hpp"
#include "../include/exportercontext.hpp"
#include "../include/pointingestor.hpp"
#include "../include/samplestore.hpp"
#include "../include/udplistener.hpp"
#include "testlogger.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

class MockDatagramSocket : public IDatagramSocket {
 public:
  MOCK_METHOD(std::optional<size_t>, receive,
              (char* buf, size_t size, std::chrono::milliseconds timeout),
              (override));
  MOCK_METHOD(uint16_t, localPort, (), (const, override));
};

// Простой отправитель датаграмм на 127.0.0.1
class UdpSender {
 public:
  explicit UdpSender(uint16_t port) : fd_(::socket(AF_INET, SOCK_DGRAM, 0)) {
    if (fd_ < 0) {
      throw std::system_error(errno, std::system_category(), "socket() failed");
    }
    std::memset(&addr_, 0, sizeof(addr_));
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    addr_.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  }
  ~UdpSender() { ::close(fd_); }

  void send(const std::string& payload) {
    const ssize_t sent =
        ::sendto(fd_, payload.data(), payload.size(), 0,
                 reinterpret_cast<const sockaddr*>(&addr_), sizeof(addr_));
    if (sent < 0) {
      throw std::system_error(errno, std::system_category(), "sendto() failed");
    }
  }

 private:
  int fd_;
  sockaddr_in addr_{};
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

}  // namespace

class UdpListenerTest : public ::testing::Test {
 protected:
  void SetUp() override { store_.start(); }

  MemoryLogger logger_;
  ExporterContext ctx_{logger_};
  SampleStore store_{std::chrono::hours(24 * 365 * 100), logger_};
  PointIngestor ingestor_{ctx_, store_};
};

TEST_F(UdpListenerTest, RejectsNullSocket) {
  EXPECT_THROW(UdpListener(ctx_, ingestor_, nullptr), std::invalid_argument);
}

TEST_F(UdpListenerTest, DatagramIsIngested) {
  UdpListener listener(ctx_, ingestor_,
                       std::make_unique<UdpSocket>("127.0.0.1", 0));
  listener.start();
  ASSERT_TRUE(listener.isRunning());

  UdpSender sender(listener.port());
  sender.send("cpu,host=a value=42 1000000000");
  ASSERT_TRUE(waitFor([&] { return listener.datagramsProcessed() >= 1; }));
  store_.flush();

  const auto snapshot = store_.snapshot();
  ASSERT_EQ(snapshot.size(), 1u);
  EXPECT_EQ(snapshot[0]->fingerprint, R"(["cpu" "host" "a"])");
  EXPECT_EQ(snapshot[0]->value, 42.0);
  EXPECT_GT(ctx_.lastPush->value(), 0.0);

  listener.stop();
  EXPECT_FALSE(listener.isRunning());
}

TEST_F(UdpListenerTest, MalformedDatagramIsCountedAndDropped) {
  UdpListener listener(ctx_, ingestor_,
                       std::make_unique<UdpSocket>("127.0.0.1", 0));
  listener.start();

  UdpSender sender(listener.port());
  // Первая строка корректна, но датаграмма отбрасывается целиком
  sender.send("good value=1 1000000000\nbad,host=a");
  ASSERT_TRUE(waitFor([&] { return listener.datagramsProcessed() >= 1; }));
  store_.flush();

  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(ctx_.udpParseErrors->value(), 1.0);
  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_DEBUG, "error parsing udp packet"));
  EXPECT_GT(ctx_.lastPush->value(), 0.0);

  // Цикл приёма продолжает работу
  sender.send("after value=2 1000000000");
  ASSERT_TRUE(waitFor([&] { return listener.datagramsProcessed() >= 2; }));
  store_.flush();
  EXPECT_EQ(store_.size(), 1u);
  EXPECT_EQ(ctx_.udpParseErrors->value(), 1.0);

  listener.stop();
}

TEST_F(UdpListenerTest, ReadErrorIsLoggedAndLoopContinues) {
  auto socket = std::make_unique<MockDatagramSocket>();
  const std::string payload = "mem value=3 1000000000";

  EXPECT_CALL(*socket, localPort()).WillRepeatedly(Return(9122));
  EXPECT_CALL(*socket, receive(_, _, UdpListener::kPollTimeout))
      .WillOnce(Invoke([](char*, size_t, std::chrono::milliseconds)
                           -> std::optional<size_t> {
        throw std::system_error(ECONNREFUSED, std::system_category(),
                                "recv() failed");
      }))
      .WillOnce(Invoke([&payload](char* buf, size_t size,
                                  std::chrono::milliseconds)
                           -> std::optional<size_t> {
        const size_t length = std::min(size, payload.size());
        std::memcpy(buf, payload.data(), length);
        return length;
      }))
      .WillRepeatedly(Invoke([](char*, size_t, std::chrono::milliseconds)
                                 -> std::optional<size_t> {
        std::this_thread::sleep_for(1ms);
        return std::nullopt;
      }));

  UdpListener listener(ctx_, ingestor_, std::move(socket));
  listener.start();
  ASSERT_TRUE(waitFor([&] { return listener.datagramsProcessed() >= 1; }));
  listener.stop();
  store_.flush();

  EXPECT_TRUE(logger_.contains(ifx::LogLevel::LOG_ERROR,
                               "failed to read UDP message"));
  EXPECT_EQ(store_.size(), 1u);
  EXPECT_EQ(ctx_.udpParseErrors->value(), 0.0);
}

TEST_F(UdpListenerTest, StopWithoutTrafficReturnsPromptly) {
  UdpListener listener(ctx_, ingestor_,
                       std::make_unique<UdpSocket>("127.0.0.1", 0));
  listener.start();
  const auto begin = std::chrono::steady_clock::now();
  listener.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_EQ(listener.datagramsProcessed(), 0u);
}

TEST(UdpSocketTest, BindsToEphemeralPort) {
  UdpSocket socket("127.0.0.1", 0);
  EXPECT_GT(socket.localPort(), 0);
  EXPECT_GE(socket.fd(), 0);

  char buf[16];
  EXPECT_FALSE(socket.receive(buf, sizeof(buf), 10ms).has_value());
}

TEST(UdpSocketTest, UnresolvableHostThrows) {
  EXPECT_THROW(UdpSocket("no-such-host.invalid", 0), std::runtime_error);
}
