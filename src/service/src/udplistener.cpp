/**
 * @file udplistener.cpp
 * @brief Реализация UdpListener
 */

#include "../include/udplistener.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

UdpListener::UdpListener(ExporterContext& ctx, PointIngestor& ingestor,
                         std::unique_ptr<IDatagramSocket> socket)
    : ctx_(ctx), ingestor_(ingestor), socket_(std::move(socket)) {
  if (!socket_) {
    throw std::invalid_argument("UdpListener: socket is null");
  }
}

UdpListener::~UdpListener() { stop(); }

void UdpListener::start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&UdpListener::receiveLoop, this);
  ctx_.logger.info("UdpListener: listening on port " +
                   std::to_string(socket_->localPort()));
}

void UdpListener::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    ctx_.logger.info("UdpListener: stopped");
  }
}

void UdpListener::receiveLoop() {
  std::vector<char> buffer(kMaxDatagramSize);

  while (running_) {
    std::optional<size_t> length;
    try {
      length = socket_->receive(buffer.data(), buffer.size(), kPollTimeout);
    } catch (const std::system_error& e) {
      ctx_.logger.error(std::string("UdpListener: failed to read UDP message: ") +
                        e.what());
      continue;
    }
    if (!length) continue;

    // Буфер переиспользуется следующим receive()
    const std::string payload(buffer.data(), *length);
    ctx_.markPush();
    handleDatagram(payload);
    ++processed_;
  }
}

void UdpListener::handleDatagram(const std::string& payload) {
  try {
    ingestor_.ingest(payload, ifx::lineprotocol::Precision::Nanoseconds);
  } catch (const ifx::lineprotocol::ParseError& e) {
    ctx_.udpParseErrors->increment();
    ctx_.logger.debug(std::string("UdpListener: error parsing udp packet: ") +
                      e.what());
  }
}
