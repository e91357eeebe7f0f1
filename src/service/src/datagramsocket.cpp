/**
 * @file datagramsocket.cpp
 * @brief Реализация UdpSocket поверх getaddrinfo/bind/poll/recv
 */

#include "../include/datagramsocket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <system_error>

UdpSocket::UdpSocket(const std::string& host, uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* found = nullptr;
  const std::string service = std::to_string(port);
  const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(),
                             service.c_str(), &hints, &found);
  if (rc != 0) {
    throw std::runtime_error("UdpSocket: cannot resolve '" + host +
                             "': " + gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(found,
                                                           &freeaddrinfo);

  int lastError = 0;
  for (const addrinfo* ai = found; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      lastError = errno;
      continue;
    }
    if (ai->ai_family == AF_INET6) {
      // Пустой хост: принимаем и IPv4 через dual-stack сокет
      int off = 0;
      setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off));
    }
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      sockfd_ = fd;
      return;
    }
    lastError = errno;
    ::close(fd);
  }

  throw std::system_error(lastError, std::system_category(),
                          "UdpSocket: bind to '" + host + ":" + service +
                              "' failed");
}

UdpSocket::~UdpSocket() {
  if (sockfd_ >= 0) ::close(sockfd_);
}

std::optional<size_t> UdpSocket::receive(char* buf, size_t size,
                                         std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = sockfd_;
  pfd.events = POLLIN;

  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready == 0) return std::nullopt;
  if (ready < 0) {
    if (errno == EINTR) return std::nullopt;
    throw std::system_error(errno, std::system_category(), "poll() failed");
  }

  const ssize_t n = ::recv(sockfd_, buf, size, 0);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return std::nullopt;
    }
    throw std::system_error(errno, std::system_category(), "recv() failed");
  }
  return static_cast<size_t>(n);
}

uint16_t UdpSocket::localPort() const {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(sockfd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "getsockname() failed");
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}
