/**
 * @file httplistener.cpp
 * @brief Реализация HttpListener
 */

#include "../include/httplistener.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

// Маршруты httplib задаются регулярными выражениями
std::string escapeRoute(const std::string& path) {
  static const std::string special = "\\^$.|?*+()[]{}";
  std::string out;
  for (char c : path) {
    if (special.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

}  // namespace

HttpListener::HttpListener(ExporterContext& ctx, PointIngestor& ingestor,
                           std::string telemetryPath)
    : ctx_(ctx),
      ingestor_(ingestor),
      telemetryPath_(std::move(telemetryPath)),
      server_(std::make_unique<httplib::Server>()) {
  setupRoutes();
}

HttpListener::~HttpListener() { stop(); }

void HttpListener::setupRoutes() {
  auto write = [this](const httplib::Request& req, httplib::Response& res,
                      const httplib::ContentReader& reader) {
    handleWrite(req, res, reader);
  };
  server_->Post("/write", write);
  server_->Post("/api/v2/write", write);

  // Некоторые клиенты InfluxDB пытаются создать базу данных
  auto query = [](const httplib::Request&, httplib::Response& res) {
    res.set_content(R"({"results": []})", "application/json");
  };
  server_->Get("/query", query);
  server_->Post("/query", query);

  server_->Get("/ping", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("X-Influxdb-Version", kInfluxDbVersion);
  });

  server_->Get(escapeRoute(telemetryPath_),
               [this](const httplib::Request& req, httplib::Response& res) {
                 handleMetrics(req, res);
               });

  // Регистрируется последним: маршруты проверяются в порядке добавления
  if (telemetryPath_ != "/") {
    server_->Get("/.*", [this](const httplib::Request& req,
                               httplib::Response& res) { handleIndex(req, res); });
  }
}

void HttpListener::handleWrite(const httplib::Request& req,
                               httplib::Response& res,
                               const httplib::ContentReader& reader) {
  ctx_.markPush();

  std::string body;
  const bool complete = reader([&body](const char* data, size_t length) {
    body.append(data, length);
    return true;
  });
  if (!complete) {
    const std::string message =
        "error reading body: connection closed before the request body was "
        "fully received";
    ctx_.logger.error("HttpListener: " + message);
    res.status = 500;
    res.set_content(message + "\n", "text/plain; charset=utf-8");
    return;
  }

  const auto precision =
      ifx::lineprotocol::parsePrecision(req.get_param_value("precision"));

  try {
    const size_t count = ingestor_.ingest(body, precision);
    ctx_.logger.debug("HttpListener: accepted " + std::to_string(count) +
                      " sample(s) from " + req.remote_addr);
  } catch (const ifx::lineprotocol::ParseError& e) {
    ctx_.logger.debug(std::string("HttpListener: error parsing request: ") +
                      e.what());
    res.status = 400;
    res.set_content(std::string("error parsing request: ") + e.what() + "\n",
                    "text/plain; charset=utf-8");
    return;
  }

  // InfluxDB отвечает 204 при успешной записи
  res.status = 204;
}

void HttpListener::handleMetrics(const httplib::Request&,
                                 httplib::Response& res) {
  res.set_content(ctx_.registry.exportPrometheus(), kMetricsContentType);
}

void HttpListener::handleIndex(const httplib::Request&,
                               httplib::Response& res) {
  res.set_content(
      "<html>\n"
      "<head><title>InfluxDB Exporter</title></head>\n"
      "<body>\n"
      "<h1>InfluxDB Exporter</h1>\n"
      "<p><a href=\"" + telemetryPath_ + "\">Metrics</a></p>\n"
      "</body>\n"
      "</html>\n",
      "text/html; charset=utf-8");
}

int HttpListener::bind(const std::string& host, int port) {
  if (host.empty()) {
    // "::" с IPV6_V6ONLY=0 принимает и IPv4; без IPv6 остаётся 0.0.0.0
    server_->set_socket_options(configureDualStack);
    if (bindTo("::", port) >= 0) return port_;
    return bindOrThrow("0.0.0.0", port);
  }
  return bindOrThrow(host, port);
}

int HttpListener::bindTo(const std::string& address, int port) {
  if (port == 0) {
    port_ = server_->bind_to_any_port(address);
  } else {
    port_ = server_->bind_to_port(address, port) ? port : -1;
  }
  return port_;
}

int HttpListener::bindOrThrow(const std::string& address, int port) {
  if (bindTo(address, port) < 0) {
    throw std::runtime_error("HttpListener: cannot bind to " + address + ":" +
                             std::to_string(port));
  }
  return port_;
}

void HttpListener::configureDualStack(httplib::socket_t sock) {
  int yes = 1;
  ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

  int domain = 0;
  socklen_t len = sizeof(domain);
  if (::getsockopt(sock, SOL_SOCKET, SO_DOMAIN, &domain, &len) == 0 &&
      domain == AF_INET6) {
    int no = 0;
    ::setsockopt(sock, IPPROTO_IPV6, IPV6_V6ONLY, &no, sizeof(no));
  }
}

void HttpListener::start() {
  if (port_ < 0) {
    throw std::logic_error("HttpListener: start() called before bind()");
  }
  if (thread_.joinable()) return;

  listenFinished_ = false;
  thread_ = std::thread([this] {
    if (!server_->listen_after_bind()) {
      ctx_.logger.error("HttpListener: listener loop terminated with error");
    }
    listenFinished_ = true;
  });

  // stop() до входа в цикл приёма не остановил бы сервер
  while (!server_->is_running() && !listenFinished_) {
    std::this_thread::sleep_for(1ms);
  }
  ctx_.logger.info("HttpListener: listening on port " + std::to_string(port_));
}

void HttpListener::stop() {
  if (!thread_.joinable()) return;
  server_->stop();
  thread_.join();
  ctx_.logger.info("HttpListener: stopped");
}
