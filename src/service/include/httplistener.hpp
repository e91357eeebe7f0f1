/**
 * @file httplistener.hpp
 * @brief HTTP-интерфейс экспортера
 *
 * @details Маршруты:
 *  - POST /write, POST /api/v2/write - приём line protocol
 *  - GET|POST /query - заглушка для клиентов, создающих базу данных
 *  - GET|HEAD /ping - проверка доступности
 *  - GET <telemetryPath> - метрики в формате Prometheus
 *  - GET для прочих путей - страница со ссылкой на метрики
 */

#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "../include/exportercontext.hpp"
#include "../include/pointingestor.hpp"

/**
 * @class HttpListener
 * @brief HTTP-сервер на cpp-httplib с собственным потоком приёма соединений
 *
 * @details Запросы обрабатываются пулом потоков httplib. Ошибки запроса
 * переводятся в HTTP-статус и не выходят за пределы обработчика.
 */
class HttpListener {
 public:
  static constexpr const char* kInfluxDbVersion = "1.8.10";
  static constexpr const char* kMetricsContentType =
      "text/plain; version=0.0.4; charset=utf-8";

  HttpListener(ExporterContext& ctx, PointIngestor& ingestor,
               std::string telemetryPath);
  ~HttpListener();

  HttpListener(const HttpListener&) = delete;
  HttpListener& operator=(const HttpListener&) = delete;

  /**
   * @brief Привязать сервер к адресу
   * @param host Адрес; пустая строка означает все интерфейсы IPv4 и IPv6
   * @param port Порт; 0 - выбрать свободный
   * @return Фактический порт
   * @throw std::runtime_error Если привязка не удалась
   */
  int bind(const std::string& host, int port);

  /// Запустить приём соединений в отдельном потоке
  void start();

  /// Остановить сервер и дождаться завершения потока
  void stop();

  int port() const noexcept { return port_; }
  bool isRunning() const { return server_->is_running(); }

 private:
  void setupRoutes();
  int bindTo(const std::string& address, int port);
  int bindOrThrow(const std::string& address, int port);
  static void configureDualStack(httplib::socket_t sock);
  void handleWrite(const httplib::Request& req, httplib::Response& res,
                   const httplib::ContentReader& reader);
  void handleMetrics(const httplib::Request& req, httplib::Response& res);
  void handleIndex(const httplib::Request& req, httplib::Response& res);

  ExporterContext& ctx_;
  PointIngestor& ingestor_;
  std::string telemetryPath_;
  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;
  std::atomic<bool> listenFinished_{false};
  int port_ = -1;
};
