/**
 * @file service_controller.hpp
 * @brief Управление жизненным циклом экспортера
 *
 * @details
 * ServiceController отвечает за:
 *  - разбор аргументов командной строки (ArgumentParser)
 *  - загрузку конфигурации (ConfigManager)
 *  - настройку логирования (ifx::CompositeLogger)
 *  - сборку ExporterContext, SampleStore и слушателей HTTP/UDP
 *  - корректное завершение по SIGINT/SIGTERM (ifx::SignalRouter)
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

#include "../include/argumentparser.hpp"
#include "../include/exportercontext.hpp"
#include "../include/exporterconfig.hpp"
#include "../include/httplistener.hpp"
#include "../include/pointingestor.hpp"
#include "../include/samplestore.hpp"
#include "../include/udplistener.hpp"
#include "ifx/compositelogger.hpp"

/**
 * @defgroup Service Управление сервисом
 */

/**
 * @class ServiceController
 * @brief Точка входа экспортера
 * @ingroup Service
 *
 * @details Компоненты запускаются в порядке хранилище, UDP, HTTP и
 * останавливаются в обратном порядке.
 */
class ServiceController {
 public:
  static constexpr const char* kVersion = "0.3.0";

  ServiceController() = default;
  ~ServiceController();

  ServiceController(const ServiceController&) = delete;
  ServiceController& operator=(const ServiceController&) = delete;

  /**
   * @brief Запуск сервиса
   * @return EXIT_SUCCESS при штатном завершении, EXIT_FAILURE при ошибке
   *         аргументов или запуска
   */
  int run(int argc, char** argv);

  /// Запросить завершение главного цикла (безопасно из любого потока)
  void requestShutdown();

 private:
  void initLogger(const ParsedArgs& args, const ExporterConfig& config);
  void registerSignals();
  void startComponents(const ExporterConfig& config);
  void mainLoop();
  void stopComponents() noexcept;
  static void printVersion();

  std::shared_ptr<ifx::CompositeLogger> logger_;
  std::unique_ptr<ExporterContext> ctx_;
  std::unique_ptr<SampleStore> store_;
  std::unique_ptr<PointIngestor> ingestor_;
  std::unique_ptr<UdpListener> udp_;
  std::unique_ptr<HttpListener> http_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic<bool> shutdown_requested_{false};
};
