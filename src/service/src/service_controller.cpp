/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @details
 *  - run(): разбор аргументов, конфигурация, запуск компонентов
 *  - initLogger(): приёмники логов из конфигурации или командной строки
 *  - mainLoop(): ожидание сигнала завершения
 *  - stopComponents(): остановка в обратном порядке
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <cstdlib>
#include <iostream>

#include "../include/configmanager.hpp"
#include "../include/samplecollector.hpp"
#include "ifx/SignalRouter.hpp"
#include "ifx/consolelogger.hpp"
#include "ifx/filelogger.hpp"

namespace {

// Файл для --log-type=file без конфигурации
constexpr const char* kDefaultLogFile = "influxdb_exporter.log";

}  // namespace

ServiceController::~ServiceController() { stopComponents(); }

int ServiceController::run(int argc, char** argv) {
  ParsedArgs args;
  try {
    args = ArgumentParser().parse(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n\n" << ArgumentParser::helpText();
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    std::cout << ArgumentParser::helpText();
    return EXIT_SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_SUCCESS;
  }

  try {
    ConfigManager configManager;
    if (args.config_path) {
      configManager.initialize(*args.config_path);
    }
    configManager.applyCliOverrides(args.overrides);
    const ExporterConfig config =
        configManager.getExporterConfig(args.environment);

    initLogger(args, config);
    logger_->info("Starting influxdb_exporter " + std::string(kVersion));
    if (args.config_path) {
      logger_->info("Configuration loaded from " + *args.config_path +
                    " (environment '" + args.environment + "')");
    }

    // Маска сигналов наследуется потоками, поэтому до запуска компонентов
    registerSignals();
    startComponents(config);
  } catch (const std::exception& e) {
    ifx::ILogger& log =
        logger_ ? static_cast<ifx::ILogger&>(*logger_)
                : static_cast<ifx::ILogger&>(ifx::ConsoleLogger::instance());
    log.critical(std::string("Startup failed: ") + e.what());
    stopComponents();
    return EXIT_FAILURE;
  }

  mainLoop();
  stopComponents();
  logger_->info("Service controller: Service shutdown complete");
  logger_->flush();
  return EXIT_SUCCESS;
}

void ServiceController::initLogger(const ParsedArgs& args,
                                   const ExporterConfig& config) {
  logger_ = std::make_shared<ifx::CompositeLogger>();

  // Консольный приёмник-синглтон не должен удаляться shared_ptr
  auto console = std::shared_ptr<ifx::ILogger>(&ifx::ConsoleLogger::instance(),
                                               [](ifx::ILogger*) {});

  if (!args.use_cli_logging) {
    for (const auto& entry : config.logging) {
      std::shared_ptr<ifx::ILogger> sink;
      if (entry.type == "file") {
        sink = std::make_shared<ifx::FileLogger>(entry.file);
      } else {
        sink = console;
      }
      sink->setLogLevel(ifx::stringToLogLevel(entry.level));
      logger_->addLogger(sink);
    }
  } else {
    for (const auto& type : args.logger_types) {
      if (type == "file") {
        logger_->addLogger(std::make_shared<ifx::FileLogger>(kDefaultLogFile));
      } else {
        logger_->addLogger(console);
      }
    }
  }

  if (logger_->size() == 0) {
    logger_->addLogger(console);
  }

  if (args.log_level) {
    logger_->setLogLevel(ifx::stringToLogLevel(*args.log_level));
  }
}

void ServiceController::registerSignals() {
  auto& router = ifx::SignalRouter::instance();
  logger_->debug("Service controller: Registering signal handlers ...");

  for (int signum : {SIGINT, SIGTERM}) {
    router.registerHandler(signum, [this](int sig) {
      logger_->info(std::string(sig == SIGINT ? "SIGINT" : "SIGTERM") +
                    " received, shutting down");
      requestShutdown();
    });
  }
  router.start();
}

void ServiceController::startComponents(const ExporterConfig& config) {
  ctx_ = std::make_unique<ExporterContext>(*logger_);
  store_ = std::make_unique<SampleStore>(config.sampleExpiry, *logger_);
  SampleCollector::attach(ctx_->registry, *store_, config.exportTimestamps);
  ingestor_ = std::make_unique<PointIngestor>(*ctx_, *store_);

  udp_ = std::make_unique<UdpListener>(
      *ctx_, *ingestor_,
      std::make_unique<UdpSocket>(config.udpBindAddress.host,
                                  config.udpBindAddress.port));
  http_ = std::make_unique<HttpListener>(*ctx_, *ingestor_,
                                         config.telemetryPath);
  http_->bind(config.webListenAddress.host, config.webListenAddress.port);

  store_->start();
  udp_->start();
  http_->start();
  logger_->info("Serving metrics on " + config.webListenAddress.toString() +
                config.telemetryPath + ", UDP on " +
                config.udpBindAddress.toString());
}

void ServiceController::mainLoop() {
  std::unique_lock<std::mutex> lock(mtx_);
  logger_->info("Service controller: Service main loop started");
  cv_.wait(lock, [this] {
    return shutdown_requested_.load(std::memory_order_acquire);
  });
  logger_->info("Service controller: Service main loop ended");
}

void ServiceController::requestShutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutdown_requested_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

void ServiceController::stopComponents() noexcept {
  if (http_) http_->stop();
  if (udp_) udp_->stop();
  if (store_) store_->stop();

  auto& router = ifx::SignalRouter::instance();
  router.stop();
  router.unregisterHandler(SIGINT);
  router.unregisterHandler(SIGTERM);

  http_.reset();
  udp_.reset();
  ingestor_.reset();
  ctx_.reset();
  store_.reset();
}

void ServiceController::printVersion() {
  std::cout << "influxdb_exporter v" << kVersion << "\n";
}
