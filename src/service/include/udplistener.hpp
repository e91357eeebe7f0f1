/**
 * @file udplistener.hpp
 * @brief Приём line protocol по UDP
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "../include/datagramsocket.hpp"
#include "../include/exportercontext.hpp"
#include "../include/pointingestor.hpp"

/**
 * @class UdpListener
 * @brief Цикл приёма датаграмм в отдельном потоке
 *
 * @details
 * - Ошибка чтения логируется, цикл продолжается
 * - Датаграмма копируется из буфера приёма, датчик последней записи
 *   обновляется, затем полезная нагрузка разбирается с точностью ns
 * - Ошибка разбора увеличивает счётчик ошибок; из такой датаграммы
 *   в хранилище не попадает ни одного Sample
 */
class UdpListener {
 public:
  /// Максимальный размер датаграммы
  static constexpr size_t kMaxDatagramSize = 64 * 1024;
  /// Период проверки флага остановки
  static constexpr std::chrono::milliseconds kPollTimeout{200};

  UdpListener(ExporterContext& ctx, PointIngestor& ingestor,
              std::unique_ptr<IDatagramSocket> socket);
  ~UdpListener();

  UdpListener(const UdpListener&) = delete;
  UdpListener& operator=(const UdpListener&) = delete;

  /// Запустить поток приёма; повторный вызов игнорируется
  void start();

  /// Остановить поток приёма (не позднее kPollTimeout)
  void stop();

  bool isRunning() const noexcept { return running_.load(); }

  uint16_t port() const { return socket_->localPort(); }

  /// Количество обработанных датаграмм, включая отброшенные
  uint64_t datagramsProcessed() const noexcept { return processed_.load(); }

 private:
  void receiveLoop();
  void handleDatagram(const std::string& payload);

  ExporterContext& ctx_;
  PointIngestor& ingestor_;
  std::unique_ptr<IDatagramSocket> socket_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> processed_{0};
  std::thread thread_;
};
