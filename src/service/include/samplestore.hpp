/**
 * @file samplestore.hpp
 * @brief Кэш последних значений с вытеснением по возрасту
 *
 * @details
 * Все изменения карты выполняет один поток-писатель: Sample от обоих
 * слушателей поступают через BlockingQueue. Раз в sweepInterval писатель
 * удаляет записи, чьё время события старше now - expiry. Чтение (snapshot)
 * выполняется из любых потоков под тем же мьютексом, что и запись, и
 * дополнительно отфильтровывает устаревшие записи.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "../include/blockingqueue.hpp"
#include "../include/sample.hpp"
#include "ifx/ilogger.hpp"

/**
 * @defgroup Storage Хранение данных экспортера
 */

/**
 * @class SampleStore
 * @brief Потокобезопасное хранилище Sample по fingerprint
 *
 * @ingroup Storage
 *
 * @details Запись с тем же fingerprint заменяется последней доставленной,
 * независимо от её временной метки.
 */
class SampleStore {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr std::chrono::milliseconds kDefaultSweepInterval =
      std::chrono::minutes(1);

  /**
   * @param expiry Окно свежести, должно быть положительным
   * @param logger Приёмник сообщений о проходах очистки
   * @param sweepInterval Период очистки
   * @param clock Источник текущего времени (подменяется в тестах),
   *              по умолчанию system_clock::now
   * @throw std::invalid_argument Если expiry или sweepInterval не положительны
   */
  SampleStore(std::chrono::nanoseconds expiry, ifx::ILogger& logger,
              std::chrono::milliseconds sweepInterval = kDefaultSweepInterval,
              Clock clock = {});
  ~SampleStore();

  SampleStore(const SampleStore&) = delete;
  SampleStore& operator=(const SampleStore&) = delete;

  /// Запуск потока-писателя; повторный вызов игнорируется
  void start();

  /// Остановка писателя: элементы, уже стоящие в очереди, применяются
  void stop();

  bool isRunning() const noexcept { return running_.load(); }

  /**
   * @brief Поставить Sample в очередь на запись
   * @return false, если хранилище остановлено
   */
  bool submit(Sample sample);

  /// Дождаться применения всех поставленных ранее Sample
  void flush();

  /**
   * @brief Немедленный проход очистки в потоке-писателе
   * @return Количество удалённых записей
   */
  size_t sweepNow();

  /// Текущие записи с timestamp >= cutoff(), в произвольном порядке
  std::vector<std::shared_ptr<const Sample>> snapshot() const;

  /// Число записей в карте, включая ещё не вычищенные устаревшие
  size_t size() const;

  /// Граница свежести: now - expiry
  std::chrono::system_clock::time_point cutoff() const;

 private:
  struct SweepRequest {
    std::shared_ptr<std::promise<size_t>> done;
  };
  struct FlushBarrier {
    std::shared_ptr<std::promise<void>> done;
  };
  using Command = std::variant<Sample, SweepRequest, FlushBarrier>;

  void writerLoop();
  void apply(Sample&& sample);
  size_t sweep();

  const std::chrono::nanoseconds expiry_;
  ifx::ILogger& logger_;
  const std::chrono::milliseconds sweepInterval_;
  Clock clock_;

  BlockingQueue<Command> queue_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const Sample>> samples_;

  std::atomic<bool> running_{false};
  std::thread writer_;
};
