/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @date October 2026
 * @version 1.1
 * @license MIT
 *
 * @details Сигналы блокируются и читаются из signalfd в отдельном потоке,
 * поэтому обработчики выполняются в обычном контексте потока и могут
 * логировать, брать мьютексы и останавливать компоненты.
 */
#pragma once

#include <signal.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ifx {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов
 *
 * @warning
 * - Только для Linux систем
 * - Регистрировать обработчики нужно до создания остальных потоков:
 *   маска сигналов наследуется потоками при создании
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

  static SignalRouter& instance();

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @param signum Номер сигнала (например, SIGINT)
   * @param handler Функция-обработчик
   * @throw std::invalid_argument При неверном номере сигнала, SIGKILL, SIGSTOP
   * @throw std::system_error При ошибках системных вызовов
   *
   * @code
   * router.registerHandler(SIGTERM, [](int sig) {
   *     logger.info("Graceful shutdown requested");
   * });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /// Удалить все обработчики для сигнала (сигнал остаётся заблокированным)
  void unregisterHandler(int signum);

  /**
   * @brief Запустить обработку сигналов
   * @note Повторный вызов игнорируется
   */
  void start();

  /// Остановить поток обработки
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals();

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace ifx
