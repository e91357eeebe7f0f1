#include "ifx/SignalRouter.hpp"

#include <poll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ifx {

SignalRouter& SignalRouter::instance() {
  static SignalRouter router;
  return router;
}

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  const int rc = pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_);
  if (rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "pthread_sigmask(GET) failed");
  }
  signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
  if (signal_fd_ == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
  }
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL ||
      signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }

  std::lock_guard<std::mutex> lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  const int rc = pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr);
  if (rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "pthread_sigmask(BLOCK) failed");
  }

  // Обновляем signalfd
  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  if (signum <= 0 || signum >= NSIG) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(signum);
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;
  if (worker_thread_.joinable()) worker_thread_.join();
  worker_thread_ = std::thread(&SignalRouter::processSignals, this);
}

void SignalRouter::processSignals() {
  pollfd pfd{};
  pfd.fd = signal_fd_;
  pfd.events = POLLIN;

  while (running_) {
    const int ready = poll(&pfd, 1, 200);
    if (ready <= 0) continue;  // таймаут или EINTR

    signalfd_siginfo fdsi{};
    while (read(signal_fd_, &fdsi, sizeof(fdsi)) ==
           static_cast<ssize_t>(sizeof(fdsi))) {
      const int signum = static_cast<int>(fdsi.ssi_signo);
      std::vector<Handler> handlers;
      {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        if (auto it = handlers_.find(signum); it != handlers_.end()) {
          handlers = it->second;
        }
      }
      // Обработчик может вызвать stop(), поэтому вызывается без блокировки
      for (auto& handler : handlers) {
        handler(signum);
      }
    }
  }
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_thread_.joinable() &&
      worker_thread_.get_id() != std::this_thread::get_id()) {
    worker_thread_.join();
  }
}

SignalRouter::~SignalRouter() {
  stop();
  if (worker_thread_.joinable()) worker_thread_.detach();
  close(signal_fd_);
  pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace ifx
