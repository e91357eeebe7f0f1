/**
 * @file blockingqueue.hpp
 * @brief Неограниченная очередь для передачи данных между потоками
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

/**
 * @class BlockingQueue
 * @brief Очередь с ожиданием элемента до заданного момента времени
 *
 * @details Писателей может быть сколько угодно, читатель предполагается один.
 * После close() push() игнорируется, а popUntil() возвращает оставшиеся
 * элементы и затем PopResult::Closed.
 */
template <typename T>
class BlockingQueue {
 public:
  enum class PopResult { Item, Timeout, Closed };

  /// @return false, если очередь уже закрыта
  bool push(T item) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  PopResult popUntil(T& out, std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_until(lock, deadline,
                        [this] { return !queue_.empty() || closed_; })) {
      return PopResult::Timeout;
    }
    if (queue_.empty()) return PopResult::Closed;
    out = std::move(queue_.front());
    queue_.pop();
    return PopResult::Item;
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
  }

  size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
  bool closed_ = false;
};
