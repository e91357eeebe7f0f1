/**
 * @file samplestore.cpp
 * @brief Реализация SampleStore
 */

#include "../include/samplestore.hpp"

#include <stdexcept>
#include <type_traits>

SampleStore::SampleStore(std::chrono::nanoseconds expiry, ifx::ILogger& logger,
                         std::chrono::milliseconds sweepInterval, Clock clock)
    : expiry_(expiry),
      logger_(logger),
      sweepInterval_(sweepInterval),
      clock_(clock ? std::move(clock)
                   : Clock([] { return std::chrono::system_clock::now(); })) {
  if (expiry_ <= std::chrono::nanoseconds::zero()) {
    throw std::invalid_argument("SampleStore: expiry must be positive");
  }
  if (sweepInterval_ <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("SampleStore: sweep interval must be positive");
  }
}

SampleStore::~SampleStore() { stop(); }

void SampleStore::start() {
  if (running_.exchange(true)) return;
  queue_.reopen();
  writer_ = std::thread(&SampleStore::writerLoop, this);
}

void SampleStore::stop() {
  if (!running_.exchange(false)) return;
  queue_.close();
  if (writer_.joinable()) writer_.join();
}

bool SampleStore::submit(Sample sample) {
  if (!running_) return false;
  return queue_.push(Command(std::move(sample)));
}

void SampleStore::flush() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!running_ || !queue_.push(Command(FlushBarrier{done}))) return;
  future.get();
}

size_t SampleStore::sweepNow() {
  auto done = std::make_shared<std::promise<size_t>>();
  auto future = done->get_future();
  if (!running_ || !queue_.push(Command(SweepRequest{done}))) {
    return sweep();
  }
  return future.get();
}

std::vector<std::shared_ptr<const Sample>> SampleStore::snapshot() const {
  std::vector<std::shared_ptr<const Sample>> entries;
  {
    std::lock_guard lock(mutex_);
    entries.reserve(samples_.size());
    for (const auto& [fingerprint, sample] : samples_) {
      entries.push_back(sample);
    }
  }

  // Очистка могла ещё не дойти до записей, устаревших после последнего прохода
  const auto limit = cutoff();
  std::vector<std::shared_ptr<const Sample>> fresh;
  fresh.reserve(entries.size());
  for (auto& sample : entries) {
    if (sample->timestamp >= limit) fresh.push_back(std::move(sample));
  }
  return fresh;
}

size_t SampleStore::size() const {
  std::lock_guard lock(mutex_);
  return samples_.size();
}

std::chrono::system_clock::time_point SampleStore::cutoff() const {
  return clock_() -
         std::chrono::duration_cast<std::chrono::system_clock::duration>(
             expiry_);
}

void SampleStore::writerLoop() {
  auto nextSweep = std::chrono::steady_clock::now() + sweepInterval_;
  logger_.debug("SampleStore: writer started");

  while (true) {
    Command command;
    const auto result = queue_.popUntil(command, nextSweep);

    if (result == BlockingQueue<Command>::PopResult::Closed) break;

    // При непрерывном потоке popUntil не возвращает Timeout, поэтому срок
    // очистки проверяется и после каждого элемента
    const auto now = std::chrono::steady_clock::now();
    if (now >= nextSweep) {
      sweep();
      nextSweep = now + sweepInterval_;
    }
    if (result == BlockingQueue<Command>::PopResult::Timeout) continue;

    std::visit(
        [this](auto&& item) {
          using T = std::decay_t<decltype(item)>;
          if constexpr (std::is_same_v<T, Sample>) {
            apply(std::move(item));
          } else if constexpr (std::is_same_v<T, SweepRequest>) {
            item.done->set_value(sweep());
          } else {
            item.done->set_value();
          }
        },
        std::move(command));
  }

  logger_.debug("SampleStore: writer stopped");
}

void SampleStore::apply(Sample&& sample) {
  auto entry = std::make_shared<const Sample>(std::move(sample));
  std::lock_guard lock(mutex_);
  samples_[entry->fingerprint] = std::move(entry);
}

size_t SampleStore::sweep() {
  const auto limit = cutoff();
  size_t evicted = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto it = samples_.begin(); it != samples_.end();) {
      if (it->second->timestamp < limit) {
        it = samples_.erase(it);
        ++evicted;
      } else {
        ++it;
      }
    }
  }
  logger_.debug("SampleStore: sweep evicted " + std::to_string(evicted) +
                " sample(s)");
  return evicted;
}
