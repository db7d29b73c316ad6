#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace switchboard::common {

/// Bounded FIFO shared between threads. Every blocking call races a stop token,
/// so a blocked sender or receiver gives up as soon as its owner starts dying.
template <typename T> class Channel {
public:
  using Clock = std::chrono::steady_clock;

  explicit Channel(std::size_t capacity = 1) : capacity_(capacity == 0 ? 1 : capacity) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /// Returns false when the token was stopped or the deadline passed before
  /// there was room for the value. An already stopped token never enqueues.
  [[nodiscard]] bool send(T value, std::stop_token stop = {},
                          std::optional<Clock::time_point> deadline = std::nullopt) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stop.stop_requested()) {
      return false;
    }
    const auto has_room = [this]() { return queue_.size() < capacity_; };
    if (deadline.has_value()) {
      if (!not_full_.wait_until(lock, stop, *deadline, has_room)) {
        return false;
      }
    } else if (!not_full_.wait(lock, stop, has_room)) {
      return false;
    }
    queue_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  [[nodiscard]] bool send_for(T value, std::chrono::milliseconds timeout,
                              std::stop_token stop = {}) {
    return send(std::move(value), std::move(stop), Clock::now() + timeout);
  }

  [[nodiscard]] std::optional<T>
  receive(std::stop_token stop = {}, std::optional<Clock::time_point> deadline = std::nullopt) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto has_item = [this]() { return !queue_.empty(); };
    if (deadline.has_value()) {
      if (!not_empty_.wait_until(lock, stop, *deadline, has_item)) {
        return std::nullopt;
      }
    } else if (!not_empty_.wait(lock, stop, has_item)) {
      return std::nullopt;
    }
    return pop_locked(lock);
  }

  [[nodiscard]] std::optional<T> try_receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return pop_locked(lock);
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  T pop_locked(std::unique_lock<std::mutex> &lock) {
    T value = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any not_empty_;
  std::condition_variable_any not_full_;
  std::deque<T> queue_;
};

} // namespace switchboard::common
