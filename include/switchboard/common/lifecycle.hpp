#pragma once

#include "switchboard/common/result.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace switchboard::common {

/// Alive/dying/dead tracking for one loop. kill() only records the first
/// reason; later kills just make sure the stop was requested.
class Lifecycle {
public:
  Lifecycle() = default;
  Lifecycle(const Lifecycle &) = delete;
  Lifecycle &operator=(const Lifecycle &) = delete;

  /// std::nullopt is a clean stop; an error string is a failure.
  void kill(std::optional<std::string> error = std::nullopt);

  [[nodiscard]] std::stop_token token() const { return source_.get_token(); }
  [[nodiscard]] bool alive() const { return !source_.stop_requested(); }

  /// Success for a clean stop (or while still alive), the recorded error otherwise.
  [[nodiscard]] Status reason() const;

  void mark_dead();
  [[nodiscard]] bool dead() const;
  void wait_dead() const;

private:
  std::stop_source source_;
  mutable std::mutex mutex_;
  mutable std::condition_variable dead_cv_;
  bool killed_ = false;
  bool dead_ = false;
  std::optional<std::string> error_;
};

/// A stop source that is stopped as soon as any of the parent tokens is.
class LinkedStop {
public:
  explicit LinkedStop(const std::vector<std::stop_token> &parents);
  LinkedStop(const LinkedStop &) = delete;
  LinkedStop &operator=(const LinkedStop &) = delete;

  [[nodiscard]] std::stop_token token() const { return source_.get_token(); }
  void request_stop() { source_.request_stop(); }

private:
  struct Relay {
    std::stop_source *target;
    void operator()() const noexcept { target->request_stop(); }
  };

  std::stop_source source_;
  std::vector<std::unique_ptr<std::stop_callback<Relay>>> links_;
};

/// Sleeps for the given duration unless the token is stopped first.
/// Returns false when interrupted.
bool sleep_for(std::chrono::milliseconds duration, const std::stop_token &stop);

} // namespace switchboard::common
