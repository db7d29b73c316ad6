#include "switchboard/common/lifecycle.hpp"

namespace switchboard::common {

void Lifecycle::kill(std::optional<std::string> error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!killed_) {
      killed_ = true;
      error_ = std::move(error);
    }
  }
  source_.request_stop();
}

Status Lifecycle::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_.has_value()) {
    return Status::error(*error_);
  }
  return Status::success();
}

void Lifecycle::mark_dead() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!killed_) {
      killed_ = true;
    }
    dead_ = true;
  }
  source_.request_stop();
  dead_cv_.notify_all();
}

bool Lifecycle::dead() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dead_;
}

void Lifecycle::wait_dead() const {
  std::unique_lock<std::mutex> lock(mutex_);
  dead_cv_.wait(lock, [this]() { return dead_; });
}

LinkedStop::LinkedStop(const std::vector<std::stop_token> &parents) {
  links_.reserve(parents.size());
  for (const auto &parent : parents) {
    links_.push_back(std::make_unique<std::stop_callback<Relay>>(parent, Relay{&source_}));
  }
}

bool sleep_for(const std::chrono::milliseconds duration, const std::stop_token &stop) {
  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mutex);
  const bool interrupted =
      cv.wait_for(lock, stop, duration, [&stop]() { return stop.stop_requested(); });
  return !interrupted;
}

} // namespace switchboard::common
