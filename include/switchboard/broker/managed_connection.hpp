#pragma once

#include "switchboard/common/result.hpp"
#include "switchboard/observability/global.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace switchboard::broker {

/// A single-use connection to some external service. Only ever used from the
/// broker's own thread, one operation at a time.
template <typename Request, typename Response> class IConnection {
public:
  virtual ~IConnection() = default;

  [[nodiscard]] virtual common::Result<Response> perform(const Request &request) = 0;
  /// Cheap round trip used to detect silently dead connections.
  [[nodiscard]] virtual common::Status ping() = 0;
  /// True once the connection can no longer be used, even though the last
  /// request succeeded. A failed request always drops the connection.
  [[nodiscard]] virtual bool broken() const { return false; }
  virtual void close() = 0;
};

struct BrokerOptions {
  std::chrono::milliseconds request_timeout{5000};
  std::chrono::milliseconds redial_delay{5000};
  std::chrono::milliseconds keepalive_interval{5000};
};

/// Shares one physical connection among any number of handles. A dedicated
/// thread owns the connection, redials it while references remain, and
/// serves requests one at a time.
template <typename Request, typename Response>
class ManagedConnection : public std::enable_shared_from_this<ManagedConnection<Request, Response>> {
  struct Private {
    explicit Private() = default;
  };

public:
  using Connection = IConnection<Request, Response>;
  using Dialer = std::function<common::Result<std::unique_ptr<Connection>>()>;

  class Handle {
    struct Private {
      explicit Private() = default;
    };

  public:
    Handle(Private, std::shared_ptr<ManagedConnection> owner) : owner_(std::move(owner)) {}
    ~Handle() { close(); }

    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    /// Performs `request` on the shared connection, waiting at most the
    /// broker's request timeout.
    [[nodiscard]] common::Result<Response> request(const Request &request) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
          return common::Result<Response>::failure(owner_->service_ +
                                                   " connection already closed");
        }
      }
      return owner_->submit(request);
    }

    /// Releases this handle's reference. Later calls do nothing.
    void close() {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
          return;
        }
        closed_ = true;
      }
      owner_->post_control(-1);
    }

    [[nodiscard]] bool closed() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return closed_;
    }

  private:
    friend class ManagedConnection;

    std::shared_ptr<ManagedConnection> owner_;
    mutable std::mutex mutex_;
    bool closed_ = false;
  };

  [[nodiscard]] static std::shared_ptr<ManagedConnection>
  start(std::string service, Dialer dialer, BrokerOptions options = {}) {
    auto broker = std::make_shared<ManagedConnection>(Private{}, std::move(service),
                                                      std::move(dialer), options);
    broker->thread_ = std::thread([raw = broker.get()]() { raw->loop(); });
    return broker;
  }

  ManagedConnection(Private, std::string service, Dialer dialer, BrokerOptions options)
      : service_(std::move(service)), dialer_(std::move(dialer)), options_(options) {}

  ~ManagedConnection() {
    close();
    if (thread_.joinable()) {
      try {
        thread_.join();
      } catch (const std::system_error &err) {
        std::cerr << "[broker] " << service_ << " join failed: " << err.what() << "\n";
      }
    }
  }

  ManagedConnection(const ManagedConnection &) = delete;
  ManagedConnection &operator=(const ManagedConnection &) = delete;

  /// Takes a new reference on the shared connection. Acquiring from a broker
  /// that already shut down is a caller bug and aborts.
  [[nodiscard]] std::unique_ptr<Handle> acquire() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (dead_) {
        std::cerr << "[broker] " << service_ << " handle acquired after closing connection\n";
        std::abort();
      }
      controls_.push_back(+1);
    }
    cv_.notify_all();
    return std::make_unique<Handle>(typename Handle::Private{}, this->shared_from_this());
  }

  /// Releases the broker's own reference. Later calls do nothing.
  void close() {
    if (closed_.exchange(true)) {
      return;
    }
    post_control(-1);
  }

  [[nodiscard]] std::int64_t references() const { return references_.load(); }

  [[nodiscard]] std::string last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
  }

  [[nodiscard]] bool dead() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dead_;
  }

  [[nodiscard]] const std::string &service() const { return service_; }

private:
  struct Job {
    explicit Job(Request req) : request(std::move(req)) {}

    Request request;
    std::promise<common::Result<Response>> reply;
    std::atomic<bool> abandoned{false};
  };

  void post_control(const int delta) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      controls_.push_back(delta);
    }
    cv_.notify_all();
  }

  void set_error(const std::string &error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
  }

  common::Result<Response> submit(const Request &request) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + options_.request_timeout;

    auto job = std::make_shared<Job>(request);
    auto reply = job->reply.get_future();

    bool queued = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queued = cv_.wait_until(lock, deadline, [this]() { return pending_ == nullptr || dead_; });
      if (queued && !dead_) {
        pending_ = job;
      } else {
        queued = false;
      }
    }

    if (queued) {
      cv_.notify_all();
      if (reply.wait_until(deadline) == std::future_status::ready) {
        return reply.get();
      }
      job->abandoned.store(true);
      std::lock_guard<std::mutex> lock(mutex_);
      if (pending_ == job) {
        pending_.reset();
      }
    }

    auto error = last_error();
    if (error.empty()) {
      error = service_ + " server is a bit sluggish right now. Please try again soon.";
    }
    return common::Result<Response>::failure(error);
  }

  // Applies queued reference changes. Caller holds mutex_.
  void drain_controls(std::int64_t &refs) {
    while (!controls_.empty()) {
      refs += controls_.front();
      controls_.pop_front();
    }
    references_.store(refs);
    observability::record_broker_references(service_, refs);
  }

  void loop() {
    using Clock = std::chrono::steady_clock;
    std::int64_t refs = 1;
    references_.store(refs);

    while (true) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_controls(refs);
        if (refs <= 0) {
          dead_ = true;
          if (pending_ != nullptr) {
            pending_->reply.set_value(
                common::Result<Response>::failure(service_ + " connection already closed"));
            pending_.reset();
          }
          break;
        }
      }

      auto dialed = dialer_();
      if (!dialed.ok()) {
        std::cerr << "[broker] " << service_ << " dial failed: " << dialed.error() << "\n";
        set_error(dialed.error());
        observability::record_broker_state(service_, false, dialed.error());
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, options_.redial_delay, [this]() { return !controls_.empty(); });
        continue;
      }

      std::unique_ptr<Connection> connection = std::move(dialed.value());
      set_error("");
      observability::record_broker_state(service_, true);

      common::Status failure = common::Status::success();
      auto last_activity = Clock::now();
      while (failure.ok()) {
        std::shared_ptr<Job> job;
        {
          std::unique_lock<std::mutex> lock(mutex_);
          cv_.wait_until(lock, last_activity + options_.keepalive_interval,
                         [this]() { return !controls_.empty() || pending_ != nullptr; });
          if (!controls_.empty()) {
            drain_controls(refs);
            if (refs <= 0) {
              break;
            }
            continue;
          }
          job = std::move(pending_);
          pending_.reset();
        }

        if (job != nullptr) {
          cv_.notify_all();
          if (job->abandoned.load()) {
            continue;
          }
          auto result = connection->perform(job->request);
          if (!result.ok()) {
            failure = common::Status::error(result.error());
          } else if (connection->broken()) {
            failure = common::Status::error(service_ + " connection lost");
          }
          job->reply.set_value(std::move(result));
          last_activity = Clock::now();
          continue;
        }

        if (Clock::now() >= last_activity + options_.keepalive_interval) {
          failure = connection->ping();
          last_activity = Clock::now();
        }
      }

      if (!failure.ok()) {
        std::cerr << "[broker] " << service_ << " connection failed: " << failure.error() << "\n";
        set_error(failure.error());
        observability::record_broker_state(service_, false, failure.error());
      }
      connection->close();
    }

    cv_.notify_all();
  }

  const std::string service_;
  Dialer dialer_;
  const BrokerOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<int> controls_;
  std::shared_ptr<Job> pending_;
  bool dead_ = false;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  std::atomic<std::int64_t> references_{0};
  std::atomic<bool> closed_{false};
  std::thread thread_;
};

} // namespace switchboard::broker
