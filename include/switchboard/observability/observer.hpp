#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace switchboard::observability {

struct AccountStartedEvent {
  std::string account;
  std::string kind;
};

struct AccountStoppedEvent {
  std::string account;
  bool clean = true;
};

struct AccountUpdatedEvent {
  std::string account;
};

struct MessageStoredEvent {
  std::string account;
  std::string lane;
};

struct MessageDeliveredEvent {
  std::string account;
  std::int64_t id = 0;
};

struct CursorAdvancedEvent {
  std::string account;
  std::int64_t id = 0;
};

struct RefreshCompletedEvent {
  std::uint64_t good_accounts = 0;
};

struct BrokerStateEvent {
  std::string service;
  bool up = false;
  std::string error;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<AccountStartedEvent, AccountStoppedEvent, AccountUpdatedEvent,
                 MessageStoredEvent, MessageDeliveredEvent, CursorAdvancedEvent,
                 RefreshCompletedEvent, BrokerStateEvent, ErrorEvent>;

struct ActiveAccountsMetric {
  std::uint64_t count = 0;
};

/// Time between a message being enqueued and its handoff to the client.
struct DeliveryLagMetric {
  std::chrono::milliseconds lag{0};
};

struct BrokerReferencesMetric {
  std::string service;
  std::int64_t references = 0;
};

using ObserverMetric =
    std::variant<ActiveAccountsMetric, DeliveryLagMetric, BrokerReferencesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace switchboard::observability
