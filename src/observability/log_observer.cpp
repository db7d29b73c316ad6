#include "switchboard/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace switchboard::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AccountStartedEvent>) {
          log_line("INFO", "account.start name=" + evt.account + " kind=" + evt.kind);
        } else if constexpr (std::is_same_v<T, AccountStoppedEvent>) {
          log_line("INFO", "account.stop name=" + evt.account +
                               " clean=" + (evt.clean ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, AccountUpdatedEvent>) {
          log_line("DEBUG", "account.update name=" + evt.account);
        } else if constexpr (std::is_same_v<T, MessageStoredEvent>) {
          log_line("DEBUG", "message.stored account=" + evt.account + " lane=" + evt.lane);
        } else if constexpr (std::is_same_v<T, MessageDeliveredEvent>) {
          log_line("DEBUG",
                   "message.delivered account=" + evt.account + " id=" + std::to_string(evt.id));
        } else if constexpr (std::is_same_v<T, CursorAdvancedEvent>) {
          log_line("DEBUG", "cursor.advance account=" + evt.account + " id=" + std::to_string(evt.id));
        } else if constexpr (std::is_same_v<T, RefreshCompletedEvent>) {
          log_line("DEBUG", "refresh.done accounts=" + std::to_string(evt.good_accounts));
        } else if constexpr (std::is_same_v<T, BrokerStateEvent>) {
          if (evt.up) {
            log_line("INFO", "broker.up service=" + evt.service);
          } else {
            log_line("WARN", "broker.down service=" + evt.service + " error=" + evt.error);
          }
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveAccountsMetric>) {
          log_line("DEBUG", "metric.active_accounts=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, DeliveryLagMetric>) {
          log_line("DEBUG", "metric.delivery_lag_ms=" + std::to_string(m.lag.count()));
        } else if constexpr (std::is_same_v<T, BrokerReferencesMetric>) {
          log_line("DEBUG",
                   "metric.broker_references service=" + m.service + " refs=" +
                       std::to_string(m.references));
        }
      },
      metric);
}

} // namespace switchboard::observability
