#include "switchboard/observability/global.hpp"

#include <mutex>

namespace switchboard::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_account_started(const std::string &account, const std::string &kind) {
  record_event(AccountStartedEvent{.account = account, .kind = kind});
}

void record_account_stopped(const std::string &account, const bool clean) {
  record_event(AccountStoppedEvent{.account = account, .clean = clean});
}

void record_account_updated(const std::string &account) {
  record_event(AccountUpdatedEvent{.account = account});
}

void record_message_stored(const std::string &account, const std::string &lane) {
  record_event(MessageStoredEvent{.account = account, .lane = lane});
}

void record_message_delivered(const std::string &account, const std::int64_t id,
                              const std::chrono::milliseconds lag) {
  record_event(MessageDeliveredEvent{.account = account, .id = id});
  record_metric(DeliveryLagMetric{.lag = lag});
}

void record_cursor_advanced(const std::string &account, const std::int64_t id) {
  record_event(CursorAdvancedEvent{.account = account, .id = id});
}

void record_refresh_completed(const std::uint64_t good_accounts) {
  record_event(RefreshCompletedEvent{.good_accounts = good_accounts});
}

void record_broker_state(const std::string &service, const bool up, const std::string &error) {
  record_event(BrokerStateEvent{.service = service, .up = up, .error = error});
}

void record_broker_references(const std::string &service, const std::int64_t references) {
  record_metric(BrokerReferencesMetric{.service = service, .references = references});
}

void record_active_accounts(const std::uint64_t count) {
  record_metric(ActiveAccountsMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace switchboard::observability
