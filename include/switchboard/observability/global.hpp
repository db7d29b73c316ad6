#pragma once

#include "switchboard/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace switchboard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_account_started(const std::string &account, const std::string &kind);
void record_account_stopped(const std::string &account, bool clean);
void record_account_updated(const std::string &account);
void record_message_stored(const std::string &account, const std::string &lane);
void record_message_delivered(const std::string &account, std::int64_t id,
                              std::chrono::milliseconds lag);
void record_cursor_advanced(const std::string &account, std::int64_t id);
void record_refresh_completed(std::uint64_t good_accounts);
void record_broker_state(const std::string &service, bool up, const std::string &error = "");
void record_broker_references(const std::string &service, std::int64_t references);
void record_active_accounts(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace switchboard::observability
