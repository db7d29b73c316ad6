#include "switchboard/accounts/account_manager.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <set>
#include <system_error>

namespace switchboard::accounts {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds DRAIN_POLL{20};
constexpr std::chrono::milliseconds REFRESH_POLL{100};

void join_thread(std::thread &thread) {
  if (thread.joinable()) {
    try {
      thread.join();
    } catch (const std::system_error &err) {
      std::cerr << "[accounts] join failed: " << err.what() << "\n";
    }
  }
}

} // namespace

bool AccountManager::Inbox::push(store::Message message, std::stop_token stop) {
  return channel_.send(InboxItem(std::in_place_type<store::Message>, std::move(message)),
                       std::move(stop));
}

AccountManager::AccountManager(config::AccountsConfig config, store::IMessageStore &store,
                               const ClientRegistry &registry)
    : config_(std::move(config)), store_(store), registry_(registry),
      inbox_(config_.incoming_capacity), incoming_(inbox_) {}

AccountManager::~AccountManager() {
  if (state() == ManagerState::Stopped) {
    return;
  }
  const auto status = stop();
  if (!status.ok()) {
    std::cerr << "[accounts] account manager stopped with error: " << status.error() << "\n";
  }
}

common::Status AccountManager::start() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (started_) {
    return common::Status::error("account manager already started");
  }
  if (!lifecycle_.alive()) {
    return common::Status::error("account manager was stopped");
  }
  std::cerr << "[accounts] starting account manager\n";
  started_ = true;
  thread_ = std::thread([this]() { loop(); });
  return common::Status::success();
}

common::Status AccountManager::stop() {
  std::cerr << "[accounts] stop requested, waiting\n";
  lifecycle_.kill();
  {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (started_) {
      join_thread(thread_);
    } else {
      lifecycle_.mark_dead();
    }
  }

  auto status = lifecycle_.reason();
  std::cerr << "[accounts] account manager stopped ("
            << (status.ok() ? std::string("clean") : status.error()) << ")\n";
  return status;
}

void AccountManager::kill(const std::string &error) {
  observability::record_error("accounts", error);
  lifecycle_.kill(error);
}

ManagerState AccountManager::state() const {
  if (lifecycle_.dead()) {
    return ManagerState::Stopped;
  }
  if (!lifecycle_.alive()) {
    return ManagerState::Stopping;
  }
  std::lock_guard<std::mutex> lock(thread_mutex_);
  return started_ ? ManagerState::Running : ManagerState::Idle;
}

std::vector<std::string> AccountManager::active_accounts() const {
  std::lock_guard<std::mutex> lock(active_mutex_);
  return active_;
}

common::Status AccountManager::refresh() {
  if (state() != ManagerState::Running) {
    return common::Status::error("account manager is not running");
  }

  auto request = std::make_shared<RefreshRequest>();
  auto done = request->done.get_future();
  if (!inbox_.send(InboxItem(std::in_place_type<std::shared_ptr<RefreshRequest>>, request),
                   lifecycle_.token())) {
    return common::Status::error("account manager is not running");
  }

  while (done.wait_for(REFRESH_POLL) != std::future_status::ready) {
    if (lifecycle_.dead() && done.wait_for(std::chrono::milliseconds(0)) !=
                                 std::future_status::ready) {
      return common::Status::error("account manager stopped before the refresh completed");
    }
  }
  return done.get();
}

bool AccountManager::handles_accounts() const {
  return !(config_.allow.has_value() && config_.allow->empty());
}

bool AccountManager::account_on(const std::string &name) const {
  if (!config_.allow.has_value()) {
    return true;
  }
  return std::find(config_.allow->begin(), config_.allow->end(), name) != config_.allow->end();
}

void AccountManager::loop() {
  const auto token = lifecycle_.token();
  const std::chrono::milliseconds interval(config_.refresh_interval_ms);
  std::optional<Clock::time_point> next_refresh;

  if (handles_accounts()) {
    handle_refresh();
    if (interval.count() > 0) {
      next_refresh = Clock::now() + interval;
    }
  } else {
    std::cerr << "[accounts] account allow-list is empty, no accounts will be handled\n";
  }

  while (lifecycle_.alive()) {
    auto item = inbox_.receive(token, next_refresh);
    if (item.has_value()) {
      dispatch(std::move(*item));
      continue;
    }
    if (lifecycle_.alive() && next_refresh.has_value() && Clock::now() >= *next_refresh) {
      handle_refresh();
      next_refresh = Clock::now() + interval;
    }
  }

  die();
  lifecycle_.mark_dead();
}

void AccountManager::dispatch(InboxItem item) {
  if (auto *message = std::get_if<store::Message>(&item); message != nullptr) {
    handle_incoming(*message);
    return;
  }

  auto &request = std::get<std::shared_ptr<RefreshRequest>>(item);
  if (!lifecycle_.alive()) {
    request->done.set_value(common::Status::error("account manager is stopping"));
    return;
  }
  if (handles_accounts()) {
    handle_refresh();
  }
  request->done.set_value(common::Status::success());
}

void AccountManager::die() {
  std::cerr << "[accounts] stopping " << clients_.size() << " account clients\n";

  std::atomic<std::size_t> pending = clients_.size();
  std::vector<std::thread> stoppers;
  stoppers.reserve(clients_.size());
  for (auto &[name, entry] : clients_) {
    IAccountClient *client = entry.client.get();
    stoppers.emplace_back([client, name = name, &pending]() {
      const auto status = client->stop();
      if (!status.ok()) {
        std::cerr << "[accounts] [" << name << "] client stopped with error: " << status.error()
                  << "\n";
      }
      observability::record_account_stopped(name, status.ok());
      pending.fetch_sub(1);
    });
  }

  // Clients blocked pushing into the inbox can only finish if someone keeps
  // receiving, so keep handling their traffic until all of them are down.
  while (pending.load() > 0) {
    auto item = inbox_.receive({}, Clock::now() + DRAIN_POLL);
    if (item.has_value()) {
      dispatch(std::move(*item));
    }
  }

  for (auto &stopper : stoppers) {
    join_thread(stopper);
  }
  for (auto &[name, entry] : clients_) {
    (void)name;
    entry.tailer->join();
  }
  clients_.clear();

  while (auto item = inbox_.try_receive()) {
    dispatch(std::move(*item));
  }
  publish_active();
}

void AccountManager::stop_entry(const std::string &name, Entry &entry) {
  const auto status = entry.client->stop();
  if (!status.ok()) {
    std::cerr << "[accounts] [" << name << "] client stopped with error: " << status.error()
              << "\n";
  }
  entry.tailer->join();
  observability::record_account_stopped(name, status.ok());
}

void AccountManager::handle_refresh() {
  auto snapshot = store_.read_account_config();
  if (!snapshot.ok()) {
    std::cerr << "[accounts] cannot fetch account information: " << snapshot.error() << "\n";
    observability::record_error("accounts", snapshot.error());
    return;
  }
  auto infos = std::move(snapshot.value());

  std::set<std::string> good;
  for (const auto &info : infos) {
    if (account_on(info.name)) {
      good.insert(info.name);
    }
  }

  // Drop clients for dead or deleted accounts.
  for (auto it = clients_.begin(); it != clients_.end();) {
    const bool dying = it->second.client->dying().stop_requested();
    if (!dying && good.contains(it->first)) {
      ++it;
      continue;
    }
    stop_entry(it->first, it->second);
    it = clients_.erase(it);
  }

  // Bring new clients up and update existing ones.
  for (auto &info : infos) {
    if (!good.contains(info.name)) {
      continue;
    }
    if (info.nick.empty()) {
      info.nick = config_.default_nick;
    }

    if (const auto it = clients_.find(info.name); it != clients_.end()) {
      it->second.client->update_info(info);
      observability::record_account_updated(info.name);
      continue;
    }

    // A fresh account starts at the end of the log instead of replaying it.
    // The starting point is stored even on an empty log, so a later start
    // delivers whatever was queued in between.
    if (!info.cursor_set) {
      const auto max_id = store_.max_message_id();
      if (!max_id.ok()) {
        std::cerr << "[accounts] [" << info.name
                  << "] cannot obtain initial message id: " << max_id.error() << "\n";
        observability::record_error("accounts", max_id.error());
        continue;
      }
      info.last_id = max_id.value();
      if (auto status = store_.update_cursor(info.name, info.last_id); !status.ok()) {
        std::cerr << "[accounts] [" << info.name
                  << "] cannot store initial message id: " << status.error() << "\n";
        observability::record_error("accounts", status.error());
        continue;
      }
      info.cursor_set = true;
    }

    auto client = registry_.create(
        info, ClientContext{.incoming = incoming_,
                            .network_timeout = std::chrono::milliseconds(config_.network_timeout_ms)});
    if (client == nullptr) {
      std::cerr << "[accounts] [" << info.name
                << "] unsupported account kind: " << store::effective_kind(info) << "\n";
      continue;
    }

    Entry entry;
    entry.client = std::move(client);
    entry.tailer = std::make_unique<Tailer>(
        *entry.client, store_, lifecycle_.token(),
        [this](const std::string &error) { kill(error); },
        TailerOptions{.poll_delay = std::chrono::milliseconds(config_.poll_delay_ms)});
    observability::record_account_started(info.name, store::effective_kind(info));
    clients_.emplace(info.name, std::move(entry));
  }

  publish_active();
  observability::record_refresh_completed(good.size());
}

void AccountManager::handle_incoming(const store::Message &message) {
  if (message.command == "PONG") {
    if (!common::starts_with(message.text, store::ACK_PREFIX)) {
      return;
    }
    const auto id = store::parse_ack(message.text);
    if (!id.ok()) {
      std::cerr << "[accounts] [" << message.account
                << "] ignoring acknowledgement: " << id.error() << "\n";
      return;
    }
    if (auto status = store_.update_cursor(message.account, id.value()); !status.ok()) {
      std::cerr << "[accounts] cannot update account with last sent message id: "
                << status.error() << "\n";
      kill(status.error());
      return;
    }
    observability::record_cursor_advanced(message.account, id.value());
    return;
  }

  const auto outcome = store_.insert(message, store::Lane::Incoming);
  if (!outcome.ok()) {
    std::cerr << "[accounts] cannot insert incoming message: " << outcome.error() << "\n";
    kill(outcome.error());
    return;
  }
  if (outcome.value().duplicate()) {
    std::cerr << "[accounts] [" << message.account << "] dropping duplicate incoming message\n";
    return;
  }
  observability::record_message_stored(message.account, store::lane_name(store::Lane::Incoming));
}

void AccountManager::publish_active() {
  std::vector<std::string> names;
  names.reserve(clients_.size());
  for (const auto &[name, entry] : clients_) {
    (void)entry;
    names.push_back(name);
  }
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = names;
  }
  observability::record_active_accounts(names.size());
}

} // namespace switchboard::accounts
