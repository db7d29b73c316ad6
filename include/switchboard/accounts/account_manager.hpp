#pragma once

#include "switchboard/accounts/account_client.hpp"
#include "switchboard/accounts/client_registry.hpp"
#include "switchboard/accounts/tailer.hpp"
#include "switchboard/common/channel.hpp"
#include "switchboard/common/lifecycle.hpp"
#include "switchboard/config/schema.hpp"
#include "switchboard/store/message_store.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace switchboard::accounts {

enum class ManagerState {
  Idle,
  Running,
  Stopping,
  Stopped,
};

/// Keeps one client (and its tailer) running for every configured account,
/// persists what the clients receive, and advances account cursors as the
/// clients acknowledge sent messages.
class AccountManager {
public:
  AccountManager(config::AccountsConfig config, store::IMessageStore &store,
                 const ClientRegistry &registry);
  ~AccountManager();

  AccountManager(const AccountManager &) = delete;
  AccountManager &operator=(const AccountManager &) = delete;

  [[nodiscard]] common::Status start();

  /// Reloads the account configuration and reconciles the running clients.
  /// Blocks until the pass finished.
  [[nodiscard]] common::Status refresh();

  /// Stops every client, draining their incoming traffic meanwhile. Returns
  /// the error that brought the manager down, if any.
  [[nodiscard]] common::Status stop();

  /// Brings the manager down with an error.
  void kill(const std::string &error);

  [[nodiscard]] ManagerState state() const;
  [[nodiscard]] std::stop_token dying() const { return lifecycle_.token(); }
  [[nodiscard]] common::Status reason() const { return lifecycle_.reason(); }

  /// Names of the accounts with a running client, sorted.
  [[nodiscard]] std::vector<std::string> active_accounts() const;

private:
  struct RefreshRequest {
    std::promise<common::Status> done;
  };
  using InboxItem = std::variant<store::Message, std::shared_ptr<RefreshRequest>>;

  class Inbox final : public IncomingQueue {
  public:
    explicit Inbox(common::Channel<InboxItem> &channel) : channel_(channel) {}
    [[nodiscard]] bool push(store::Message message, std::stop_token stop) override;

  private:
    common::Channel<InboxItem> &channel_;
  };

  struct Entry {
    std::unique_ptr<IAccountClient> client;
    std::unique_ptr<Tailer> tailer;
  };

  void loop();
  void die();
  void dispatch(InboxItem item);
  void handle_refresh();
  void handle_incoming(const store::Message &message);
  [[nodiscard]] bool account_on(const std::string &name) const;
  [[nodiscard]] bool handles_accounts() const;
  void stop_entry(const std::string &name, Entry &entry);
  void publish_active();

  const config::AccountsConfig config_;
  store::IMessageStore &store_;
  const ClientRegistry &registry_;

  common::Lifecycle lifecycle_;
  common::Channel<InboxItem> inbox_;
  Inbox incoming_;

  // Owned by the loop thread.
  std::map<std::string, Entry> clients_;

  mutable std::mutex active_mutex_;
  std::vector<std::string> active_;

  mutable std::mutex thread_mutex_;
  bool started_ = false;
  std::thread thread_;
};

} // namespace switchboard::accounts
