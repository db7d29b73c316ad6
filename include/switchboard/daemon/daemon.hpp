#pragma once

#include "switchboard/accounts/account_manager.hpp"
#include "switchboard/accounts/client_registry.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"
#include "switchboard/daemon/pid_file.hpp"
#include "switchboard/directory/directory.hpp"
#include "switchboard/net/http_client.hpp"
#include "switchboard/store/sqlite_store.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <stop_token>

namespace switchboard::daemon {

struct DaemonOptions {
  /// Empty means switchboard.pid in the configuration directory.
  std::filesystem::path pid_file;
  /// Empty means a CurlHttpClient.
  std::shared_ptr<net::HttpClient> http;
  /// Transport for the [directory] section. No broker is started without one.
  directory::Dialer directory_dialer;
};

/// Wires the store, the client registry and the account manager together
/// for one process.
class Daemon {
public:
  explicit Daemon(config::Config config);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options = {});
  /// Stops the account manager and returns why it ended.
  [[nodiscard]] common::Status stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }

  /// Stopped when the account manager goes down on its own.
  [[nodiscard]] std::stop_token dying() const;
  [[nodiscard]] accounts::AccountManager *manager() { return manager_.get(); }
  [[nodiscard]] store::SqliteMessageStore *store() { return store_.get(); }
  /// Shared directory connection, null unless a directory is configured and a
  /// dialer was given.
  [[nodiscard]] std::shared_ptr<directory::ManagedDirectory> directory() const { return directory_; }

private:
  void close_directory();

  config::Config config_;
  std::unique_ptr<PidFile> pid_file_;
  std::unique_ptr<store::SqliteMessageStore> store_;
  std::unique_ptr<accounts::ClientRegistry> registry_;
  std::unique_ptr<accounts::AccountManager> manager_;
  std::shared_ptr<directory::ManagedDirectory> directory_;
  std::atomic<bool> running_{false};
};

} // namespace switchboard::daemon
