#pragma once

#include "switchboard/store/message_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace switchboard::store {

inline constexpr int SCHEMA_MAJOR = 1;
inline constexpr int SCHEMA_MINOR = 0;

class SqliteMessageStore final : public IMessageStore {
public:
  explicit SqliteMessageStore(std::filesystem::path db_path, int busy_timeout_ms = 5000);
  ~SqliteMessageStore() override;

  SqliteMessageStore(const SqliteMessageStore &) = delete;
  SqliteMessageStore &operator=(const SqliteMessageStore &) = delete;

  /// Outcome of opening the database and bringing the schema up to date.
  [[nodiscard]] common::Status status() const { return status_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Result<InsertOutcome> insert(const Message &message, Lane lane) override;
  [[nodiscard]] common::Result<std::vector<Message>>
  query(const std::string &account, Lane lane, std::int64_t after_id, std::size_t limit) override;
  [[nodiscard]] common::Result<std::vector<AccountInfo>> read_account_config() override;
  [[nodiscard]] common::Status update_cursor(const std::string &account, std::int64_t id) override;
  [[nodiscard]] common::Result<std::int64_t> max_message_id() override;

  /// Inserts or updates an account and replaces its channel list. The cursor
  /// of an existing account is kept.
  [[nodiscard]] common::Status upsert_account(const AccountInfo &info);
  [[nodiscard]] common::Result<bool> remove_account(const std::string &name);

  /// Removes the database file and its -wal and -shm companions. Missing
  /// files are not an error.
  [[nodiscard]] static common::Status wipe(const std::filesystem::path &db_path);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status exec(const std::string &sql);
  [[nodiscard]] common::Result<std::vector<AccountInfo>> read_accounts_locked();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  common::Status status_ = common::Status::success();
};

} // namespace switchboard::store
