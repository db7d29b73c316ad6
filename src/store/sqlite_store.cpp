#include "switchboard/store/sqlite_store.hpp"

#include "switchboard/common/fs.hpp"

#include <iostream>
#include <map>
#include <memory>

namespace switchboard::store {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

common::Result<StatementPtr> prepare(sqlite3 *db, const char *sql) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return common::Result<StatementPtr>::failure(sqlite3_errmsg(db));
  }
  return common::Result<StatementPtr>::success(StatementPtr(stmt, &sqlite3_finalize));
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = sqlite3_column_text(stmt, index);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

Message row_to_message(sqlite3_stmt *stmt) {
  Message message;
  message.id = sqlite3_column_int64(stmt, 0);
  message.nonce = column_text(stmt, 1);
  message.lane = static_cast<Lane>(sqlite3_column_int(stmt, 2));
  message.time = sqlite3_column_int64(stmt, 3);
  message.account = column_text(stmt, 4);
  message.channel = column_text(stmt, 5);
  message.nick = column_text(stmt, 6);
  message.user = column_text(stmt, 7);
  message.host = column_text(stmt, 8);
  message.command = column_text(stmt, 9);
  message.params = column_text(stmt, 10);
  message.text = column_text(stmt, 11);
  return message;
}

// Version 1.0 of the schema. Later patches are appended to schema_patches().
const char *SCHEMA_1_0 = R"(
CREATE TABLE option (
  name TEXT NOT NULL PRIMARY KEY,
  value
);
INSERT INTO option VALUES ('schema_major', NULL);
INSERT INTO option VALUES ('schema_minor', NULL);
CREATE TABLE account (
  name TEXT NOT NULL PRIMARY KEY,
  kind TEXT NOT NULL DEFAULT '',
  endpoint TEXT NOT NULL DEFAULT '',
  host TEXT NOT NULL DEFAULT '',
  tls BOOLEAN NOT NULL DEFAULT FALSE,
  tls_insecure BOOLEAN NOT NULL DEFAULT FALSE,
  nick TEXT NOT NULL DEFAULT '',
  identity TEXT NOT NULL DEFAULT '',
  password TEXT NOT NULL DEFAULT '',
  last_id INTEGER
);
CREATE TABLE channel (
  account TEXT NOT NULL REFERENCES account(name) ON UPDATE CASCADE ON DELETE CASCADE,
  name TEXT NOT NULL DEFAULT '',
  key TEXT NOT NULL DEFAULT '',
  PRIMARY KEY (account, name)
);
CREATE TABLE message (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  nonce TEXT NOT NULL DEFAULT (hex(randomblob(16))),
  lane INTEGER NOT NULL DEFAULT 0,
  time INTEGER NOT NULL DEFAULT 0,
  account TEXT NOT NULL DEFAULT '',
  channel TEXT NOT NULL DEFAULT '',
  nick TEXT NOT NULL DEFAULT '',
  user TEXT NOT NULL DEFAULT '',
  host TEXT NOT NULL DEFAULT '',
  command TEXT NOT NULL DEFAULT '',
  params TEXT NOT NULL DEFAULT '',
  text TEXT NOT NULL DEFAULT '',
  UNIQUE (nonce, lane)
);
CREATE INDEX message_account_lane ON message (account, lane, id);
)";

struct SchemaPatch {
  int major;
  int minor;
  const char *sql;
};

const std::vector<SchemaPatch> &schema_patches() {
  static const std::vector<SchemaPatch> patches = {
      {.major = 1, .minor = 0, .sql = SCHEMA_1_0},
  };
  return patches;
}

} // namespace

SqliteMessageStore::SqliteMessageStore(std::filesystem::path db_path, const int busy_timeout_ms)
    : db_path_(std::move(db_path)) {
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      std::cerr << "[store] cannot create " << db_path_.parent_path().string() << ": "
                << ec.message() << "\n";
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    status_ = common::Status::error("cannot open database " + db_path_.string() + ": " +
                                    (db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_)));
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  sqlite3_busy_timeout(db_, busy_timeout_ms);
  status_ = init_schema();
  if (!status_.ok()) {
    std::cerr << "[store] " << status_.error() << "\n";
  }
}

SqliteMessageStore::~SqliteMessageStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteMessageStore::exec(const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? sqlite3_errmsg(db_) : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

common::Status SqliteMessageStore::init_schema() {
  auto status = exec("PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status.with_context("enabling foreign keys");
  }
  // Journal mode cannot change inside a transaction.
  status = exec("PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status.with_context("enabling WAL");
  }

  status = exec("BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  const auto fail = [this](const common::Status &error) {
    (void)exec("ROLLBACK;");
    return error;
  };

  int major = 0;
  int minor = 0;
  {
    auto stmt = prepare(db_, "SELECT 1 FROM sqlite_master WHERE type='table' AND name='option'");
    if (!stmt.ok()) {
      return fail(stmt.status());
    }
    if (sqlite3_step(stmt.value().get()) == SQLITE_ROW) {
      auto version = prepare(db_, "SELECT (SELECT value FROM option WHERE name='schema_major'), "
                                  "(SELECT value FROM option WHERE name='schema_minor')");
      if (!version.ok()) {
        return fail(version.status());
      }
      auto *row = version.value().get();
      if (sqlite3_step(row) != SQLITE_ROW || sqlite3_column_type(row, 0) == SQLITE_NULL ||
          sqlite3_column_type(row, 1) == SQLITE_NULL) {
        return fail(common::Status::error("database lacks schema_major and schema_minor"));
      }
      major = sqlite3_column_int(row, 0);
      minor = sqlite3_column_int(row, 1);
    }
  }

  if (major > SCHEMA_MAJOR || (major == SCHEMA_MAJOR && minor > SCHEMA_MINOR)) {
    return fail(common::Status::error(
        "database schema " + std::to_string(major) + "." + std::to_string(minor) +
        " is newer than supported " + std::to_string(SCHEMA_MAJOR) + "." +
        std::to_string(SCHEMA_MINOR)));
  }

  for (const auto &patch : schema_patches()) {
    if (patch.major < major || (patch.major == major && patch.minor <= minor)) {
      continue;
    }
    const std::string upgrade = "cannot update database schema version from " +
                                std::to_string(major) + "." + std::to_string(minor) + " to " +
                                std::to_string(patch.major) + "." + std::to_string(patch.minor);
    if (patch.major > major + 1 || (patch.major == major + 1 && patch.minor > 0)) {
      return fail(common::Status::error(upgrade));
    }
    status = exec(patch.sql);
    if (!status.ok()) {
      return fail(status.with_context(upgrade));
    }
    major = patch.major;
    minor = patch.minor;
  }

  {
    auto stmt = prepare(db_, "UPDATE option SET value = ?1 WHERE name = ?2");
    if (!stmt.ok()) {
      return fail(stmt.status());
    }
    for (const auto &[name, value] : {std::pair<const char *, int>{"schema_major", major},
                                      std::pair<const char *, int>{"schema_minor", minor}}) {
      auto *row = stmt.value().get();
      sqlite3_reset(row);
      sqlite3_bind_int(row, 1, value);
      sqlite3_bind_text(row, 2, name, -1, SQLITE_STATIC);
      if (sqlite3_step(row) != SQLITE_DONE) {
        return fail(common::Status::error(sqlite3_errmsg(db_)));
      }
    }
  }

  return exec("COMMIT;");
}

common::Result<InsertOutcome> SqliteMessageStore::insert(const Message &message, const Lane lane) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Result<InsertOutcome>::failure("database is not initialized");
  }

  auto stmt = prepare(db_, "INSERT INTO message (nonce, lane, time, account, channel, nick, user, "
                           "host, command, params, text) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, "
                           "?9, ?10, ?11)");
  if (!stmt.ok()) {
    return common::Result<InsertOutcome>::failure(stmt.error());
  }

  const std::string nonce = message.nonce.empty() ? common::random_hex(16) : message.nonce;
  const std::int64_t time = message.time == 0 ? common::unix_millis() : message.time;
  auto *row = stmt.value().get();
  bind_text(row, 1, nonce);
  sqlite3_bind_int(row, 2, static_cast<int>(lane));
  sqlite3_bind_int64(row, 3, time);
  bind_text(row, 4, message.account);
  bind_text(row, 5, message.channel);
  bind_text(row, 6, message.nick);
  bind_text(row, 7, message.user);
  bind_text(row, 8, message.host);
  bind_text(row, 9, message.command);
  bind_text(row, 10, message.params);
  bind_text(row, 11, message.text);

  const int rc = sqlite3_step(row);
  if (rc == SQLITE_DONE) {
    return common::Result<InsertOutcome>::success(
        InsertOutcome{.kind = InsertOutcome::Kind::Inserted, .id = sqlite3_last_insert_rowid(db_)});
  }
  if (sqlite3_extended_errcode(db_) == SQLITE_CONSTRAINT_UNIQUE) {
    return common::Result<InsertOutcome>::success(
        InsertOutcome{.kind = InsertOutcome::Kind::Duplicate, .id = 0});
  }
  return common::Result<InsertOutcome>::failure("cannot insert " + lane_name(lane) +
                                                " message for account " + message.account + ": " +
                                                sqlite3_errmsg(db_));
}

common::Result<std::vector<Message>> SqliteMessageStore::query(const std::string &account,
                                                               const Lane lane,
                                                               const std::int64_t after_id,
                                                               const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Result<std::vector<Message>>::failure("database is not initialized");
  }

  auto stmt = prepare(db_, "SELECT id, nonce, lane, time, account, channel, nick, user, host, "
                           "command, params, text FROM message WHERE account = ?1 AND lane = ?2 "
                           "AND id > ?3 ORDER BY id LIMIT ?4");
  if (!stmt.ok()) {
    return common::Result<std::vector<Message>>::failure(stmt.error());
  }

  auto *row = stmt.value().get();
  bind_text(row, 1, account);
  sqlite3_bind_int(row, 2, static_cast<int>(lane));
  sqlite3_bind_int64(row, 3, after_id);
  sqlite3_bind_int64(row, 4, static_cast<sqlite3_int64>(limit));

  std::vector<Message> messages;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(row)) == SQLITE_ROW) {
    messages.push_back(row_to_message(row));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Message>>::failure(
        "cannot query " + lane_name(lane) + " messages for account " + account + ": " +
        sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<Message>>::success(std::move(messages));
}

common::Result<std::vector<AccountInfo>> SqliteMessageStore::read_accounts_locked() {
  std::vector<AccountInfo> accounts;
  std::map<std::string, std::size_t> index;
  {
    auto stmt = prepare(db_, "SELECT name, kind, endpoint, host, tls, tls_insecure, nick, "
                             "identity, password, last_id FROM account ORDER BY name");
    if (!stmt.ok()) {
      return common::Result<std::vector<AccountInfo>>::failure(stmt.error());
    }
    auto *row = stmt.value().get();
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(row)) == SQLITE_ROW) {
      AccountInfo info;
      info.name = column_text(row, 0);
      info.kind = column_text(row, 1);
      info.endpoint = column_text(row, 2);
      info.host = column_text(row, 3);
      info.tls = sqlite3_column_int(row, 4) != 0;
      info.tls_insecure = sqlite3_column_int(row, 5) != 0;
      info.nick = column_text(row, 6);
      info.identity = column_text(row, 7);
      info.password = column_text(row, 8);
      info.cursor_set = sqlite3_column_type(row, 9) != SQLITE_NULL;
      info.last_id = info.cursor_set ? sqlite3_column_int64(row, 9) : 0;
      index[info.name] = accounts.size();
      accounts.push_back(std::move(info));
    }
    if (rc != SQLITE_DONE) {
      return common::Result<std::vector<AccountInfo>>::failure(sqlite3_errmsg(db_));
    }
  }

  auto stmt = prepare(db_, "SELECT account, name, key FROM channel ORDER BY account, name");
  if (!stmt.ok()) {
    return common::Result<std::vector<AccountInfo>>::failure(stmt.error());
  }
  auto *row = stmt.value().get();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(row)) == SQLITE_ROW) {
    ChannelInfo channel{
        .account = column_text(row, 0), .name = column_text(row, 1), .key = column_text(row, 2)};
    if (const auto it = index.find(channel.account); it != index.end()) {
      accounts[it->second].channels.push_back(std::move(channel));
    }
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<AccountInfo>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<AccountInfo>>::success(std::move(accounts));
}

common::Result<std::vector<AccountInfo>> SqliteMessageStore::read_account_config() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Result<std::vector<AccountInfo>>::failure("database is not initialized");
  }

  if (auto status = exec("BEGIN;"); !status.ok()) {
    return common::Result<std::vector<AccountInfo>>::failure("cannot read account settings: " +
                                                             status.error());
  }
  auto accounts = read_accounts_locked();
  if (!accounts.ok()) {
    (void)exec("ROLLBACK;");
    return common::Result<std::vector<AccountInfo>>::failure("cannot read account settings: " +
                                                             accounts.error());
  }
  if (auto status = exec("COMMIT;"); !status.ok()) {
    return common::Result<std::vector<AccountInfo>>::failure("cannot read account settings: " +
                                                             status.error());
  }
  return accounts;
}

common::Status SqliteMessageStore::update_cursor(const std::string &account, const std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Status::error("database is not initialized");
  }

  auto stmt = prepare(db_, "UPDATE account SET last_id = ?1 WHERE name = ?2 AND "
                           "(last_id IS NULL OR last_id < ?1)");
  if (!stmt.ok()) {
    return stmt.status();
  }
  auto *row = stmt.value().get();
  sqlite3_bind_int64(row, 1, id);
  bind_text(row, 2, account);
  if (sqlite3_step(row) != SQLITE_DONE) {
    return common::Status::error("cannot update last sent message id for account " + account +
                                 ": " + sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::int64_t> SqliteMessageStore::max_message_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Result<std::int64_t>::failure("database is not initialized");
  }

  auto stmt = prepare(db_, "SELECT COALESCE(MAX(id), 0) FROM message");
  if (!stmt.ok()) {
    return common::Result<std::int64_t>::failure(stmt.error());
  }
  auto *row = stmt.value().get();
  if (sqlite3_step(row) != SQLITE_ROW) {
    return common::Result<std::int64_t>::failure("cannot obtain last message id: " +
                                                 std::string(sqlite3_errmsg(db_)));
  }
  return common::Result<std::int64_t>::success(sqlite3_column_int64(row, 0));
}

common::Status SqliteMessageStore::upsert_account(const AccountInfo &info) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Status::error("database is not initialized");
  }
  if (info.name.empty()) {
    return common::Status::error("account name is required");
  }

  if (auto status = exec("BEGIN IMMEDIATE;"); !status.ok()) {
    return status;
  }
  const auto fail = [this, &info](const std::string &error) {
    (void)exec("ROLLBACK;");
    return common::Status::error("cannot save account " + info.name + ": " + error);
  };

  {
    auto stmt = prepare(
        db_, "INSERT INTO account (name, kind, endpoint, host, tls, tls_insecure, nick, identity, "
             "password) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) ON CONFLICT(name) DO UPDATE SET "
             "kind = excluded.kind, endpoint = excluded.endpoint, host = excluded.host, "
             "tls = excluded.tls, tls_insecure = excluded.tls_insecure, nick = excluded.nick, "
             "identity = excluded.identity, password = excluded.password");
    if (!stmt.ok()) {
      return fail(stmt.error());
    }
    auto *row = stmt.value().get();
    bind_text(row, 1, info.name);
    bind_text(row, 2, info.kind);
    bind_text(row, 3, info.endpoint);
    bind_text(row, 4, info.host);
    sqlite3_bind_int(row, 5, info.tls ? 1 : 0);
    sqlite3_bind_int(row, 6, info.tls_insecure ? 1 : 0);
    bind_text(row, 7, info.nick);
    bind_text(row, 8, info.identity);
    bind_text(row, 9, info.password);
    if (sqlite3_step(row) != SQLITE_DONE) {
      return fail(sqlite3_errmsg(db_));
    }
  }

  {
    auto stmt = prepare(db_, "DELETE FROM channel WHERE account = ?1");
    if (!stmt.ok()) {
      return fail(stmt.error());
    }
    bind_text(stmt.value().get(), 1, info.name);
    if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
      return fail(sqlite3_errmsg(db_));
    }
  }

  auto stmt = prepare(db_, "INSERT INTO channel (account, name, key) VALUES (?1, ?2, ?3)");
  if (!stmt.ok()) {
    return fail(stmt.error());
  }
  auto *row = stmt.value().get();
  for (const auto &channel : info.channels) {
    sqlite3_reset(row);
    bind_text(row, 1, info.name);
    bind_text(row, 2, channel.name);
    bind_text(row, 3, channel.key);
    if (sqlite3_step(row) != SQLITE_DONE) {
      return fail(sqlite3_errmsg(db_));
    }
  }

  return exec("COMMIT;");
}

common::Result<bool> SqliteMessageStore::remove_account(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !status_.ok()) {
    return common::Result<bool>::failure("database is not initialized");
  }

  auto stmt = prepare(db_, "DELETE FROM account WHERE name = ?1");
  if (!stmt.ok()) {
    return common::Result<bool>::failure(stmt.error());
  }
  bind_text(stmt.value().get(), 1, name);
  if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
    return common::Result<bool>::failure("cannot remove account " + name + ": " +
                                         sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status SqliteMessageStore::wipe(const std::filesystem::path &db_path) {
  for (const auto &suffix : {"", "-wal", "-shm"}) {
    std::filesystem::path target = db_path;
    target += suffix;
    std::error_code ec;
    std::filesystem::remove(target, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return common::Status::error("cannot remove " + target.string() + ": " + ec.message());
    }
  }
  return common::Status::success();
}

} // namespace switchboard::store
