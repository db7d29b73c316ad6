#pragma once

#include "switchboard/common/result.hpp"
#include "switchboard/store/message.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace switchboard::store {

struct InsertOutcome {
  enum class Kind {
    Inserted,
    Duplicate,
  };

  Kind kind = Kind::Inserted;
  /// Assigned id; 0 for a duplicate.
  std::int64_t id = 0;

  [[nodiscard]] bool duplicate() const { return kind == Kind::Duplicate; }
};

/// Durable message log plus the per-account configuration and cursors.
/// Implementations must be safe to call from several threads at once.
class IMessageStore {
public:
  virtual ~IMessageStore() = default;

  /// A (nonce, lane) pair that already exists is reported as Duplicate, not as
  /// an error. Empty nonces and zero timestamps are filled in.
  [[nodiscard]] virtual common::Result<InsertOutcome> insert(const Message &message,
                                                             Lane lane) = 0;

  /// Messages with id > after_id, ascending, at most `limit` of them.
  [[nodiscard]] virtual common::Result<std::vector<Message>>
  query(const std::string &account, Lane lane, std::int64_t after_id, std::size_t limit) = 0;

  /// Snapshot of all accounts and their channels, read in one transaction.
  [[nodiscard]] virtual common::Result<std::vector<AccountInfo>> read_account_config() = 0;

  /// Forward-only; an id at or below the stored cursor is a no-op. The first
  /// call on an unset cursor always stores, even for id 0.
  [[nodiscard]] virtual common::Status update_cursor(const std::string &account,
                                                     std::int64_t id) = 0;

  [[nodiscard]] virtual common::Result<std::int64_t> max_message_id() = 0;
};

} // namespace switchboard::store
