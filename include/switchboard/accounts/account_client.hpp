#pragma once

#include "switchboard/common/channel.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/store/message.hpp"

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>

namespace switchboard::accounts {

using OutgoingQueue = common::Channel<store::Message>;

/// Where clients deliver inbound traffic, acknowledgements included.
class IncomingQueue {
public:
  virtual ~IncomingQueue() = default;

  /// Blocks while the queue is full. Returns false once `stop` fires first.
  [[nodiscard]] virtual bool push(store::Message message, std::stop_token stop) = 0;
};

struct ClientContext {
  IncomingQueue &incoming;
  std::chrono::milliseconds network_timeout{15'000};
};

/// One live connection to a chat network on behalf of a single account.
class IAccountClient {
public:
  virtual ~IAccountClient() = default;

  [[nodiscard]] virtual bool alive() const = 0;

  /// Stops the client and waits for it. Success for a requested stop,
  /// otherwise the error that killed the client.
  [[nodiscard]] virtual common::Status stop() = 0;

  [[nodiscard]] virtual std::string account_name() const = 0;

  /// Stopped as soon as the client starts shutting down.
  [[nodiscard]] virtual std::stop_token dying() const = 0;

  /// Messages to be sent on the network, in the order they must go out.
  [[nodiscard]] virtual OutgoingQueue &outgoing() = 0;

  /// Cursor the client was started with.
  [[nodiscard]] virtual std::int64_t last_id() const = 0;

  /// Replaces everything but the account name, which must not change.
  virtual void update_info(const store::AccountInfo &info) = 0;
};

} // namespace switchboard::accounts
