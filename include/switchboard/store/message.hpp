#pragma once

#include "switchboard/common/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace switchboard::store {

enum class Lane : int {
  Incoming = 1,
  Outgoing = 2,
};

[[nodiscard]] std::string lane_name(Lane lane);

struct Message {
  std::int64_t id = 0;
  std::string nonce;
  Lane lane = Lane::Incoming;
  /// Unix milliseconds.
  std::int64_t time = 0;
  std::string account;
  std::string channel;
  std::string nick;
  std::string user;
  std::string host;
  std::string command;
  std::string params;
  std::string text;
};

struct ChannelInfo {
  std::string account;
  std::string name;
  std::string key;
};

struct AccountInfo {
  std::string name;
  std::string kind;
  std::string endpoint;
  std::string host;
  bool tls = false;
  bool tls_insecure = false;
  std::string nick;
  std::string identity;
  std::string password;
  std::int64_t last_id = 0;
  /// False until the account was first activated; last_id is 0 then.
  bool cursor_set = false;
  std::vector<ChannelInfo> channels;
};

inline constexpr const char *ACK_PREFIX = "sent:";

/// Text of the PONG a client emits once the outgoing message `id` left the wire.
[[nodiscard]] std::string ack_text(std::int64_t id);

/// Id carried by a "sent:<id>" acknowledgement; fails unless the id is a
/// positive decimal integer.
[[nodiscard]] common::Result<std::int64_t> parse_ack(const std::string &text);

/// Account kind with the empty default resolved.
[[nodiscard]] std::string effective_kind(const AccountInfo &info);

/// Outgoing command with the empty default resolved.
[[nodiscard]] std::string effective_command(const Message &message);

} // namespace switchboard::store
