#include "switchboard/store/message.hpp"

#include "switchboard/common/fs.hpp"

#include <charconv>

namespace switchboard::store {

std::string lane_name(const Lane lane) {
  switch (lane) {
  case Lane::Incoming:
    return "incoming";
  case Lane::Outgoing:
    return "outgoing";
  }
  return "unknown";
}

std::string ack_text(const std::int64_t id) { return ACK_PREFIX + std::to_string(id); }

common::Result<std::int64_t> parse_ack(const std::string &text) {
  if (!common::starts_with(text, ACK_PREFIX)) {
    return common::Result<std::int64_t>::failure("not an acknowledgement: " + text);
  }
  const std::string digits = text.substr(std::char_traits<char>::length(ACK_PREFIX));
  if (digits.empty() || digits.front() == '+' || digits.front() == '-') {
    return common::Result<std::int64_t>::failure("malformed acknowledgement: " + text);
  }

  std::int64_t id = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, id);
  if (ec != std::errc() || ptr != last || id <= 0) {
    return common::Result<std::int64_t>::failure("malformed acknowledgement: " + text);
  }
  return common::Result<std::int64_t>::success(id);
}

std::string effective_kind(const AccountInfo &info) {
  return info.kind.empty() ? std::string("irc") : info.kind;
}

std::string effective_command(const Message &message) {
  return message.command.empty() ? std::string("PRIVMSG") : message.command;
}

} // namespace switchboard::store
