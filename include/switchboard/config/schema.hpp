#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace switchboard::config {

struct DatabaseConfig {
  std::string path = "~/.switchboard/switchboard.db";
  std::int64_t busy_timeout_ms = 5000;
};

struct AccountsConfig {
  /// std::nullopt handles every account; an empty list handles none.
  std::optional<std::vector<std::string>> allow;
  std::int64_t refresh_interval_ms = 3000;
  std::int64_t poll_delay_ms = 100;
  std::string default_nick = "switchboard";
  std::size_t incoming_capacity = 16;
  std::int64_t network_timeout_ms = 15'000;
};

struct DirectoryConfig {
  std::string url;
  std::string base_dn;
  std::string bind_dn;
  std::string bind_pass;
  std::int64_t request_timeout_ms = 5000;
  std::int64_t redial_delay_ms = 5000;
  std::int64_t keepalive_interval_ms = 5000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  DatabaseConfig database;
  AccountsConfig accounts;
  DirectoryConfig directory;
  ObservabilityConfig observability;
};

} // namespace switchboard::config
