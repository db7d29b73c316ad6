#pragma once

#include "switchboard/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace switchboard::common {

/// A parsed TOML value. Only the kinds switchboard's configuration uses.
using TomlValue = std::variant<std::string, std::int64_t, bool, std::vector<std::string>>;

/// Flat view of a TOML file: nested tables become dotted keys
/// ("accounts.allow"). Getters return the fallback when the key is missing or
/// holds a different kind.
struct TomlDocument {
  std::map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t get_i64(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

/// Errors name the offending line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace switchboard::common
