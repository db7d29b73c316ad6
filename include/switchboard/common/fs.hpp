#pragma once

#include "switchboard/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace switchboard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_csv(const std::string &value);
[[nodiscard]] std::string join(const std::vector<std::string> &values, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Cryptographically random bytes, hex encoded (2 chars per byte).
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Milliseconds since the unix epoch.
[[nodiscard]] std::int64_t unix_millis();

} // namespace switchboard::common
