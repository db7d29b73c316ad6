#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace switchboard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Build a flat JSON object from string fields, in the given order.
[[nodiscard]] std::string
json_object(const std::vector<std::pair<std::string, std::string>> &fields);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a literal true/false field; nullopt when absent or not a boolean.
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json,
                                                const std::string &field);

} // namespace switchboard::common
