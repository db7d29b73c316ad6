#include "switchboard/common/json_util.hpp"

#include <cctype>
#include <sstream>

namespace switchboard::common {

namespace {

std::size_t find_key(const std::string &json, const std::string &key) {
  return json.find("\"" + key + "\"");
}

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

// Position of the first non-blank character after "field":, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const auto key_pos = find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return std::string::npos;
  }
  const std::size_t pos = skip_ws(json, colon + 1);
  return pos < json.size() ? pos : std::string::npos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::string json_object(const std::vector<std::pair<std::string, std::string>> &fields) {
  std::ostringstream out;
  out << '{';
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << '"' << json_escape(fields[i].first) << "\":\"" << json_escape(fields[i].second)
        << '"';
  }
  out << '}';
  return out.str();
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  if (json.compare(pos, 4, "true") == 0) {
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    return false;
  }
  return std::nullopt;
}

} // namespace switchboard::common
