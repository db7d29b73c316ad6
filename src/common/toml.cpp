#include "switchboard/common/toml.hpp"

#include <cctype>
#include <charconv>

namespace switchboard::common {

namespace {

bool bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

/// Single pass over the text. Tracks the current table and the line number
/// for error messages.
class TomlReader {
public:
  explicit TomlReader(const std::string &text) : text_(text) {}

  Result<TomlDocument> read() {
    TomlDocument document;
    std::string table;
    while (true) {
      skip_blank_lines();
      if (at_end()) {
        break;
      }
      if (peek() == '[') {
        ++pos_;
        auto name = read_key();
        if (!name.ok()) {
          return Result<TomlDocument>::failure(name.error());
        }
        skip_spaces();
        if (!consume(']')) {
          return fail<TomlDocument>("expected ] after table name");
        }
        table = name.value();
      } else {
        auto key = read_key();
        if (!key.ok()) {
          return Result<TomlDocument>::failure(key.error());
        }
        skip_spaces();
        if (!consume('=')) {
          return fail<TomlDocument>("expected = after key");
        }
        const std::size_t key_line = line_;
        auto value = read_value();
        if (!value.ok()) {
          return Result<TomlDocument>::failure(value.error());
        }
        const std::string full_key = table.empty() ? key.value() : table + "." + key.value();
        if (!document.values.emplace(full_key, std::move(value.value())).second) {
          return Result<TomlDocument>::failure("duplicate key " + full_key + " at line " +
                                               std::to_string(key_line));
        }
      }
      if (!finish_line()) {
        return fail<TomlDocument>("unexpected text after value");
      }
    }
    return Result<TomlDocument>::success(std::move(document));
  }

private:
  template <typename T> Result<T> fail(const std::string &what) const {
    return Result<T>::failure(what + " at line " + std::to_string(line_));
  }

  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  void skip_spaces() {
    while (peek() == ' ' || peek() == '\t') {
      ++pos_;
    }
  }

  void skip_comment() {
    if (peek() != '#') {
      return;
    }
    while (!at_end() && peek() != '\n') {
      ++pos_;
    }
  }

  // Also skips the newlines, comments and padding inside arrays.
  void skip_blank_lines() {
    while (true) {
      skip_spaces();
      skip_comment();
      if (consume('\r')) {
        continue;
      }
      if (!consume('\n')) {
        return;
      }
      ++line_;
    }
  }

  bool finish_line() {
    skip_spaces();
    skip_comment();
    (void)consume('\r');
    if (at_end()) {
      return true;
    }
    if (!consume('\n')) {
      return false;
    }
    ++line_;
    return true;
  }

  // Dotted keys ("a.b") and quoted parts are joined with '.'.
  Result<std::string> read_key() {
    std::string key;
    while (true) {
      skip_spaces();
      std::string part;
      if (peek() == '"') {
        auto quoted = read_string();
        if (!quoted.ok()) {
          return quoted;
        }
        part = quoted.value();
      } else {
        while (bare_key_char(peek())) {
          part.push_back(text_[pos_++]);
        }
        if (part.empty()) {
          return fail<std::string>("missing key");
        }
      }
      key += key.empty() ? part : "." + part;
      skip_spaces();
      if (!consume('.')) {
        return Result<std::string>::success(std::move(key));
      }
    }
  }

  Result<std::string> read_string() {
    if (!consume('"')) {
      return fail<std::string>("expected a string");
    }
    std::string out;
    while (true) {
      if (at_end() || peek() == '\n') {
        return fail<std::string>("unterminated string");
      }
      const char ch = text_[pos_++];
      if (ch == '"') {
        return Result<std::string>::success(std::move(out));
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      switch (at_end() ? '\0' : text_[pos_++]) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        return fail<std::string>("unsupported escape in string");
      }
    }
  }

  Result<TomlValue> read_array() {
    ++pos_;
    std::vector<std::string> items;
    while (true) {
      skip_blank_lines();
      if (consume(']')) {
        return Result<TomlValue>::success(TomlValue(std::move(items)));
      }
      auto item = read_string();
      if (!item.ok()) {
        return fail<TomlValue>("arrays may only hold strings");
      }
      items.push_back(std::move(item.value()));
      skip_blank_lines();
      if (consume(',')) {
        continue;
      }
      skip_blank_lines();
      if (!consume(']')) {
        return fail<TomlValue>("expected , or ] in array");
      }
      return Result<TomlValue>::success(TomlValue(std::move(items)));
    }
  }

  Result<TomlValue> read_scalar() {
    std::string word;
    while (!at_end() && peek() != '#' && peek() != '\n' && peek() != '\r' && peek() != ' ' &&
           peek() != '\t') {
      word.push_back(text_[pos_++]);
    }
    if (word.empty()) {
      return fail<TomlValue>("missing value");
    }
    if (word == "true" || word == "false") {
      return Result<TomlValue>::success(TomlValue(word == "true"));
    }

    std::string digits;
    for (const char ch : word) {
      if (ch != '_') {
        digits.push_back(ch);
      }
    }
    const char *first = digits.data();
    const char *last = first + digits.size();
    if (first != last && *first == '+') {
      ++first;
    }
    std::int64_t number = 0;
    const auto [end, ec] = std::from_chars(first, last, number);
    if (ec != std::errc() || end != last) {
      return fail<TomlValue>("unsupported value " + word);
    }
    return Result<TomlValue>::success(TomlValue(number));
  }

  Result<TomlValue> read_value() {
    skip_spaces();
    if (peek() == '"') {
      auto text = read_string();
      if (!text.ok()) {
        return Result<TomlValue>::failure(text.error());
      }
      return Result<TomlValue>::success(TomlValue(std::move(text.value())));
    }
    if (peek() == '[') {
      return read_array();
    }
    return read_scalar();
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

template <typename T> const T *lookup(const TomlDocument &doc, const std::string &key) {
  const auto it = doc.values.find(key);
  if (it == doc.values.end()) {
    return nullptr;
  }
  return std::get_if<T>(&it->second);
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = lookup<std::string>(*this, key);
  return value == nullptr ? fallback : *value;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *value = lookup<bool>(*this, key);
  return value == nullptr ? fallback : *value;
}

std::int64_t TomlDocument::get_i64(const std::string &key, const std::int64_t fallback) const {
  const auto *value = lookup<std::int64_t>(*this, key);
  return value == nullptr ? fallback : *value;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *value = lookup<std::vector<std::string>>(*this, key);
  return value == nullptr ? fallback : *value;
}

Result<TomlDocument> parse_toml(const std::string &content) { return TomlReader(content).read(); }

} // namespace switchboard::common
