#include "switchboard/config/config.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace switchboard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".switchboard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SWITCHBOARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
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
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

void load_database_config(Config &config, const common::TomlDocument &doc) {
  config.database.path = expand_config_value(doc.get_string("database.path", config.database.path));
  config.database.busy_timeout_ms =
      doc.get_i64("database.busy_timeout_ms", config.database.busy_timeout_ms);
}

void load_accounts_config(Config &config, const common::TomlDocument &doc) {
  auto &accounts = config.accounts;
  if (doc.has("accounts.allow")) {
    accounts.allow = doc.get_string_array("accounts.allow");
  }
  accounts.refresh_interval_ms =
      doc.get_i64("accounts.refresh_interval_ms", accounts.refresh_interval_ms);
  accounts.poll_delay_ms = doc.get_i64("accounts.poll_delay_ms", accounts.poll_delay_ms);
  accounts.default_nick = doc.get_string("accounts.default_nick", accounts.default_nick);
  const std::int64_t capacity = doc.get_i64(
      "accounts.incoming_capacity", static_cast<std::int64_t>(accounts.incoming_capacity));
  accounts.incoming_capacity = capacity < 0 ? 0 : static_cast<std::size_t>(capacity);
  accounts.network_timeout_ms =
      doc.get_i64("accounts.network_timeout_ms", accounts.network_timeout_ms);
}

void load_directory_config(Config &config, const common::TomlDocument &doc) {
  auto &directory = config.directory;
  directory.url = expand_config_value(doc.get_string("directory.url"));
  directory.base_dn = doc.get_string("directory.base_dn");
  directory.bind_dn = doc.get_string("directory.bind_dn");
  directory.bind_pass = expand_config_value(doc.get_string("directory.bind_pass"));
  directory.request_timeout_ms =
      doc.get_i64("directory.request_timeout_ms", directory.request_timeout_ms);
  directory.redial_delay_ms = doc.get_i64("directory.redial_delay_ms", directory.redial_delay_ms);
  directory.keepalive_interval_ms =
      doc.get_i64("directory.keepalive_interval_ms", directory.keepalive_interval_ms);
}

bool backend_is_known(const std::string &backend) {
  for (const auto &part : common::split_csv(common::to_lower(backend))) {
    if (part != "log" && part != "none" && part != "noop") {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *db = std::getenv("SWITCHBOARD_DB_PATH"); db != nullptr && *db) {
    config.database.path = common::expand_path(db);
  }

  if (const char *accounts = std::getenv("SWITCHBOARD_ACCOUNTS"); accounts != nullptr) {
    config.accounts.allow = common::split_csv(accounts);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  load_database_config(config, doc);
  load_accounts_config(config, doc);
  load_directory_config(config, doc);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.database.path = expand_config_path(config.database.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.database.path).empty()) {
    return common::Result<std::vector<std::string>>::failure("database.path must be set");
  }
  if (config.database.busy_timeout_ms < 0) {
    return common::Result<std::vector<std::string>>::failure(
        "database.busy_timeout_ms must not be negative");
  }

  if (config.accounts.poll_delay_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "accounts.poll_delay_ms must be positive");
  }
  if (config.accounts.incoming_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "accounts.incoming_capacity must be at least 1");
  }
  if (config.accounts.network_timeout_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "accounts.network_timeout_ms must be positive");
  }
  if (config.accounts.allow.has_value() && config.accounts.allow->empty()) {
    warnings.push_back("accounts.allow is empty; no accounts will be handled");
  }
  if (config.accounts.refresh_interval_ms <= 0) {
    warnings.push_back("accounts.refresh_interval_ms disables periodic refresh");
  }
  if (common::trim(config.accounts.default_nick).empty()) {
    warnings.push_back("accounts.default_nick is empty");
  }

  const auto &directory = config.directory;
  if (directory.request_timeout_ms <= 0 || directory.redial_delay_ms <= 0 ||
      directory.keepalive_interval_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "directory timeouts must be positive");
  }
  if (!directory.url.empty() && directory.bind_dn.empty()) {
    warnings.push_back("directory.url is set without directory.bind_dn");
  }

  if (!backend_is_known(config.observability.backend)) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid observability.backend: " + config.observability.backend);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace switchboard::config
