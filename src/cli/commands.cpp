#include "switchboard/cli/commands.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/config/config.hpp"
#include "switchboard/daemon/daemon.hpp"
#include "switchboard/observability/factory.hpp"
#include "switchboard/observability/global.hpp"
#include "switchboard/store/sqlite_store.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace switchboard::cli {

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void handle_stop_signal(int signal) { g_stop_signal = signal; }

std::string version_string() {
#ifdef SWITCHBOARD_VERSION
  std::string version = SWITCHBOARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SWITCHBOARD_GIT_COMMIT
  const std::string commit = SWITCHBOARD_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "switchboard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated(std::vector<std::string> &args, const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

/// Loads and validates the configuration, printing warnings. Returns false
/// after reporting a fatal problem.
bool load_valid_config(config::Config &out) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    std::cerr << loaded.error() << "\n";
    return false;
  }
  auto warnings = config::validate_config(loaded.value());
  if (!warnings.ok()) {
    std::cerr << "invalid configuration: " << warnings.error() << "\n";
    return false;
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  out = std::move(loaded.value());
  return true;
}

std::unique_ptr<store::SqliteMessageStore> open_store(const config::Config &config) {
  auto store = std::make_unique<store::SqliteMessageStore>(
      config.database.path, static_cast<int>(config.database.busy_timeout_ms));
  if (auto status = store->status(); !status.ok()) {
    std::cerr << "cannot open " << config.database.path << ": " << status.error() << "\n";
    return nullptr;
  }
  return store;
}

int run_daemon(const config::Config &config) {
  observability::set_global_observer(observability::create_observer(config));

  daemon::Daemon daemon(config);
  auto started = daemon.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }

  g_stop_signal = 0;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto dying = daemon.dying();
  while (g_stop_signal == 0 && !dying.stop_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  if (g_stop_signal != 0) {
    std::cerr << "[daemon] received signal " << g_stop_signal << ", shutting down\n";
  }

  const auto stopped = daemon.stop();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!stopped.ok()) {
    std::cerr << "switchboard stopped with error: " << stopped.error() << "\n";
    return 1;
  }
  return 0;
}

int run_accounts(const config::Config &config) {
  auto store = open_store(config);
  if (store == nullptr) {
    return 1;
  }
  auto accounts = store->read_account_config();
  if (!accounts.ok()) {
    std::cerr << accounts.error() << "\n";
    return 1;
  }
  if (accounts.value().empty()) {
    std::cout << "No accounts configured.\n";
    return 0;
  }
  for (const auto &info : accounts.value()) {
    std::vector<std::string> channels;
    for (const auto &channel : info.channels) {
      channels.push_back(channel.name);
    }
    std::cout << info.name << "  kind=" << store::effective_kind(info) << "  last_id="
              << (info.cursor_set ? std::to_string(info.last_id) : std::string("unset"));
    if (!channels.empty()) {
      std::cout << "  channels=" << common::join(channels, ",");
    }
    std::cout << "\n";
  }
  return 0;
}

int run_account(const config::Config &config, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: switchboard account <add|remove> NAME [options]\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  if (action == "add") {
    store::AccountInfo info;
    (void)take_option(args, "--kind", "", info.kind);
    (void)take_option(args, "--endpoint", "", info.endpoint);
    (void)take_option(args, "--host", "", info.host);
    (void)take_option(args, "--nick", "", info.nick);
    (void)take_option(args, "--identity", "", info.identity);
    (void)take_option(args, "--password", "", info.password);
    info.tls = take_flag(args, "--tls");
    info.tls_insecure = take_flag(args, "--tls-insecure");
    for (const auto &channel : take_repeated(args, "--channel")) {
      info.channels.push_back(store::ChannelInfo{.account = "", .name = channel, .key = ""});
    }
    if (args.size() != 1 || common::trim(args[0]).empty()) {
      std::cerr << "usage: switchboard account add NAME [--kind K] [--endpoint URL] [--host H]"
                   " [--tls] [--nick N] [--channel C]...\n";
      return 1;
    }
    info.name = args[0];
    for (auto &channel : info.channels) {
      channel.account = info.name;
    }

    auto store = open_store(config);
    if (store == nullptr) {
      return 1;
    }
    if (auto status = store->upsert_account(info); !status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "Account " << info.name << " saved.\n";
    return 0;
  }

  if (action == "remove") {
    if (args.size() != 1) {
      std::cerr << "usage: switchboard account remove NAME\n";
      return 1;
    }
    auto store = open_store(config);
    if (store == nullptr) {
      return 1;
    }
    auto removed = store->remove_account(args[0]);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    if (!removed.value()) {
      std::cerr << "no such account: " << args[0] << "\n";
      return 1;
    }
    std::cout << "Account " << args[0] << " removed.\n";
    return 0;
  }

  std::cerr << "Unknown account action: " << action << "\n";
  return 1;
}

int run_send(const config::Config &config, const std::vector<std::string> &args) {
  if (args.size() < 3) {
    std::cerr << "usage: switchboard send ACCOUNT CHANNEL TEXT...\n";
    return 1;
  }
  store::Message message;
  message.account = args[0];
  message.channel = args[1];
  message.text = join_tokens(args, 2);
  message.command = "PRIVMSG";

  auto store = open_store(config);
  if (store == nullptr) {
    return 1;
  }
  auto inserted = store->insert(message, store::Lane::Outgoing);
  if (!inserted.ok()) {
    std::cerr << inserted.error() << "\n";
    return 1;
  }
  std::cout << "Queued message " << inserted.value().id << " for " << message.account << ".\n";
  return 0;
}

int run_db(const config::Config &config, const std::vector<std::string> &args) {
  if (args.size() != 1 || args[0] != "wipe") {
    std::cerr << "usage: switchboard db wipe\n";
    return 1;
  }
  if (auto status = store::SqliteMessageStore::wipe(config.database.path); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "Removed " << config.database.path << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  switchboard [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  run                         Relay messages for every configured account\n";
  std::cout << "  accounts                    List accounts with kind and cursor\n";
  std::cout << "  account add NAME [options]  Add or update an account\n";
  std::cout << "      --kind K  --endpoint URL  --host H  --tls  --tls-insecure\n";
  std::cout << "      --nick N  --identity I  --password P  --channel C (repeatable)\n";
  std::cout << "  account remove NAME         Remove an account and its channels\n";
  std::cout << "  send ACCOUNT CHANNEL TEXT   Queue an outgoing message\n";
  std::cout << "  db wipe                     Delete the message database\n";
  std::cout << "  version                     Print the version\n";
  std::cout << "  help                        Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }

  config::Config config;
  if (!load_valid_config(config)) {
    return 1;
  }

  if (subcommand == "run") {
    return run_daemon(config);
  }
  if (subcommand == "accounts") {
    return run_accounts(config);
  }
  if (subcommand == "account") {
    return run_account(config, std::move(args));
  }
  if (subcommand == "send") {
    return run_send(config, args);
  }
  if (subcommand == "db") {
    return run_db(config, args);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace switchboard::cli
