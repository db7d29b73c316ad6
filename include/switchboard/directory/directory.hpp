#pragma once

#include "switchboard/broker/managed_connection.hpp"
#include "switchboard/config/schema.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace switchboard::directory {

struct Settings {
  std::string url;
  std::string base_dn;
  std::string bind_dn;
  std::string bind_pass;
};

struct Search {
  std::string filter;
  std::vector<std::string> attrs;
};

struct Attr {
  std::string name;
  std::vector<std::string> values;
};

struct Entry {
  std::string dn;
  std::vector<Attr> attrs;

  /// All values of the named attribute, empty when absent.
  [[nodiscard]] std::vector<std::string> values(const std::string &name) const;
  /// First value of the named attribute, empty when absent.
  [[nodiscard]] std::string value(const std::string &name) const;
};

using Connection = broker::IConnection<Search, std::vector<Entry>>;
using ManagedDirectory = broker::ManagedConnection<Search, std::vector<Entry>>;
using Dialer = std::function<common::Result<std::unique_ptr<Connection>>(const Settings &)>;

/// Query that matches nothing, used to keep idle connections honest.
[[nodiscard]] Search ping_search();

/// Connection whose keepalive is the ping search.
class SearchConnection : public Connection {
public:
  [[nodiscard]] common::Status ping() override;
};

[[nodiscard]] Settings settings_from_config(const config::DirectoryConfig &config);
[[nodiscard]] broker::BrokerOptions broker_options(const config::DirectoryConfig &config);

/// Replaces every occurrence of the bind password in `text`.
[[nodiscard]] std::string redact(const std::string &text, const Settings &settings);

/// Starts a broker for the directory described by `settings`. Dial errors are
/// recorded with the bind password redacted.
[[nodiscard]] std::shared_ptr<ManagedDirectory>
start_managed(const Settings &settings, Dialer dialer, broker::BrokerOptions options = {});

} // namespace switchboard::directory
