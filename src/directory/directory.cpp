#include "switchboard/directory/directory.hpp"

namespace switchboard::directory {

std::vector<std::string> Entry::values(const std::string &name) const {
  for (const auto &attr : attrs) {
    if (attr.name == name) {
      return attr.values;
    }
  }
  return {};
}

std::string Entry::value(const std::string &name) const {
  for (const auto &attr : attrs) {
    if (attr.name == name && !attr.values.empty()) {
      return attr.values.front();
    }
  }
  return "";
}

Search ping_search() {
  return Search{.filter = "(unknownAttr=this-query-is-just-a-ping)", .attrs = {"unknownAttr"}};
}

common::Status SearchConnection::ping() { return perform(ping_search()).status(); }

Settings settings_from_config(const config::DirectoryConfig &config) {
  return Settings{.url = config.url,
                  .base_dn = config.base_dn,
                  .bind_dn = config.bind_dn,
                  .bind_pass = config.bind_pass};
}

broker::BrokerOptions broker_options(const config::DirectoryConfig &config) {
  return broker::BrokerOptions{
      .request_timeout = std::chrono::milliseconds(config.request_timeout_ms),
      .redial_delay = std::chrono::milliseconds(config.redial_delay_ms),
      .keepalive_interval = std::chrono::milliseconds(config.keepalive_interval_ms)};
}

std::string redact(const std::string &text, const Settings &settings) {
  if (settings.bind_pass.empty()) {
    return text;
  }
  std::string out = text;
  std::size_t pos = 0;
  while ((pos = out.find(settings.bind_pass, pos)) != std::string::npos) {
    out.replace(pos, settings.bind_pass.size(), "********");
    pos += 8;
  }
  return out;
}

std::shared_ptr<ManagedDirectory> start_managed(const Settings &settings, Dialer dialer,
                                                broker::BrokerOptions options) {
  auto wrapped = [settings, dialer = std::move(dialer)]()
      -> common::Result<std::unique_ptr<Connection>> {
    auto conn = dialer(settings);
    if (!conn.ok()) {
      return common::Result<std::unique_ptr<Connection>>::failure(
          "cannot connect to directory at " + settings.url + ": " +
          redact(conn.error(), settings));
    }
    return conn;
  };
  return ManagedDirectory::start("directory", std::move(wrapped), options);
}

} // namespace switchboard::directory
