#include "switchboard/accounts/client_registry.hpp"

#include "switchboard/accounts/webhook_client.hpp"
#include "switchboard/common/fs.hpp"

#include <algorithm>
#include <iostream>

namespace switchboard::accounts {

common::Status ClientRegistry::register_kind(std::string kind, ClientFactory factory) {
  const std::string normalized = common::to_lower(common::trim(kind));
  if (normalized.empty()) {
    return common::Status::error("account kind is required");
  }
  if (!factory) {
    return common::Status::error("client factory is required");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (factories_.contains(normalized)) {
    return common::Status::error("account kind already registered: " + normalized);
  }
  factories_.insert_or_assign(normalized, std::move(factory));
  return common::Status::success();
}

std::unique_ptr<IAccountClient> ClientRegistry::create(const store::AccountInfo &info,
                                                       const ClientContext &context) const {
  const std::string kind = common::to_lower(common::trim(store::effective_kind(info)));

  ClientFactory factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = factories_.find(kind);
    if (it == factories_.end()) {
      return nullptr;
    }
    factory = it->second;
  }
  return factory(info, context);
}

bool ClientRegistry::contains(std::string_view kind) const {
  const std::string normalized = common::to_lower(common::trim(std::string(kind)));
  std::lock_guard<std::mutex> lock(mutex_);
  return factories_.contains(normalized);
}

std::vector<std::string> ClientRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto &[kind, factory] : factories_) {
    (void)factory;
    out.push_back(kind);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::unique_ptr<ClientRegistry> default_client_registry(std::shared_ptr<net::HttpClient> http) {
  if (http == nullptr) {
    http = std::make_shared<net::CurlHttpClient>();
  }

  auto registry = std::make_unique<ClientRegistry>();
  auto status = registry->register_kind(
      "webhook", [http](const store::AccountInfo &info, const ClientContext &context) {
        return std::make_unique<WebhookClient>(info, context, http);
      });
  if (!status.ok()) {
    std::cerr << "[accounts] " << status.error() << "\n";
  }
  return registry;
}

} // namespace switchboard::accounts
