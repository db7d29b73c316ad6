#pragma once

#include "switchboard/accounts/account_client.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/net/http_client.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace switchboard::accounts {

using ClientFactory = std::function<std::unique_ptr<IAccountClient>(const store::AccountInfo &,
                                                                    const ClientContext &)>;

class ClientRegistry {
public:
  [[nodiscard]] common::Status register_kind(std::string kind, ClientFactory factory);

  /// nullptr when no factory handles the account's kind.
  [[nodiscard]] std::unique_ptr<IAccountClient> create(const store::AccountInfo &info,
                                                       const ClientContext &context) const;
  [[nodiscard]] bool contains(std::string_view kind) const;
  [[nodiscard]] std::vector<std::string> list() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ClientFactory> factories_;
};

/// Registry with every transport built into this binary. A null `http`
/// means a fresh CurlHttpClient.
[[nodiscard]] std::unique_ptr<ClientRegistry>
default_client_registry(std::shared_ptr<net::HttpClient> http = nullptr);

} // namespace switchboard::accounts
