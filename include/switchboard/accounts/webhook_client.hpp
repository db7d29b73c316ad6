#pragma once

#include "switchboard/accounts/account_client.hpp"
#include "switchboard/common/lifecycle.hpp"
#include "switchboard/net/http_client.hpp"

#include <memory>
#include <mutex>
#include <thread>

namespace switchboard::accounts {

/// Resolves the URL a webhook account posts to, from either `endpoint` or
/// `host` plus `tls`.
[[nodiscard]] common::Result<std::string> webhook_endpoint(const store::AccountInfo &info);

/// Interprets a `{"success": bool, "error": string}` reply.
[[nodiscard]] common::Status webhook_result(const std::string &body);

/// Delivers outgoing messages by POSTing them to an incoming-webhook URL.
/// Nothing is ever received; inbound traffic reaches the store some other way.
class WebhookClient final : public IAccountClient {
public:
  WebhookClient(store::AccountInfo info, const ClientContext &context,
                std::shared_ptr<net::HttpClient> http);
  ~WebhookClient() override;

  WebhookClient(const WebhookClient &) = delete;
  WebhookClient &operator=(const WebhookClient &) = delete;

  [[nodiscard]] bool alive() const override { return lifecycle_.alive(); }
  [[nodiscard]] common::Status stop() override;
  [[nodiscard]] std::string account_name() const override { return account_name_; }
  [[nodiscard]] std::stop_token dying() const override { return lifecycle_.token(); }
  [[nodiscard]] OutgoingQueue &outgoing() override { return outgoing_; }
  [[nodiscard]] std::int64_t last_id() const override { return last_id_; }
  void update_info(const store::AccountInfo &info) override;

private:
  void run();
  [[nodiscard]] common::Status deliver(const store::Message &message);
  [[nodiscard]] store::AccountInfo info() const;

  const std::string account_name_;
  const std::int64_t last_id_;
  IncomingQueue &incoming_;
  const std::chrono::milliseconds network_timeout_;
  std::shared_ptr<net::HttpClient> http_;

  mutable std::mutex info_mutex_;
  store::AccountInfo info_;

  OutgoingQueue outgoing_{1};
  common::Lifecycle lifecycle_;
  std::mutex join_mutex_;
  std::thread thread_;
};

} // namespace switchboard::accounts
