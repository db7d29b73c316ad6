#include "switchboard/accounts/webhook_client.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/json_util.hpp"

#include <cstdlib>
#include <iostream>
#include <system_error>

namespace switchboard::accounts {

common::Result<std::string> webhook_endpoint(const store::AccountInfo &info) {
  if (info.host.find("://") != std::string::npos) {
    return common::Result<std::string>::failure(
        "host account setting must not contain ://, use endpoint instead");
  }
  if (!info.endpoint.empty() && (info.tls || !info.host.empty())) {
    return common::Result<std::string>::failure(
        "webhook accounts take either endpoint or host/tls settings, not both");
  }
  if (!info.endpoint.empty()) {
    return common::Result<std::string>::success(info.endpoint);
  }
  if (info.host.empty()) {
    return common::Result<std::string>::failure("webhook account has no endpoint or host");
  }
  return common::Result<std::string>::success((info.tls ? "https://" : "http://") + info.host);
}

common::Status webhook_result(const std::string &body) {
  const auto success = common::json_get_bool(body, "success");
  if (!success.has_value() && common::trim(body).rfind('{', 0) != 0) {
    return common::Status::error("cannot decode webhook response: " + body);
  }
  if (success.value_or(false)) {
    return common::Status::success();
  }
  const std::string code = common::json_get_string(body, "error");
  if (code.empty()) {
    return common::Status::error("server reported failure without error code");
  }
  return common::Status::error("server returned " + code);
}

WebhookClient::WebhookClient(store::AccountInfo info, const ClientContext &context,
                             std::shared_ptr<net::HttpClient> http)
    : account_name_(info.name), last_id_(info.last_id), incoming_(context.incoming),
      network_timeout_(context.network_timeout), http_(std::move(http)), info_(std::move(info)) {
  thread_ = std::thread([this]() { run(); });
}

WebhookClient::~WebhookClient() {
  lifecycle_.kill();
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

store::AccountInfo WebhookClient::info() const {
  std::lock_guard<std::mutex> lock(info_mutex_);
  return info_;
}

void WebhookClient::update_info(const store::AccountInfo &info) {
  if (info.name != account_name_) {
    std::cerr << "[webhook] cannot change the account name from " << account_name_ << " to "
              << info.name << "\n";
    std::abort();
  }
  std::lock_guard<std::mutex> lock(info_mutex_);
  info_ = info;
}

common::Status WebhookClient::stop() {
  store::Message quit;
  quit.account = account_name_;
  quit.command = "QUIT";
  if (outgoing_.send_for(std::move(quit), network_timeout_, lifecycle_.token())) {
    // Give the loop a chance to finish on its own.
    (void)common::sleep_for(network_timeout_, lifecycle_.token());
  }
  lifecycle_.kill();

  {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (thread_.joinable()) {
      try {
        thread_.join();
      } catch (const std::system_error &err) {
        std::cerr << "[webhook] join failed: " << err.what() << "\n";
      }
    }
  }
  return lifecycle_.reason();
}

common::Status WebhookClient::deliver(const store::Message &message) {
  const auto current = info();
  const auto endpoint = webhook_endpoint(current);
  if (!endpoint.ok()) {
    return endpoint.status();
  }

  std::string channel = message.channel;
  if (channel.empty()) {
    channel = "@" + message.nick;
  }
  const std::string payload = common::json_object({{"channel", channel}, {"text", message.text}});

  std::cerr << "[webhook] [" << account_name_ << "] sending id=" << message.id
            << " channel=" << channel << "\n";
  const auto response = http_->post_form(
      endpoint.value(), {{"payload", payload}},
      net::PostOptions{.timeout_ms = static_cast<std::uint64_t>(network_timeout_.count()),
                       .tls_insecure = current.tls_insecure});
  if (response.network_error) {
    return common::Status::error(response.network_error_message);
  }
  return webhook_result(response.body);
}

void WebhookClient::run() {
  const auto token = lifecycle_.token();

  if (const auto endpoint = webhook_endpoint(info()); !endpoint.ok()) {
    lifecycle_.kill(endpoint.error());
  }

  while (lifecycle_.alive()) {
    auto message = outgoing_.receive(token);
    if (!message.has_value()) {
      break;
    }

    const std::string command = store::effective_command(*message);
    if (message->command == "QUIT") {
      lifecycle_.kill();
      break;
    }
    if (command != "PRIVMSG" && command != "NOTICE") {
      continue;
    }

    if (auto status = deliver(*message); !status.ok()) {
      lifecycle_.kill(status.error());
      break;
    }

    // Tell the account manager the message made it out.
    store::Message ack;
    ack.account = account_name_;
    ack.nick = "switchboard";
    ack.user = "/";
    ack.command = "PONG";
    ack.text = store::ack_text(message->id);
    if (!incoming_.push(std::move(ack), token)) {
      break;
    }
  }

  lifecycle_.kill();
  std::cerr << "[webhook] [" << account_name_ << "] client terminated ("
            << (lifecycle_.reason().ok() ? std::string("stopped") : lifecycle_.reason().error())
            << ")\n";
  lifecycle_.mark_dead();
}

} // namespace switchboard::accounts
