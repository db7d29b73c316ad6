#pragma once

#include "switchboard/accounts/account_client.hpp"
#include "switchboard/common/lifecycle.hpp"
#include "switchboard/store/message_store.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>

namespace switchboard::accounts {

struct TailerOptions {
  std::chrono::milliseconds poll_delay{100};
  std::size_t batch_size = 100;
};

/// Feeds one client with the outgoing messages queued for its account, in id
/// order, echoing each delivered message into the incoming lane. Runs until
/// either the manager or the client starts dying.
class Tailer {
public:
  using FatalHandler = std::function<void(const std::string &error)>;

  Tailer(IAccountClient &client, store::IMessageStore &store, std::stop_token manager_dying,
         FatalHandler fatal, TailerOptions options = {});
  ~Tailer();

  Tailer(const Tailer &) = delete;
  Tailer &operator=(const Tailer &) = delete;

  void join();
  /// Last id handed to the client.
  [[nodiscard]] std::int64_t cursor() const { return cursor_.load(); }

private:
  void run();

  IAccountClient &client_;
  store::IMessageStore &store_;
  FatalHandler fatal_;
  TailerOptions options_;
  common::LinkedStop stop_;
  std::atomic<std::int64_t> cursor_;
  std::thread thread_;
};

} // namespace switchboard::accounts
