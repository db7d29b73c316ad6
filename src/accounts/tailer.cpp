#include "switchboard/accounts/tailer.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace switchboard::accounts {

Tailer::Tailer(IAccountClient &client, store::IMessageStore &store,
               std::stop_token manager_dying, FatalHandler fatal, TailerOptions options)
    : client_(client), store_(store), fatal_(std::move(fatal)), options_(options),
      stop_({std::move(manager_dying), client.dying()}), cursor_(client.last_id()) {
  thread_ = std::thread([this]() { run(); });
}

Tailer::~Tailer() {
  stop_.request_stop();
  join();
}

void Tailer::join() {
  if (thread_.joinable()) {
    try {
      thread_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[tailer] join failed: " << err.what() << "\n";
    }
  }
}

void Tailer::run() {
  const auto token = stop_.token();
  const std::string account = client_.account_name();

  while (!token.stop_requested()) {
    auto rows = store_.query(account, store::Lane::Outgoing, cursor_.load(), options_.batch_size);
    std::size_t fetched = 0;
    if (!rows.ok()) {
      std::cerr << "[tailer] [" << account
                << "] error retrieving outgoing messages: " << rows.error() << "\n";
    } else {
      fetched = rows.value().size();
      for (auto &row : rows.value()) {
        const std::int64_t id = row.id;
        const std::int64_t queued_at = row.time;
        if (!client_.outgoing().send(row, token)) {
          return;
        }

        // Hand the message back to the incoming lane for anything that
        // watches sent traffic. Resends keep their nonce and come back as
        // duplicates.
        const auto echo = store_.insert(row, store::Lane::Incoming);
        if (!echo.ok()) {
          std::cerr << "[tailer] [" << account
                    << "] cannot insert outgoing message for incoming handling: " << echo.error()
                    << "\n";
          fatal_(echo.error());
          return;
        }
        if (echo.value().duplicate()) {
          std::cerr << "[tailer] [" << account << "] message id=" << id << " was already echoed\n";
        } else {
          observability::record_message_stored(account, store::lane_name(store::Lane::Incoming));
        }

        cursor_.store(id);
        const auto lag = std::chrono::milliseconds(
            queued_at > 0 ? std::max<std::int64_t>(common::unix_millis() - queued_at, 0) : 0);
        observability::record_message_delivered(account, id, lag);
      }
    }

    if (fetched == options_.batch_size && fetched > 0) {
      continue;
    }
    if (!common::sleep_for(options_.poll_delay, token)) {
      return;
    }
  }
}

} // namespace switchboard::accounts
