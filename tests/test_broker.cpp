#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "switchboard/broker/managed_connection.hpp"
#include "switchboard/directory/directory.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

namespace br = switchboard::broker;
namespace dir = switchboard::directory;
namespace sbt = switchboard::testing;
using namespace std::chrono_literals;

/// Counters shared by every connection a dialer hands out.
struct DirectoryState {
  std::atomic<int> dials{0};
  std::atomic<int> failing_dials{0};
  std::atomic<int> searches{0};
  std::atomic<int> pings{0};
  std::atomic<int> closes{0};
  std::atomic<bool> break_next{false};
  std::atomic<bool> fail_searches{false};
  std::atomic<int> search_delay_ms{0};
  std::mutex mutex;
  std::string dial_error = "connection refused";
};

class FakeDirectoryConnection final : public dir::SearchConnection {
public:
  explicit FakeDirectoryConnection(std::shared_ptr<DirectoryState> state)
      : state_(std::move(state)) {}

  switchboard::common::Result<std::vector<dir::Entry>> perform(const dir::Search &search) override {
    if (search.filter == dir::ping_search().filter) {
      state_->pings.fetch_add(1);
      return switchboard::common::Result<std::vector<dir::Entry>>::success({});
    }
    state_->searches.fetch_add(1);
    if (const int delay = state_->search_delay_ms.load(); delay > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    if (state_->fail_searches.load()) {
      return switchboard::common::Result<std::vector<dir::Entry>>::failure(
          "connection reset by peer");
    }
    if (state_->break_next.exchange(false)) {
      broken_ = true;
      return switchboard::common::Result<std::vector<dir::Entry>>::failure("connection reset");
    }
    dir::Entry entry;
    entry.dn = "uid=alice,ou=people,dc=example,dc=com";
    entry.attrs = {{.name = "mail", .values = {"alice@example.com", "a@example.com"}},
                   {.name = "query", .values = {search.filter}}};
    return switchboard::common::Result<std::vector<dir::Entry>>::success({entry});
  }

  [[nodiscard]] bool broken() const override { return broken_; }
  void close() override { state_->closes.fetch_add(1); }

private:
  std::shared_ptr<DirectoryState> state_;
  bool broken_ = false;
};

dir::Dialer fake_dialer(std::shared_ptr<DirectoryState> state) {
  return [state](const dir::Settings &) -> switchboard::common::Result<std::unique_ptr<dir::Connection>> {
    state->dials.fetch_add(1);
    if (state->failing_dials.load() > 0) {
      state->failing_dials.fetch_sub(1);
      std::lock_guard<std::mutex> lock(state->mutex);
      return switchboard::common::Result<std::unique_ptr<dir::Connection>>::failure(
          state->dial_error);
    }
    return switchboard::common::Result<std::unique_ptr<dir::Connection>>::success(
        std::make_unique<FakeDirectoryConnection>(state));
  };
}

dir::Settings settings() {
  return dir::Settings{.url = "ldaps://ldap.example.com",
                       .base_dn = "dc=example,dc=com",
                       .bind_dn = "cn=relay,dc=example,dc=com",
                       .bind_pass = "hunter2"};
}

br::BrokerOptions fast_options() {
  return br::BrokerOptions{.request_timeout = 1000ms, .redial_delay = 20ms,
                           .keepalive_interval = 1000ms};
}

} // namespace

void register_broker_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"directory_entry_lookup", [] {
                     dir::Entry entry;
                     entry.attrs = {{.name = "cn", .values = {"Alice"}}, {.name = "empty", .values = {}}};
                     require(entry.value("cn") == "Alice", "value mismatch");
                     require(entry.values("cn").size() == 1, "values mismatch");
                     require(entry.value("empty").empty() && entry.value("missing").empty(),
                             "missing values should be empty");
                   }});

  tests.push_back({"directory_settings_and_redaction", [] {
                     switchboard::config::DirectoryConfig config;
                     config.url = "ldap://dir";
                     config.bind_pass = "pa55";
                     config.request_timeout_ms = 250;
                     const auto converted = dir::settings_from_config(config);
                     require(converted.url == "ldap://dir" && converted.bind_pass == "pa55",
                             "settings mismatch");
                     require(dir::broker_options(config).request_timeout == 250ms,
                             "options mismatch");
                     require(dir::redact("bind pa55 failed pa55", converted) ==
                                 "bind ******** failed ********",
                             "password not redacted");
                     dir::Settings open;
                     require(dir::redact("nothing to hide", open) == "nothing to hide",
                             "empty password changed the text");
                   }});

  tests.push_back({"broker_shares_one_connection", [] {
                     auto state = std::make_shared<DirectoryState>();
                     auto broker = dir::start_managed(settings(), fake_dialer(state), fast_options());
                     auto first = broker->acquire();
                     auto second = broker->acquire();

                     auto found = first->request(dir::Search{.filter = "(uid=alice)", .attrs = {"mail"}});
                     require(found.ok(), found.error());
                     require(found.value().size() == 1, "entry count mismatch");
                     require(found.value()[0].value("mail") == "alice@example.com", "mail mismatch");
                     require(found.value()[0].value("query") == "(uid=alice)", "filter not passed");
                     require(second->request(dir::Search{.filter = "(uid=bob)"}).ok(),
                             "second handle failed");
                     require(state->dials.load() == 1, "handles should share the connection");
                     require(broker->last_error().empty(), "unexpected error");

                     first->close();
                     second->close();
                     broker->close();
                     require(sbt::wait_until([&] { return broker->dead(); }), "broker not dead");
                     require(state->closes.load() == 1, "connection not closed");
                   }});

  tests.push_back({"broker_reference_counting", [] {
                     auto state = std::make_shared<DirectoryState>();
                     auto broker = dir::start_managed(settings(), fake_dialer(state), fast_options());
                     auto handle = broker->acquire();
                     require(sbt::wait_until([&] { return broker->references() == 2; }),
                             "acquire not counted");
                     broker->close();
                     broker->close();
                     require(sbt::wait_until([&] { return broker->references() == 1; }),
                             "close not counted once");
                     require(!broker->dead(), "broker died with a live handle");
                     require(handle->request(dir::Search{.filter = "(uid=alice)"}).ok(),
                             "handle unusable after broker close");

                     handle->close();
                     handle->close();
                     require(handle->closed(), "handle not closed");
                     require(sbt::wait_until([&] { return broker->dead(); }), "broker not dead");
                     require(broker->references() == 0, "references not drained");
                   }});

  tests.push_back({"broker_closed_handle_fails_fast", [] {
                     auto state = std::make_shared<DirectoryState>();
                     auto broker = dir::start_managed(settings(), fake_dialer(state), fast_options());
                     auto handle = broker->acquire();
                     handle->close();
                     auto result = handle->request(dir::Search{.filter = "(uid=alice)"});
                     require(!result.ok(), "closed handle served a request");
                     require(result.error() == "directory connection already closed",
                             "unexpected error: " + result.error());
                     require(state->searches.load() == 0, "closed handle reached the server");
                   }});

  tests.push_back({"broker_redials_after_failures", [] {
                     auto state = std::make_shared<DirectoryState>();
                     state->failing_dials = 2;
                     auto broker = dir::start_managed(settings(), fake_dialer(state), fast_options());
                     auto handle = broker->acquire();
                     auto result = handle->request(dir::Search{.filter = "(uid=alice)"});
                     require(result.ok(), result.error());
                     require(state->dials.load() == 3, "expected two failed dials and a success");
                     require(broker->last_error().empty(), "error not cleared after redial");
                   }});

  tests.push_back({"broker_dial_error_is_redacted_and_reported", [] {
                     auto state = std::make_shared<DirectoryState>();
                     state->failing_dials = 1'000'000;
                     {
                       std::lock_guard<std::mutex> lock(state->mutex);
                       state->dial_error = "invalid credentials for password hunter2";
                     }
                     auto options = fast_options();
                     options.request_timeout = 150ms;
                     auto broker = dir::start_managed(settings(), fake_dialer(state), options);
                     auto handle = broker->acquire();
                     auto result = handle->request(dir::Search{.filter = "(uid=alice)"});
                     require(!result.ok(), "request succeeded without a connection");
                     require(result.error().find("cannot connect to directory at "
                                                 "ldaps://ldap.example.com") == 0,
                             "unexpected error: " + result.error());
                     require(result.error().find("hunter2") == std::string::npos,
                             "password leaked: " + result.error());
                     require(result.error().find("********") != std::string::npos,
                             "password not masked: " + result.error());
                   }});

  tests.push_back({"broker_timeout_without_error_is_sluggish", [] {
                     auto state = std::make_shared<DirectoryState>();
                     state->search_delay_ms = 300;
                     auto options = fast_options();
                     options.request_timeout = 50ms;
                     auto broker = dir::start_managed(settings(), fake_dialer(state), options);
                     auto handle = broker->acquire();
                     auto result = handle->request(dir::Search{.filter = "(uid=slow)"});
                     require(!result.ok(), "slow request should time out");
                     require(result.error() ==
                                 "directory server is a bit sluggish right now. Please try again soon.",
                             "unexpected error: " + result.error());

                     state->search_delay_ms = 0;
                     require(sbt::wait_until([&] {
                               return handle->request(dir::Search{.filter = "(uid=fast)"}).ok();
                             }),
                             "broker did not recover after a slow request");
                   }});

  tests.push_back({"broker_broken_connection_is_redialed", [] {
                     auto state = std::make_shared<DirectoryState>();
                     auto broker = dir::start_managed(settings(), fake_dialer(state), fast_options());
                     auto handle = broker->acquire();
                     require(handle->request(dir::Search{.filter = "(uid=a)"}).ok(), "first failed");
                     state->break_next = true;
                     auto broken = handle->request(dir::Search{.filter = "(uid=b)"});
                     require(!broken.ok() && broken.error() == "connection reset",
                             "broken request should surface its error");
                     auto again = handle->request(dir::Search{.filter = "(uid=c)"});
                     require(again.ok(), again.error());
                     require(state->dials.load() == 2, "broken connection not replaced");
                     require(state->closes.load() >= 1, "broken connection not closed");
                   }});

  tests.push_back({"broker_failed_request_drops_connection", [] {
                     auto state = std::make_shared<DirectoryState>();
                     state->fail_searches = true;
                     auto options = fast_options();
                     options.keepalive_interval = 300ms;
                     auto broker = dir::start_managed(settings(), fake_dialer(state), options);
                     auto handle = broker->acquire();
                     for (int i = 0; i < 3; ++i) {
                       auto failed = handle->request(dir::Search{.filter = "(uid=a)"});
                       require(!failed.ok(), "failing search reported success");
                     }
                     require(sbt::wait_until([&] { return state->dials.load() >= 3; }),
                             "failing connection was kept instead of redialed");
                     require(state->closes.load() >= 2, "failed connections not closed");

                     state->fail_searches = false;
                     require(sbt::wait_until([&] {
                               return handle->request(dir::Search{.filter = "(uid=b)"}).ok();
                             }),
                             "broker did not recover after failed requests");
                   }});

  tests.push_back({"broker_pings_idle_connections", [] {
                     auto state = std::make_shared<DirectoryState>();
                     auto options = fast_options();
                     options.keepalive_interval = 20ms;
                     auto broker = dir::start_managed(settings(), fake_dialer(state), options);
                     auto handle = broker->acquire();
                     require(sbt::wait_until([&] { return state->pings.load() >= 2; }),
                             "idle connection not pinged");
                     require(state->dials.load() == 1, "healthy pings should not redial");
                     require(state->searches.load() == 0, "ping counted as a search");
                   }});

  tests.push_back({"broker_generic_request_types", [] {
                     struct Echo final : br::IConnection<int, int> {
                       switchboard::common::Result<int> perform(const int &request) override {
                         return switchboard::common::Result<int>::success(request * 2);
                       }
                       switchboard::common::Status ping() override {
                         return switchboard::common::Status::success();
                       }
                       void close() override {}
                     };
                     using Broker = br::ManagedConnection<int, int>;
                     auto broker = Broker::start(
                         "doubler",
                         []() -> switchboard::common::Result<std::unique_ptr<br::IConnection<int, int>>> {
                           return switchboard::common::Result<
                               std::unique_ptr<br::IConnection<int, int>>>::success(
                               std::make_unique<Echo>());
                         },
                         fast_options());
                     require(broker->service() == "doubler", "service name mismatch");
                     auto handle = broker->acquire();
                     auto result = handle->request(21);
                     require(result.ok() && result.value() == 42, "generic request failed");
                   }});
}
