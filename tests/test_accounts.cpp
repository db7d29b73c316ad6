#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "switchboard/accounts/account_manager.hpp"
#include "switchboard/accounts/tailer.hpp"
#include "switchboard/store/message.hpp"
#include "switchboard/store/sqlite_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

namespace acc = switchboard::accounts;
namespace st = switchboard::store;
namespace sbt = switchboard::testing;
using namespace std::chrono_literals;

/// A store in a temp directory plus a manager over fake clients.
struct ManagerFixture {
  explicit ManagerFixture(sbt::FakeClientOptions options = {},
                          switchboard::config::AccountsConfig config = sbt::fast_accounts_config())
      : store(workspace.path() / "switchboard.db"), faulty(store), fleet(options),
        registry(fleet.registry()), accounts_config(std::move(config)) {}

  ~ManagerFixture() {
    if (manager != nullptr) {
      (void)manager->stop();
    }
  }

  void add(const st::AccountInfo &info) {
    const auto status = store.upsert_account(info);
    if (!status.ok()) {
      throw std::runtime_error(status.error());
    }
  }

  void start() {
    manager = std::make_unique<acc::AccountManager>(accounts_config, faulty, *registry);
    const auto status = manager->start();
    if (!status.ok()) {
      throw std::runtime_error(status.error());
    }
  }

  bool active_is(std::vector<std::string> expected) const {
    std::sort(expected.begin(), expected.end());
    return manager->active_accounts() == expected;
  }

  std::int64_t cursor(const std::string &name) {
    auto accounts = store.read_account_config();
    for (const auto &info : accounts.value()) {
      if (info.name == name) {
        return info.last_id;
      }
    }
    return -1;
  }

  sbt::TempWorkspace workspace;
  st::SqliteMessageStore store;
  sbt::FaultyStore faulty;
  sbt::FakeFleet fleet;
  std::unique_ptr<acc::ClientRegistry> registry;
  switchboard::config::AccountsConfig accounts_config;
  std::unique_ptr<acc::AccountManager> manager;
};

} // namespace

void register_accounts_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"manager_lifecycle_states", [] {
                     ManagerFixture fx;
                     fx.manager = std::make_unique<acc::AccountManager>(fx.accounts_config,
                                                                        fx.faulty, *fx.registry);
                     require(fx.manager->state() == acc::ManagerState::Idle, "should start idle");
                     require(!fx.manager->refresh().ok(), "refresh before start accepted");
                     require(fx.manager->start().ok(), "start failed");
                     require(fx.manager->state() == acc::ManagerState::Running, "not running");
                     require(!fx.manager->start().ok(), "double start accepted");
                     require(fx.manager->stop().ok(), "clean stop reported an error");
                     require(fx.manager->state() == acc::ManagerState::Stopped, "not stopped");
                     require(fx.manager->stop().ok(), "second stop should be a no-op");
                     require(!fx.manager->start().ok(), "restart after stop accepted");
                     require(!fx.manager->refresh().ok(), "refresh after stop accepted");
                   }});

  tests.push_back({"manager_starts_one_client_per_account", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("dev"));
                     fx.start();
                     require(sbt::wait_until([&] { return fx.active_is({"ops", "dev"}); }),
                             "accounts not started");
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.fleet.created("ops") == 1 && fx.fleet.created("dev") == 1,
                             "refresh must not duplicate clients");
                   }});

  tests.push_back({"manager_allow_list_filters_accounts", [] {
                     auto config = sbt::fast_accounts_config();
                     config.allow = std::vector<std::string>{"ops"};
                     ManagerFixture fx({}, config);
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("dev"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.active_is({"ops"}), "allow-list ignored");
                     require(fx.fleet.created("dev") == 0, "filtered account got a client");
                   }});

  tests.push_back({"manager_empty_allow_list_handles_nothing", [] {
                     auto config = sbt::fast_accounts_config();
                     config.allow = std::vector<std::string>{};
                     ManagerFixture fx({}, config);
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh should still complete");
                     require(fx.manager->active_accounts().empty(), "account started anyway");
                     require(fx.fleet.created("ops") == 0, "client created anyway");
                     require(fx.manager->stop().ok(), "stop failed");
                   }});

  tests.push_back({"manager_refresh_removes_deleted_accounts", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("dev"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto dev = fx.fleet.latest("dev");
                     require(dev != nullptr, "dev client missing");

                     require(fx.store.remove_account("dev").ok(), "remove failed");
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.active_is({"ops"}), "removed account still active");
                     require(dev->stopped(), "removed client was not stopped");
                   }});

  tests.push_back({"manager_refresh_updates_running_clients", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     auto info = sbt::account("ops");
                     info.nick = "night-shift";
                     fx.add(info);
                     require(fx.manager->refresh().ok(), "refresh failed");

                     auto record = fx.fleet.latest("ops");
                     const auto updates = record->updates();
                     require(!updates.empty(), "client was not updated");
                     require(updates.back().nick == "night-shift", "update lost the nick");
                     require(fx.fleet.created("ops") == 1, "update recreated the client");
                   }});

  tests.push_back({"manager_empty_nick_gets_default", [] {
                     auto config = sbt::fast_accounts_config();
                     config.default_nick = "relay";
                     ManagerFixture fx({}, config);
                     auto info = sbt::account("ops");
                     info.nick = "";
                     fx.add(info);
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto record = fx.fleet.latest("ops");
                     require(record != nullptr && record->initial().nick == "relay",
                             "default nick not applied");
                   }});

  tests.push_back({"manager_restarts_dead_clients_on_refresh", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto first = fx.fleet.latest("ops");
                     first->fail("connection reset by peer");
                     require(sbt::wait_until([&] { return first->dying(); }), "client not dying");

                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(first->stopped(), "dead client was not reaped");
                     require(fx.fleet.created("ops") == 2, "dead client was not replaced");
                     require(fx.active_is({"ops"}), "account should still be active");
                     require(fx.manager->state() == acc::ManagerState::Running,
                             "client death must not stop the manager");
                   }});

  tests.push_back({"manager_skips_unknown_kinds", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("pigeon", "carrier-pigeon"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.active_is({"ops"}), "unknown kind should be skipped");
                   }});

  tests.push_back({"manager_config_read_failure_keeps_clients", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto record = fx.fleet.latest("ops");

                     fx.faulty.fail_reads = true;
                     require(fx.store.remove_account("ops").ok(), "remove failed");
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.active_is({"ops"}), "registry changed on a failed read");
                     require(!record->stopped(), "client stopped on a failed read");
                     require(fx.manager->state() == acc::ManagerState::Running,
                             "read failure must not stop the manager");
                   }});

  tests.push_back({"manager_first_activation_skips_backlog", [] {
                     ManagerFixture fx;
                     (void)sbt::queue_outgoing(fx.store, "ops", "stale one");
                     const auto backlog = sbt::queue_outgoing(fx.store, "ops", "stale two");
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     auto record = fx.fleet.latest("ops");
                     require(record->initial().last_id == backlog, "cursor not at the log end");
                     require(fx.cursor("ops") == backlog, "initial cursor not persisted");

                     const auto fresh = sbt::queue_outgoing(fx.store, "ops", "fresh");
                     require(sbt::wait_until([&] { return record->sent().size() == 1; }),
                             "fresh message not delivered");
                     std::this_thread::sleep_for(50ms);
                     const auto sent = record->sent();
                     require(sent.size() == 1 && sent[0].id == fresh, "backlog was replayed");
                   }});

  tests.push_back({"manager_first_activation_on_empty_log_survives_restart", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.manager->stop().ok(), "stop failed");
                     auto accounts = fx.store.read_account_config();
                     require(accounts.value()[0].cursor_set, "activation on an empty log not stored");
                     require(accounts.value()[0].last_id == 0, "cursor should start at 0");

                     // Queued while nothing was running.
                     const auto queued = sbt::queue_outgoing(fx.store, "ops", "while down");
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto record = fx.fleet.latest("ops");
                     require(fx.fleet.created("ops") == 2, "second run created no client");
                     require(record->initial().last_id == 0, "restart skipped past the queue");
                     require(sbt::wait_until([&] { return record->sent().size() == 1; }),
                             "message queued between runs was not delivered");
                     require(record->sent()[0].id == queued, "wrong message delivered");
                   }});

  tests.push_back({"manager_restarted_client_keeps_unacked_cursor", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto first = fx.fleet.latest("ops");
                     first->fail("connection reset by peer");
                     require(sbt::wait_until([&] { return first->dying(); }), "client not dying");

                     const auto queued = sbt::queue_outgoing(fx.store, "ops", "before any ack");
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.fleet.created("ops") == 2, "dead client was not replaced");
                     auto second = fx.fleet.latest("ops");
                     require(second->initial().last_id == 0, "replacement jumped to the log end");
                     require(sbt::wait_until([&] {
                               const auto sent = second->sent();
                               return std::any_of(sent.begin(), sent.end(), [&](const st::Message &m) {
                                 return m.id == queued;
                               });
                             }),
                             "message queued before the restart was not delivered");
                   }});

  tests.push_back({"manager_resumes_from_stored_cursor", [] {
                     ManagerFixture fx;
                     const auto first = sbt::queue_outgoing(fx.store, "ops", "done");
                     const auto second = sbt::queue_outgoing(fx.store, "ops", "pending");
                     fx.add(sbt::account("ops"));
                     require(fx.store.update_cursor("ops", first).ok(), "cursor update failed");
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     auto record = fx.fleet.latest("ops");
                     require(sbt::wait_until([&] { return record->sent().size() == 1; }),
                             "pending message not delivered");
                     require(record->sent()[0].id == second, "wrong message delivered");
                   }});

  tests.push_back({"tailer_delivers_in_order_and_echoes", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("dev"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     std::vector<std::int64_t> ids;
                     for (int i = 0; i < 5; ++i) {
                       ids.push_back(sbt::queue_outgoing(fx.store, "ops", "msg " + std::to_string(i)));
                     }
                     (void)sbt::queue_outgoing(fx.store, "dev", "not for ops");

                     auto record = fx.fleet.latest("ops");
                     require(sbt::wait_until([&] { return record->sent().size() == 5; }),
                             "messages not delivered");
                     const auto sent = record->sent();
                     for (std::size_t i = 0; i < ids.size(); ++i) {
                       require(sent[i].id == ids[i], "delivery out of order");
                       require(sent[i].account == "ops", "message for another account");
                     }

                     auto outgoing = fx.store.query("ops", st::Lane::Outgoing, 0, 100);
                     require(sbt::wait_until([&] {
                               auto echoed = fx.store.query("ops", st::Lane::Incoming, 0, 100);
                               return echoed.ok() && echoed.value().size() == 5;
                             }),
                             "delivered messages not echoed");
                     auto echoed = fx.store.query("ops", st::Lane::Incoming, 0, 100);
                     for (std::size_t i = 0; i < 5; ++i) {
                       require(echoed.value()[i].nonce == outgoing.value()[i].nonce,
                               "echo lost the nonce");
                     }
                   }});

  tests.push_back({"manager_ack_advances_persisted_cursor", [] {
                     ManagerFixture fx(sbt::FakeClientOptions{.auto_ack = true});
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     (void)sbt::queue_outgoing(fx.store, "ops", "one");
                     const auto last = sbt::queue_outgoing(fx.store, "ops", "two");
                     require(sbt::wait_until([&] { return fx.cursor("ops") == last; }),
                             "ack did not move the cursor");
                   }});

  tests.push_back({"manager_ignores_malformed_acks", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.store.update_cursor("ops", 7).ok(), "cursor update failed");
                     auto record = fx.fleet.latest("ops");

                     for (const std::string text : {"sent:abc", "sent:-3", "sent:", "ping"}) {
                       st::Message pong;
                       pong.command = "PONG";
                       pong.text = text;
                       require(record->push_incoming(pong), "push failed");
                     }
                     st::Message ack;
                     ack.command = "PONG";
                     ack.text = st::ack_text(3);
                     require(record->push_incoming(ack), "push failed");

                     // A refresh runs on the manager loop after everything queued before it.
                     require(fx.manager->refresh().ok(), "refresh failed");
                     require(fx.cursor("ops") == 7, "cursor changed by a bad or stale ack");
                     require(fx.manager->state() == acc::ManagerState::Running,
                             "malformed ack stopped the manager");
                     auto stored = fx.store.query("ops", st::Lane::Incoming, 0, 10);
                     require(stored.ok() && stored.value().empty(), "PONG stored as a message");
                   }});

  tests.push_back({"manager_persists_incoming_messages", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");
                     auto record = fx.fleet.latest("ops");

                     st::Message message;
                     message.nonce = "net-1";
                     message.channel = "#ops";
                     message.nick = "alice";
                     message.command = "PRIVMSG";
                     message.text = "deploy done";
                     require(record->push_incoming(message), "push failed");
                     require(record->push_incoming(message), "push failed");
                     require(fx.manager->refresh().ok(), "refresh failed");

                     auto stored = fx.store.query("ops", st::Lane::Incoming, 0, 10);
                     require(stored.ok(), stored.error());
                     require(stored.value().size() == 1, "duplicate incoming message stored");
                     require(stored.value()[0].text == "deploy done", "text mismatch");
                     require(fx.manager->state() == acc::ManagerState::Running,
                             "duplicate stopped the manager");
                   }});

  tests.push_back({"manager_incoming_store_failure_is_fatal", [] {
                     ManagerFixture fx;
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     fx.faulty.fail_incoming_inserts = true;
                     (void)sbt::queue_outgoing(fx.store, "ops", "will not echo");
                     require(sbt::wait_until([&] { return fx.manager->dying().stop_requested(); }),
                             "echo failure did not stop the manager");
                     auto status = fx.manager->stop();
                     require(!status.ok(), "stop should report the failure");
                     require(status.error().find("disk full") != std::string::npos,
                             "unexpected error: " + status.error());
                   }});

  tests.push_back({"manager_cursor_update_failure_is_fatal", [] {
                     ManagerFixture fx(sbt::FakeClientOptions{.auto_ack = true});
                     fx.add(sbt::account("ops"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     fx.faulty.fail_cursor_updates = true;
                     (void)sbt::queue_outgoing(fx.store, "ops", "acked");
                     require(sbt::wait_until([&] { return fx.manager->dying().stop_requested(); }),
                             "cursor failure did not stop the manager");
                     auto status = fx.manager->stop();
                     require(!status.ok() && status.error().find("read-only") != std::string::npos,
                             "stop should report the cursor failure");
                   }});

  tests.push_back({"manager_stop_drains_blocked_clients", [] {
                     auto config = sbt::fast_accounts_config();
                     config.incoming_capacity = 1;
                     ManagerFixture fx({}, config);
                     fx.add(sbt::account("ops"));
                     fx.add(sbt::account("dev"));
                     fx.start();
                     require(fx.manager->refresh().ok(), "refresh failed");

                     std::atomic<int> pushed{0};
                     std::vector<std::thread> flooders;
                     for (const std::string name : {"ops", "dev"}) {
                       auto record = fx.fleet.latest(name);
                       flooders.emplace_back([record, &pushed]() {
                         for (int i = 0; i < 200; ++i) {
                           st::Message message;
                           message.command = "PRIVMSG";
                           message.text = "flood " + std::to_string(i);
                           if (!record->push_incoming(message)) {
                             return;
                           }
                           pushed.fetch_add(1);
                         }
                       });
                     }
                     require(sbt::wait_until([&] { return pushed.load() > 4; }), "no traffic");

                     const auto begin = std::chrono::steady_clock::now();
                     require(fx.manager->stop().ok(), "stop reported an error");
                     require(std::chrono::steady_clock::now() - begin < 5s, "stop took too long");
                     for (auto &flooder : flooders) {
                       flooder.join();
                     }
                     require(fx.fleet.latest("ops")->stopped() && fx.fleet.latest("dev")->stopped(),
                             "clients not stopped");
                     require(fx.manager->active_accounts().empty(), "registry not cleared");
                   }});

  tests.push_back({"tailer_stops_when_client_dies", [] {
                     sbt::TempWorkspace workspace;
                     st::SqliteMessageStore store(workspace.path() / "switchboard.db");
                     const auto first = sbt::queue_outgoing(store, "ops", "one");
                     (void)sbt::queue_outgoing(store, "ops", "two");
                     (void)sbt::queue_outgoing(store, "ops", "three");

                     sbt::CollectingQueue incoming;
                     auto record = std::make_shared<sbt::FakeClientRecord>(sbt::account("ops"));
                     sbt::FakeAccountClient client(sbt::account("ops"),
                                                   acc::ClientContext{.incoming = incoming},
                                                   record, sbt::FakeClientOptions{.consume = false});
                     std::stop_source manager;
                     std::atomic<bool> fatal{false};
                     acc::Tailer tailer(client, store, manager.get_token(),
                                        [&](const std::string &) { fatal = true; },
                                        acc::TailerOptions{.poll_delay = 10ms});

                     // The queue holds one message; the second handoff blocks.
                     require(sbt::wait_until([&] { return tailer.cursor() == first; }),
                             "first message not handed off");
                     std::this_thread::sleep_for(30ms);
                     require(tailer.cursor() == first, "cursor passed an undelivered message");

                     record->fail("link down");
                     tailer.join();
                     require(tailer.cursor() == first, "cursor moved after the client died");
                     require(!fatal.load(), "client death is not fatal for the manager");
                     auto echoed = store.query("ops", st::Lane::Incoming, 0, 10);
                     require(echoed.ok() && echoed.value().size() == 1, "echo count mismatch");
                     require(!client.stop().ok(), "client should report its failure");
                   }});

  tests.push_back({"tailer_tolerates_replayed_echo", [] {
                     sbt::TempWorkspace workspace;
                     st::SqliteMessageStore store(workspace.path() / "switchboard.db");
                     const auto id = sbt::queue_outgoing(store, "ops", "resent after crash");
                     auto rows = store.query("ops", st::Lane::Outgoing, 0, 1);
                     require(store.insert(rows.value()[0], st::Lane::Incoming).ok(),
                             "seeding the echo failed");

                     sbt::CollectingQueue incoming;
                     auto record = std::make_shared<sbt::FakeClientRecord>(sbt::account("ops"));
                     sbt::FakeAccountClient client(sbt::account("ops"),
                                                   acc::ClientContext{.incoming = incoming}, record);
                     std::stop_source manager;
                     std::atomic<bool> fatal{false};
                     acc::Tailer tailer(client, store, manager.get_token(),
                                        [&](const std::string &) { fatal = true; },
                                        acc::TailerOptions{.poll_delay = 10ms});

                     require(sbt::wait_until([&] { return tailer.cursor() == id; }),
                             "replayed message not delivered");
                     manager.request_stop();
                     tailer.join();
                     require(!fatal.load(), "duplicate echo treated as fatal");
                     require(record->sent().size() == 1, "message not handed to the client");
                     auto echoed = store.query("ops", st::Lane::Incoming, 0, 10);
                     require(echoed.ok() && echoed.value().size() == 1, "echo duplicated");
                     require(client.stop().ok(), "clean stop reported an error");
                   }});

  tests.push_back({"tailer_large_backlog_arrives_in_batches", [] {
                     sbt::TempWorkspace workspace;
                     st::SqliteMessageStore store(workspace.path() / "switchboard.db");
                     std::int64_t last = 0;
                     for (int i = 0; i < 25; ++i) {
                       last = sbt::queue_outgoing(store, "ops", "bulk " + std::to_string(i));
                     }

                     sbt::CollectingQueue incoming;
                     auto record = std::make_shared<sbt::FakeClientRecord>(sbt::account("ops"));
                     sbt::FakeAccountClient client(sbt::account("ops"),
                                                   acc::ClientContext{.incoming = incoming}, record);
                     std::stop_source manager;
                     acc::Tailer tailer(client, store, manager.get_token(), [](const std::string &) {},
                                        acc::TailerOptions{.poll_delay = 10ms, .batch_size = 10});
                     require(sbt::wait_until([&] { return tailer.cursor() == last; }),
                             "backlog not drained");
                     manager.request_stop();
                     tailer.join();
                     const auto sent = record->sent();
                     require(sent.size() == 25, "delivered count mismatch");
                     require(std::is_sorted(sent.begin(), sent.end(),
                                            [](const st::Message &a, const st::Message &b) {
                                              return a.id < b.id;
                                            }),
                             "batches delivered out of order");
                   }});

  tests.push_back({"tailer_echo_failure_calls_fatal", [] {
                     sbt::TempWorkspace workspace;
                     st::SqliteMessageStore store(workspace.path() / "switchboard.db");
                     sbt::FaultyStore faulty(store);
                     faulty.fail_incoming_inserts = true;
                     (void)sbt::queue_outgoing(store, "ops", "doomed");

                     sbt::CollectingQueue incoming;
                     auto record = std::make_shared<sbt::FakeClientRecord>(sbt::account("ops"));
                     sbt::FakeAccountClient client(sbt::account("ops"),
                                                   acc::ClientContext{.incoming = incoming}, record);
                     std::stop_source manager;
                     std::mutex mutex;
                     std::string error;
                     acc::Tailer tailer(client, faulty, manager.get_token(),
                                        [&](const std::string &message) {
                                          std::lock_guard<std::mutex> lock(mutex);
                                          error = message;
                                        },
                                        acc::TailerOptions{.poll_delay = 10ms});
                     tailer.join();
                     std::lock_guard<std::mutex> lock(mutex);
                     require(error == "disk full", "fatal handler not called: " + error);
                     require(tailer.cursor() == 0, "cursor advanced past a failed echo");
                   }});
}
