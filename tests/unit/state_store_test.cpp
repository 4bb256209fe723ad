#include "internal/core/state_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "hooked_repository.hpp"
#include "internal/core/schema_initializer.hpp"
#include "internal/util/errors.hpp"

namespace {

using connstate::core::HistoryEvent;
using connstate::core::HistoryQuery;
using connstate::core::SchemaInitializer;
using connstate::core::StateStore;
using connstate::db::ErrorCode;
using connstate::db::Result;
using connstate::db::model::HistoryAction;
using connstate::testing::HookedRepository;
using connstate::util::TransactionError;
using connstate::util::ValidationError;
using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<HookedRepository> repo = std::make_shared<HookedRepository>();
  std::unique_ptr<StateStore>       store;

  Fixture() {
    SchemaInitializer(repo).EnsureSchema();
    store = std::make_unique<StateStore>(repo);
  }

  std::vector<HistoryEvent> History() {
    return store->History();
  }
};

template <typename Fn>
bool ThrowsTransactionError(Fn&& fn) {
  try {
    fn();
  } catch (const TransactionError&) {
    return true;
  }
  return false;
}

void TestStartsDisconnected() {
  Fixture f;
  assert(!f.store->GetCurrent().has_value());
  assert(!f.store->IsConnected());
  assert(f.History().empty());
}

void TestConnectRoundTrip() {
  Fixture f;
  f.store->Connect("c1", "g1");

  auto current = f.store->GetCurrent();
  assert(current.has_value());
  assert(current->channel_id == "c1");
  assert(current->guild_id == std::optional<std::string>("g1"));
  assert(current->connected_at == current->last_updated);
  assert(f.store->IsConnected());

  auto history = f.History();
  assert(history.size() == 1);
  assert(history[0].action == HistoryAction::kConnect);
  assert(history[0].channel_id == "c1");
  assert(history[0].timestamp == current->connected_at);
  assert(!history[0].error_message.has_value());
}

void TestConnectWithoutGuild() {
  Fixture f;
  f.store->Connect("c1");

  auto current = f.store->GetCurrent();
  assert(current.has_value());
  assert(!current->guild_id.has_value());
  assert(!f.History()[0].guild_id.has_value());
}

void TestSupersedeLogsPreviousConnection() {
  Fixture f;
  f.store->Connect("chan-A", "guild-1");
  assert(f.store->GetCurrent()->channel_id == "chan-A");

  f.store->Connect("chan-B", "guild-1");

  auto history = f.History();
  assert(history.size() == 3);
  assert(history[0].action == HistoryAction::kConnect && history[0].channel_id == "chan-A");
  assert(history[1].action == HistoryAction::kDisconnect && history[1].channel_id == "chan-A");
  assert(history[1].guild_id == std::optional<std::string>("guild-1"));
  assert(history[1].error_message == std::optional<std::string>(StateStore::kSupersededMessage));
  assert(history[2].action == HistoryAction::kConnect && history[2].channel_id == "chan-B");

  auto current = f.store->GetCurrent();
  assert(current->channel_id == "chan-B");
  assert(current->guild_id == std::optional<std::string>("guild-1"));
}

void TestReconnectSameChannelStillLogsSupersede() {
  Fixture f;
  f.store->Connect("chan-A");
  const auto first = f.store->GetCurrent()->connected_at;
  f.store->Connect("chan-A");

  auto history = f.History();
  assert(history.size() == 3);
  assert(history[1].action == HistoryAction::kDisconnect);
  assert(f.store->GetCurrent()->connected_at >= first);
}

void TestDisconnectReturnsRemovedSnapshot() {
  Fixture f;
  f.store->Connect("c1", "g1");
  const auto before = *f.store->GetCurrent();

  auto removed = f.store->Disconnect();
  assert(removed.has_value());
  assert(removed->channel_id == before.channel_id);
  assert(removed->guild_id == before.guild_id);
  assert(removed->connected_at == before.connected_at);
  assert(removed->last_updated == before.last_updated);

  assert(!f.store->IsConnected());

  auto history = f.History();
  assert(history.size() == 2);
  assert(history[1].action == HistoryAction::kDisconnect);
  assert(history[1].channel_id == "c1");
  assert(!history[1].error_message.has_value());
}

void TestDisconnectWhenDisconnectedIsNoOp() {
  Fixture f;
  assert(!f.store->Disconnect().has_value());
  assert(f.History().empty());

  f.store->Connect("c1");
  assert(f.store->Disconnect().has_value());
  const auto count = f.History().size();

  assert(!f.store->Disconnect().has_value());
  assert(f.History().size() == count);
}

void TestHistoryIdsStrictlyIncrease() {
  Fixture f;
  for (int i = 0; i < 5; ++i) {
    f.store->Connect("chan-" + std::to_string(i));
    if (i % 2 == 1) f.store->Disconnect();
  }

  auto history = f.History();
  assert(history.size() == 5 + 2 + 2);
  for (std::size_t i = 1; i < history.size(); ++i) {
    assert(history[i].id > history[i - 1].id);
    assert(history[i].timestamp >= history[i - 1].timestamp);
  }
}

void TestHistoryQueryFiltersAndPages() {
  Fixture f;
  f.store->Connect("chan-A");
  f.store->Connect("chan-B");
  f.store->Disconnect();

  HistoryQuery by_channel;
  by_channel.filter.channel_id = "chan-A";
  auto a_events                = f.store->History(by_channel);
  assert(a_events.size() == 2);

  HistoryQuery by_action;
  by_action.filter.action = HistoryAction::kDisconnect;
  auto disconnects        = f.store->History(by_action);
  assert(disconnects.size() == 2);
  assert(disconnects[0].channel_id == "chan-A");
  assert(disconnects[1].channel_id == "chan-B");

  HistoryQuery page;
  page.pagination.limit  = 2;
  page.pagination.offset = 1;
  auto paged             = f.store->History(page);
  assert(paged.size() == 2);
  assert(paged[0].action == HistoryAction::kDisconnect);
  assert(paged[1].channel_id == "chan-B");
}

void TestEmptyChannelIsValidationError() {
  Fixture f;
  bool    threw = false;
  try {
    f.store->Connect("", "g1");
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(f.repo->begin_calls == 0);
  assert(f.History().empty());
}

void TestUpsertFailureRollsBackAndLogsError() {
  Fixture f;
  f.store->Connect("chan-A", "guild-1");

  f.repo->on_upsert_current_status = [](const auto&) { return Result::Err(ErrorCode::IOError, "simulated write failure"); };
  assert(ThrowsTransactionError([&] { f.store->Connect("chan-B", "guild-2"); }));
  f.repo->ClearHooks();

  // Supersede DISCONNECT was written in the same transaction and is gone too.
  auto current = f.store->GetCurrent();
  assert(current.has_value());
  assert(current->channel_id == "chan-A");

  auto history = f.History();
  assert(history.size() == 2);
  assert(history[0].action == HistoryAction::kConnect);
  assert(history[1].action == HistoryAction::kError);
  assert(history[1].channel_id == "chan-B");
  assert(history[1].guild_id == std::optional<std::string>("guild-2"));
  assert(history[1].error_message.has_value());
  assert(history[1].error_message->find("simulated write failure") != std::string::npos);
}

void TestFailedErrorLogDoesNotMaskPrimaryError() {
  Fixture f;
  f.repo->on_upsert_current_status = [](const auto&) { return Result::Err(ErrorCode::IOError, "primary failure"); };
  f.repo->on_append_history        = [](const auto& record) {
    if (record.action == HistoryAction::kError) return Result::Err(ErrorCode::IOError, "audit failure");
    return Result::Ok();
  };

  std::string message;
  try {
    f.store->Connect("chan-A");
  } catch (const TransactionError& e) {
    message = e.what();
  }
  f.repo->ClearHooks();

  assert(message.find("primary failure") != std::string::npos);
  assert(message.find("audit failure") == std::string::npos);
  assert(!f.store->IsConnected());
  assert(f.History().empty());
}

void TestBeginFailureStillLeavesTrace() {
  Fixture f;
  int     attempts = 0;
  f.repo->on_begin = [&attempts]() {
    if (attempts++ == 0) throw std::runtime_error("database is locked");
  };

  assert(ThrowsTransactionError([&] { f.store->Connect("chan-A"); }));
  f.repo->ClearHooks();

  auto history = f.History();
  assert(history.size() == 1);
  assert(history[0].action == HistoryAction::kError);
  assert(history[0].channel_id == "chan-A");
  assert(!f.store->IsConnected());
}

void TestErrorLogBeginFailureIsSwallowed() {
  Fixture f;
  f.repo->on_begin = []() { throw std::runtime_error("store unavailable"); };

  // Both the primary and the best-effort transaction fail to open; only the
  // primary error surfaces.
  std::string message;
  try {
    f.store->Connect("chan-A");
  } catch (const TransactionError& e) {
    message = e.what();
  }
  assert(message.find("store unavailable") != std::string::npos);
  assert(f.repo->begin_calls == 2);
}

void TestDisconnectFailureUsesObservedChannel() {
  Fixture f;
  f.store->Connect("chan-A", "guild-1");

  f.repo->on_delete_current_status = []() { return Result::Err(ErrorCode::Busy, "simulated delete failure"); };
  assert(ThrowsTransactionError([&] { (void)f.store->Disconnect(); }));
  f.repo->ClearHooks();

  assert(f.store->GetCurrent()->channel_id == "chan-A");

  auto history = f.History();
  assert(history.size() == 2);
  assert(history[1].action == HistoryAction::kError);
  assert(history[1].channel_id == "chan-A");
  assert(history[1].guild_id == std::optional<std::string>("guild-1"));
}

void TestDisconnectFailureBeforeReadUsesPlaceholder() {
  Fixture f;
  f.store->Connect("chan-A");

  f.repo->on_get_current_status = []() { throw std::runtime_error("disk I/O error"); };
  assert(ThrowsTransactionError([&] { (void)f.store->Disconnect(); }));
  f.repo->ClearHooks();

  auto history = f.History();
  assert(history.size() == 2);
  assert(history[1].action == HistoryAction::kError);
  assert(history[1].channel_id == StateStore::kUnknownChannel);
  assert(!history[1].guild_id.has_value());
  assert(history[1].error_message->find("disk I/O error") != std::string::npos);
  assert(f.store->IsConnected());
}

void TestReadFailuresPropagate() {
  Fixture f;
  f.store->Connect("chan-A");

  f.repo->on_get_current_status = []() { throw std::runtime_error("disk I/O error"); };
  assert(ThrowsTransactionError([&] { (void)f.store->GetCurrent(); }));
  assert(ThrowsTransactionError([&] { (void)f.store->IsConnected(); }));
  f.repo->ClearHooks();

  // Reads never write to history.
  assert(f.History().size() == 1);
}

void TestTimestampsFollowCommitOrder() {
  Fixture f;

  // The first writer is held up before it can take the write lock; a
  // rival connects and commits in the meantime.
  bool raced       = false;
  f.repo->on_begin = [&]() {
    if (raced) return;
    raced = true;
    std::this_thread::sleep_for(2ms);
    std::thread rival([&]() { f.store->Connect("chan-B"); });
    rival.join();
    std::this_thread::sleep_for(2ms);
  };
  f.store->Connect("chan-A");
  f.repo->ClearHooks();

  auto history = f.History();
  assert(history.size() == 3);
  assert(history[0].action == HistoryAction::kConnect && history[0].channel_id == "chan-B");
  assert(history[1].action == HistoryAction::kDisconnect && history[1].channel_id == "chan-B");
  assert(history[2].action == HistoryAction::kConnect && history[2].channel_id == "chan-A");
  for (std::size_t i = 1; i < history.size(); ++i) {
    assert(history[i].timestamp >= history[i - 1].timestamp);
  }

  auto current = f.store->GetCurrent();
  assert(current->channel_id == "chan-A");
  assert(current->connected_at > history[0].timestamp);
}

void TestCommitFailureRollsBackAndLogsError() {
  Fixture f;
  f.store->Connect("chan-A", "guild-1");

  int commits       = 0;
  f.repo->on_commit = [&commits]() {
    if (commits++ == 0) throw std::runtime_error("simulated commit failure");
  };

  std::string message;
  try {
    f.store->Connect("chan-B", "guild-2");
  } catch (const TransactionError& e) {
    message = e.what();
  }
  f.repo->ClearHooks();

  assert(message.find("simulated commit failure") != std::string::npos);
  assert(f.store->GetCurrent()->channel_id == "chan-A");

  auto history = f.History();
  assert(history.size() == 2);
  assert(history[1].action == HistoryAction::kError);
  assert(history[1].channel_id == "chan-B");
  assert(history[1].error_message->find("simulated commit failure") != std::string::npos);
}

void TestRollbackFailureKeepsPrimaryError() {
  Fixture f;
  f.repo->on_upsert_current_status = [](const auto&) { return Result::Err(ErrorCode::IOError, "simulated write failure"); };
  f.repo->on_rollback              = []() { throw std::runtime_error("simulated rollback failure"); };

  std::string message;
  try {
    f.store->Connect("chan-A");
  } catch (const TransactionError& e) {
    message = e.what();
  }
  f.repo->ClearHooks();

  assert(message.find("simulated write failure") != std::string::npos);
  assert(message.find("simulated rollback failure") == std::string::npos);

  // The abandoned transaction still released its lock and discarded its writes.
  assert(!f.store->IsConnected());
  auto history = f.History();
  assert(history.size() == 1);
  assert(history[0].action == HistoryAction::kError);
  assert(history[0].error_message->find("simulated write failure") != std::string::npos);
}

} // namespace

int main() {
  TestStartsDisconnected();
  TestConnectRoundTrip();
  TestConnectWithoutGuild();
  TestSupersedeLogsPreviousConnection();
  TestReconnectSameChannelStillLogsSupersede();
  TestDisconnectReturnsRemovedSnapshot();
  TestDisconnectWhenDisconnectedIsNoOp();
  TestHistoryIdsStrictlyIncrease();
  TestHistoryQueryFiltersAndPages();
  TestEmptyChannelIsValidationError();
  TestUpsertFailureRollsBackAndLogsError();
  TestFailedErrorLogDoesNotMaskPrimaryError();
  TestBeginFailureStillLeavesTrace();
  TestErrorLogBeginFailureIsSwallowed();
  TestDisconnectFailureUsesObservedChannel();
  TestDisconnectFailureBeforeReadUsesPlaceholder();
  TestReadFailuresPropagate();
  TestTimestampsFollowCommitOrder();
  TestCommitFailureRollsBackAndLogsError();
  TestRollbackFailureKeepsPrimaryError();

  std::cout << "connstate_unit_state_store: pass\n";
  return 0;
}
