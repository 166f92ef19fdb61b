#include "test_router.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "txledger/router/ingestion_router.hpp"
#include "txledger/router/sharded_router.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace txledger::tests {

namespace {

using common::Currency;
using ledger::Command;
using ledger::CommandKind;
using ledger::Rejection;

Command make(CommandKind kind, common::ClientId client, common::TransactionId tx, const char* value = nullptr) {
  Command command{.kind = kind, .client = client, .tx = tx, .amount = std::nullopt};
  if (value) {
    command.amount = *Currency::parse(value);
  }
  return command;
}

// Interleaves several clients; each client's sub-stream is order-sensitive.
std::vector<Command> mixed_stream() {
  std::vector<Command> stream;
  for (common::ClientId client = 1; client <= 40; ++client) {
    stream.push_back(make(CommandKind::kDeposit, client, client * 100u, "10.5"));
  }
  for (common::ClientId client = 1; client <= 40; ++client) {
    stream.push_back(make(CommandKind::kWithdraw, client, client * 100u + 1, "0.5"));
    stream.push_back(make(CommandKind::kDispute, client, client * 100u));
    if (client % 3 == 0) {
      stream.push_back(make(CommandKind::kChargeback, client, client * 100u));
      stream.push_back(make(CommandKind::kDeposit, client, client * 100u + 2, "1"));
    } else if (client % 3 == 1) {
      stream.push_back(make(CommandKind::kResolve, client, client * 100u));
    }
    stream.push_back(make(CommandKind::kWithdraw, client, client * 100u + 3, "1000"));
  }
  return stream;
}

}  // namespace

void test_router_creates_accounts_lazily() {
  router::IngestionRouter router;
  assert(router.snapshot().empty());

  // A client is known from its first command, even a rejected one.
  const auto outcome = router.route(make(CommandKind::kDispute, 7, 1));
  assert(outcome.rejection == Rejection::kUnknownTransaction);
  assert(router.accounts().size() == 1);

  const auto snapshot = router.snapshot();
  assert(snapshot.size() == 1);
  const auto& view = snapshot.at(7);
  assert(view.client == 7);
  assert(view.available == Currency{});
  assert(view.held == Currency{});
  assert(view.total == Currency{});
  assert(!view.locked);
}

void test_router_skips_rejected_commands() {
  router::IngestionRouter router;

  assert(router.route(make(CommandKind::kDeposit, 1, 10, "99")).accepted());
  assert(router.route(make(CommandKind::kWithdraw, 1, 11, "150")).rejection == Rejection::kInsufficientFunds);
  assert(router.route(make(CommandKind::kDeposit, 1, 10, "99")).rejection == Rejection::kDuplicateTransaction);
  assert(router.route(make(CommandKind::kDispute, 1, 10)).accepted());
  const auto chargeback = router.route(make(CommandKind::kChargeback, 1, 10));
  assert(chargeback.accepted());
  assert(chargeback.events_applied == 2);
  assert(router.route(make(CommandKind::kDeposit, 1, 12, "5")).rejection == Rejection::kLockedAccount);

  const auto view = router.snapshot().at(1);
  assert(view.available == Currency{});
  assert(view.held == Currency{});
  assert(view.total == Currency{});
  assert(view.locked);

  const auto& stats = router.stats();
  assert(stats.routed == 6);
  assert(stats.applied == 3);
  assert(stats.rejected == 3);
  assert(stats.rejections(Rejection::kInsufficientFunds) == 1);
  assert(stats.rejections(Rejection::kDuplicateTransaction) == 1);
  assert(stats.rejections(Rejection::kLockedAccount) == 1);
}

void test_router_isolates_clients() {
  router::IngestionRouter router;

  router.route(make(CommandKind::kDeposit, 1, 1, "10"));
  router.route(make(CommandKind::kDeposit, 2, 2, "20"));
  // tx 1 belongs to client 1; client 2 cannot dispute it.
  assert(router.route(make(CommandKind::kDispute, 2, 1)).rejection == Rejection::kUnknownTransaction);
  assert(router.route(make(CommandKind::kDispute, 1, 1)).accepted());
  assert(router.route(make(CommandKind::kChargeback, 1, 1)).accepted());

  const auto snapshot = router.snapshot();
  assert(snapshot.at(1).locked);
  assert(snapshot.at(1).total == Currency{});
  assert(!snapshot.at(2).locked);
  assert(snapshot.at(2).available == *Currency::parse("20"));
}

void test_router_account_book_round_trip() {
  router::AccountBook book;
  {
    router::IngestionRouter first{std::move(book)};
    first.route(make(CommandKind::kDeposit, 3, 1, "4.25"));
    book = std::move(first).release_accounts();
  }
  assert(book.size() == 1);
  assert(book.at(3).version() == 1);

  // A second router continues the same history.
  router::IngestionRouter second{std::move(book)};
  assert(second.route(make(CommandKind::kDispute, 3, 1)).accepted());
  const auto view = second.snapshot().at(3);
  assert(view.held == *Currency::parse("4.25"));
  assert(view.available == Currency{});
}

void test_router_records_telemetry() {
  telemetry::TelemetrySink sink;
  router::IngestionRouter router{&sink};

  router.route(make(CommandKind::kDeposit, 1, 1, "1"));
  router.route(make(CommandKind::kDispute, 1, 1));
  router.route(make(CommandKind::kChargeback, 1, 1));
  router.route(make(CommandKind::kDeposit, 1, 2, "1"));

  assert(sink.counter(telemetry::Metric::kCommandsRouted) == 4);
  assert(sink.counter(telemetry::Metric::kCommandsApplied) == 3);
  assert(sink.counter(telemetry::Metric::kCommandsRejected) == 1);
  assert(sink.counter(telemetry::Metric::kEventsApplied) == 4);

  const auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().metric == telemetry::Metric::kRouteLatency);
  assert(latency.front().count == 4);
}

void test_sharded_router_matches_sequential() {
  const auto stream = mixed_stream();

  router::IngestionRouter sequential;
  for (const auto& command : stream) {
    sequential.route(command);
  }

  for (const std::size_t shards : {std::size_t{1}, std::size_t{3}, std::size_t{8}}) {
    telemetry::TelemetrySink sink;
    // A tiny queue forces the dispatcher to wait on full rings.
    router::ShardedRouter sharded{{.shards = shards, .queue_depth = 4}, &sink};
    for (const auto& command : stream) {
      sharded.route(command);
    }
    sharded.finish();

    assert(sharded.snapshot() == sequential.snapshot());
    const auto stats = sharded.stats();
    assert(stats.routed == sequential.stats().routed);
    assert(stats.applied == sequential.stats().applied);
    assert(stats.rejected_by_reason == sequential.stats().rejected_by_reason);
    assert(sink.counter(telemetry::Metric::kCommandsRouted) == static_cast<std::int64_t>(stream.size()));
  }

  const auto snapshot = sequential.snapshot();
  assert(snapshot.size() == 40);
  assert(snapshot.at(3).locked);
  assert(snapshot.at(3).total == *Currency::parse("-0.5"));
  assert(snapshot.at(4).available == *Currency::parse("10"));
  assert(snapshot.at(5).held == *Currency::parse("10.5"));
}

void test_sharded_router_lifecycle() {
  bool threw = false;
  try {
    router::ShardedRouter invalid{{.shards = 0, .queue_depth = 16}};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    router::ShardedRouter invalid{{.shards = router::ShardedRouter::kMaxShards + 1, .queue_depth = 16}};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  router::ShardedRouter sharded{{.shards = 2, .queue_depth = 16}};
  assert(sharded.shard_count() == 2);
  assert(sharded.shard_of(4) == 0);
  assert(sharded.shard_of(5) == 1);

  threw = false;
  try {
    (void)sharded.snapshot();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  sharded.route(make(CommandKind::kDeposit, 5, 1, "2"));
  sharded.finish();
  sharded.finish();
  assert(sharded.snapshot().at(5).available == *Currency::parse("2"));

  threw = false;
  try {
    sharded.route(make(CommandKind::kDeposit, 5, 2, "2"));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void test_sharded_router_wakes_idle_workers() {
  using namespace std::chrono_literals;

  // Nothing routed: parked workers must still be released by finish().
  {
    router::ShardedRouter idle{{.shards = 4, .queue_depth = 16}};
    std::this_thread::sleep_for(20ms);
    idle.finish();
    assert(idle.snapshot().empty());
  }

  // Commands trickle in with pauses long enough for every worker to park.
  const auto stream = mixed_stream();
  router::IngestionRouter sequential;
  router::ShardedRouter sharded{{.shards = 4, .queue_depth = 8}};
  for (std::size_t i = 0; i < stream.size(); ++i) {
    sequential.route(stream[i]);
    sharded.route(stream[i]);
    if (i % 25 == 0) {
      std::this_thread::sleep_for(5ms);
    }
  }
  std::this_thread::sleep_for(10ms);
  sharded.finish();

  assert(sharded.snapshot() == sequential.snapshot());
  assert(sharded.stats().routed == stream.size());
  assert(sharded.stats().applied == sequential.stats().applied);
}

}  // namespace txledger::tests
