#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "txledger/common/spsc_ring.hpp"
#include "txledger/ledger/account.hpp"
#include "txledger/ledger/command.hpp"
#include "txledger/router/ingestion_router.hpp"
#include "txledger/router/route_outcome.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace txledger {
namespace router {

// Partitions clients across worker threads by `client % shards`. Each worker
// owns its partition's accounts outright, so a client's commands are handled
// by exactly one thread in the order route() was called. route() must only be
// called from a single dispatcher thread.
class ShardedRouter {
 public:
  static constexpr std::size_t kMaxShards = 256;

  struct Config {
    std::size_t shards{4};
    std::size_t queue_depth{1 << 12};
  };

  explicit ShardedRouter(const Config& config, telemetry::TelemetrySink* telemetry = nullptr);
  ShardedRouter(const ShardedRouter&) = delete;
  ShardedRouter& operator=(const ShardedRouter&) = delete;
  ShardedRouter(ShardedRouter&&) = delete;
  ShardedRouter& operator=(ShardedRouter&&) = delete;
  ~ShardedRouter();

  // Enqueues the command for its client's shard, waiting while that shard's
  // queue is full.
  void route(const ledger::Command& command);

  // Drains every queue and joins the workers. Idempotent.
  void finish();

  // Both require finish() to have been called.
  [[nodiscard]] ledger::Snapshot snapshot() const;
  [[nodiscard]] RouterStats stats() const;

  [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }
  [[nodiscard]] std::size_t shard_of(common::ClientId client) const noexcept { return client % shards_.size(); }

 private:
  struct Shard {
    Shard(std::size_t queue_depth, telemetry::TelemetrySink* telemetry)
        : queue(queue_depth), router(telemetry) {}

    common::SpscRing<ledger::Command> queue;
    IngestionRouter router;
    std::thread worker;
    // Set by the worker before it parks on an empty queue.
    std::atomic<bool> parked{false};
  };

  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<bool> closing_{false};
  bool finished_{false};

  static void run(Shard& shard, const std::atomic<bool>& closing);
  static void wake(Shard& shard);
  void stop_workers();
  void require_finished(const char* operation) const;
};

}  // namespace router
}  // namespace txledger
