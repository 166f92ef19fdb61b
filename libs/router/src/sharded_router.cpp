#include "txledger/router/sharded_router.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace txledger {
namespace router {

ShardedRouter::ShardedRouter(const Config& config, telemetry::TelemetrySink* telemetry) {
  if (config.shards == 0 || config.shards > kMaxShards) {
    throw std::invalid_argument("sharded router needs between 1 and " + std::to_string(kMaxShards) +
                                " shards, got " + std::to_string(config.shards));
  }

  shards_.reserve(config.shards);
  for (std::size_t i = 0; i < config.shards; ++i) {
    shards_.push_back(std::make_unique<Shard>(config.queue_depth, telemetry));
  }
  try {
    for (auto& shard : shards_) {
      shard->worker = std::thread(&ShardedRouter::run, std::ref(*shard), std::cref(closing_));
    }
  } catch (const std::system_error& e) {
    spdlog::error("failed to start shard worker: {}", e.what());
    stop_workers();
    throw;
  }
  spdlog::debug("sharded router started with {} shards, queue depth {}", config.shards, config.queue_depth);
}

ShardedRouter::~ShardedRouter() {
  finish();
}

void ShardedRouter::route(const ledger::Command& command) {
  if (finished_) {
    throw std::logic_error("route() called after finish()");
  }

  auto& shard = *shards_[shard_of(command.client)];
  ledger::Command pending = command;
  while (!shard.queue.try_push(pending)) {
    std::this_thread::yield();
  }
  wake(shard);
}

void ShardedRouter::finish() {
  if (finished_) {
    return;
  }
  stop_workers();
  finished_ = true;
}

void ShardedRouter::stop_workers() {
  closing_.store(true, std::memory_order_seq_cst);
  for (auto& shard : shards_) {
    wake(*shard);
  }
  for (auto& shard : shards_) {
    if (shard->worker.joinable()) {
      shard->worker.join();
    }
  }
}

void ShardedRouter::wake(Shard& shard) {
  // Pairs with the fence in run(): either the worker sees the new item or
  // closing flag, or we see it parked.
  std::atomic_thread_fence(std::memory_order_seq_cst);
  if (shard.parked.load(std::memory_order_relaxed)) {
    shard.parked.store(false, std::memory_order_relaxed);
    shard.parked.notify_one();
  }
}

void ShardedRouter::run(Shard& shard, const std::atomic<bool>& closing) {
  ledger::Command command;
  while (true) {
    if (shard.queue.try_pop(command)) {
      shard.router.route(command);
      continue;
    }
    if (closing.load(std::memory_order_acquire)) {
      // Everything pushed before closing was set is visible now.
      while (shard.queue.try_pop(command)) {
        shard.router.route(command);
      }
      return;
    }

    shard.parked.store(true, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (!shard.queue.empty() || closing.load(std::memory_order_relaxed)) {
      shard.parked.store(false, std::memory_order_relaxed);
      continue;
    }
    shard.parked.wait(true, std::memory_order_acquire);
  }
}

ledger::Snapshot ShardedRouter::snapshot() const {
  require_finished("snapshot");
  ledger::Snapshot out;
  for (const auto& shard : shards_) {
    out.merge(shard->router.snapshot());
  }
  return out;
}

RouterStats ShardedRouter::stats() const {
  require_finished("stats");
  RouterStats out;
  for (const auto& shard : shards_) {
    out.merge(shard->router.stats());
  }
  return out;
}

void ShardedRouter::require_finished(const char* operation) const {
  if (!finished_) {
    throw std::logic_error(std::string(operation) + "() requires finish() first");
  }
}

}  // namespace router
}  // namespace txledger
