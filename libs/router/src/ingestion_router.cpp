#include "txledger/router/ingestion_router.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "txledger/common/time_utils.hpp"

namespace txledger {
namespace router {

IngestionRouter::IngestionRouter(telemetry::TelemetrySink* telemetry) : telemetry_(telemetry) {}

IngestionRouter::IngestionRouter(AccountBook accounts, telemetry::TelemetrySink* telemetry)
    : accounts_(std::move(accounts)), telemetry_(telemetry) {}

RouteOutcome IngestionRouter::route(const ledger::Command& command) {
  const auto started = common::now_steady();

  auto [it, inserted] = accounts_.try_emplace(command.actor_id(), command.actor_id());
  if (inserted) {
    spdlog::debug("opened account for client {}", command.client);
  }

  const auto outcome = dispatch(it->second, command);
  stats_.record(outcome);
  report(command, outcome);

  if (telemetry_) {
    telemetry_->record_latency(telemetry::Metric::kRouteLatency, common::elapsed_since(started));
  }
  return outcome;
}

ledger::Snapshot IngestionRouter::snapshot() const {
  ledger::Snapshot out;
  for (const auto& [client, account] : accounts_) {
    out.emplace(client, account.view());
  }
  return out;
}

void IngestionRouter::report(const ledger::Command& command, const RouteOutcome& outcome) {
  if (outcome.accepted()) {
    spdlog::trace("applied {} client={} tx={} events={}", ledger::to_string(command.kind), command.client,
                  command.tx, outcome.events_applied);
  } else {
    spdlog::warn("rejected {} client={} tx={}: {}", ledger::to_string(command.kind), command.client, command.tx,
                 ledger::to_string(outcome.rejection));
  }

  if (!telemetry_) {
    return;
  }
  telemetry_->increment(telemetry::Metric::kCommandsRouted);
  if (outcome.accepted()) {
    telemetry_->increment(telemetry::Metric::kCommandsApplied);
    telemetry_->increment(telemetry::Metric::kEventsApplied, static_cast<std::int64_t>(outcome.events_applied));
  } else {
    telemetry_->increment(telemetry::Metric::kCommandsRejected);
  }
}

}  // namespace router
}  // namespace txledger
