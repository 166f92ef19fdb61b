#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>

#include "txledger/common/types.hpp"
#include "txledger/ledger/account.hpp"
#include "txledger/ledger/command.hpp"
#include "txledger/router/route_outcome.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace txledger {
namespace router {

using AccountBook = std::unordered_map<common::ClientId, ledger::Account>;

// Sequential router: feeds each command to its client's account in arrival
// order, creating the account on first reference. Rejected commands are
// logged and dropped.
class IngestionRouter {
 public:
  explicit IngestionRouter(telemetry::TelemetrySink* telemetry = nullptr);
  explicit IngestionRouter(AccountBook accounts, telemetry::TelemetrySink* telemetry = nullptr);

  RouteOutcome route(const ledger::Command& command);

  [[nodiscard]] ledger::Snapshot snapshot() const;
  [[nodiscard]] const RouterStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const AccountBook& accounts() const noexcept { return accounts_; }
  [[nodiscard]] AccountBook release_accounts() && { return std::move(accounts_); }

 private:
  AccountBook accounts_{};
  RouterStats stats_{};
  telemetry::TelemetrySink* telemetry_{nullptr};

  void report(const ledger::Command& command, const RouteOutcome& outcome);
};

}  // namespace router
}  // namespace txledger
