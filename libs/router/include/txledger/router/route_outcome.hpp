#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "txledger/ledger/account.hpp"
#include "txledger/ledger/actor.hpp"
#include "txledger/ledger/command.hpp"
#include "txledger/ledger/event.hpp"

namespace txledger {
namespace router {

struct RouteOutcome {
  ledger::Rejection rejection{ledger::Rejection::kNone};
  std::size_t events_applied{0};

  [[nodiscard]] bool accepted() const noexcept { return rejection == ledger::Rejection::kNone; }
};

struct RouterStats {
  std::uint64_t routed{0};
  std::uint64_t applied{0};
  std::uint64_t rejected{0};
  std::array<std::uint64_t, ledger::kRejectionKinds> rejected_by_reason{};

  void record(const RouteOutcome& outcome) noexcept {
    ++routed;
    if (outcome.accepted()) {
      ++applied;
      return;
    }
    ++rejected;
    ++rejected_by_reason[static_cast<std::size_t>(outcome.rejection)];
  }

  void merge(const RouterStats& other) noexcept {
    routed += other.routed;
    applied += other.applied;
    rejected += other.rejected;
    for (std::size_t i = 0; i < rejected_by_reason.size(); ++i) {
      rejected_by_reason[i] += other.rejected_by_reason[i];
    }
  }

  [[nodiscard]] std::uint64_t rejections(ledger::Rejection reason) const noexcept {
    return rejected_by_reason[static_cast<std::size_t>(reason)];
  }
};

// One decide-then-apply step against a single aggregate. The aggregate is
// only mutated when handle() accepts the command.
template <typename A>
  requires ledger::Actor<A, ledger::Command, ledger::Event>
RouteOutcome dispatch(A& actor, const ledger::Command& command) {
  auto decision = actor.handle(command);
  if (!decision.accepted()) {
    return RouteOutcome{.rejection = decision.rejection, .events_applied = 0};
  }
  actor.apply(decision.events);
  return RouteOutcome{.rejection = ledger::Rejection::kNone, .events_applied = decision.events.size()};
}

}  // namespace router
}  // namespace txledger
