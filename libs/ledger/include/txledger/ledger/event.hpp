#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "txledger/common/currency.hpp"
#include "txledger/common/types.hpp"

namespace txledger {
namespace ledger {

enum class EventKind : std::uint8_t {
  kCredited,
  kDebited,
  kHeld,
  kReleased,
  kReversed,
  kLocked,
};

// Immutable record of an accepted change. `kLocked` carries no transaction,
// its `tx` and `amount` stay zero.
struct Event {
  EventKind kind{EventKind::kCredited};
  common::TransactionId tx{0};
  common::Currency amount{};

  [[nodiscard]] static constexpr Event credited(common::TransactionId tx, common::Currency amount) noexcept {
    return Event{EventKind::kCredited, tx, amount};
  }
  [[nodiscard]] static constexpr Event debited(common::TransactionId tx, common::Currency amount) noexcept {
    return Event{EventKind::kDebited, tx, amount};
  }
  [[nodiscard]] static constexpr Event held(common::TransactionId tx, common::Currency amount) noexcept {
    return Event{EventKind::kHeld, tx, amount};
  }
  [[nodiscard]] static constexpr Event released(common::TransactionId tx, common::Currency amount) noexcept {
    return Event{EventKind::kReleased, tx, amount};
  }
  [[nodiscard]] static constexpr Event reversed(common::TransactionId tx, common::Currency amount) noexcept {
    return Event{EventKind::kReversed, tx, amount};
  }
  [[nodiscard]] static constexpr Event locked() noexcept { return Event{EventKind::kLocked, 0, {}}; }

  // Structural equality: kind, tx and amount.
  bool operator==(const Event&) const = default;
};

[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;
// e.g. "Held{tx=10, amount=99.0000}" or "Locked".
[[nodiscard]] std::string describe(const Event& event);

[[nodiscard]] constexpr bool is_genesis(EventKind kind) noexcept {
  return kind == EventKind::kCredited || kind == EventKind::kDebited;
}

}  // namespace ledger
}  // namespace txledger
