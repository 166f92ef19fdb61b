#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "txledger/common/currency.hpp"
#include "txledger/common/types.hpp"

namespace txledger {
namespace ledger {

enum class CommandKind : std::uint8_t {
  kDeposit,
  kWithdraw,
  kDispute,
  kResolve,
  kChargeback,
};

// An intent to change one client's account. `amount` is only meaningful for
// deposits and withdrawals.
struct Command {
  CommandKind kind{CommandKind::kDeposit};
  common::ClientId client{0};
  common::TransactionId tx{0};
  std::optional<common::Currency> amount{};

  [[nodiscard]] common::ClientId actor_id() const noexcept { return client; }

  bool operator==(const Command&) const = default;
};

// Lower-case wire token, e.g. "chargeback".
[[nodiscard]] std::string_view to_string(CommandKind kind) noexcept;
[[nodiscard]] std::optional<CommandKind> parse_command_kind(std::string_view token) noexcept;

[[nodiscard]] constexpr bool carries_amount(CommandKind kind) noexcept {
  return kind == CommandKind::kDeposit || kind == CommandKind::kWithdraw;
}

}  // namespace ledger
}  // namespace txledger
