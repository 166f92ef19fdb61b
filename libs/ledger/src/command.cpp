#include "txledger/ledger/command.hpp"

#include <array>
#include <utility>

namespace txledger {
namespace ledger {

namespace {

constexpr std::array<std::pair<std::string_view, CommandKind>, 5> kCommandTokens{{
    {"deposit", CommandKind::kDeposit},
    {"withdraw", CommandKind::kWithdraw},
    {"dispute", CommandKind::kDispute},
    {"resolve", CommandKind::kResolve},
    {"chargeback", CommandKind::kChargeback},
}};

}  // namespace

std::string_view to_string(CommandKind kind) noexcept {
  for (const auto& [token, candidate] : kCommandTokens) {
    if (candidate == kind) {
      return token;
    }
  }
  return "unknown";
}

std::optional<CommandKind> parse_command_kind(std::string_view token) noexcept {
  for (const auto& [candidate_token, kind] : kCommandTokens) {
    if (candidate_token == token) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace ledger
}  // namespace txledger
