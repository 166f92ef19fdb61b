#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "txledger/common/currency.hpp"
#include "txledger/common/types.hpp"
#include "txledger/ledger/actor.hpp"
#include "txledger/ledger/command.hpp"
#include "txledger/ledger/event.hpp"

namespace txledger {
namespace ledger {

enum class Rejection : std::uint8_t {
  kNone,
  kLockedAccount,
  kMissingAmount,
  kDuplicateTransaction,
  kInsufficientFunds,
  kUnknownTransaction,
  kUnknownDispute,
  kBalanceOverflow,
};

inline constexpr std::size_t kRejectionKinds = 8;

[[nodiscard]] std::string_view to_string(Rejection rejection) noexcept;

struct HandleResult {
  Rejection rejection{Rejection::kNone};
  std::vector<Event> events{};

  [[nodiscard]] bool accepted() const noexcept { return rejection == Rejection::kNone; }
};

// Externally visible balances; version and history stay internal.
struct AccountView {
  common::ClientId client{0};
  common::Currency available{};
  common::Currency held{};
  common::Currency total{};
  bool locked{false};

  bool operator==(const AccountView&) const = default;
};

using Snapshot = std::map<common::ClientId, AccountView>;

// Event-sourced account of a single client.
//
// State only changes through apply(); handle() inspects balances and the event
// log to decide whether a command is acceptable and which events it produces.
// Once a Locked event is applied the account is terminal.
class Account {
 public:
  using Id = common::ClientId;

  explicit Account(common::ClientId client);

  // Rebuilds an account by applying a recorded history onto a fresh one.
  [[nodiscard]] static Account rehydrate(common::ClientId client, std::span<const Event> history);

  [[nodiscard]] HandleResult handle(const Command& command) const;

  // Applies events produced by handle(). Throws std::logic_error, leaving the
  // account untouched, if the sequence would mutate a locked account or
  // overflow a balance.
  void apply(std::span<const Event> events);

  [[nodiscard]] common::ClientId id() const noexcept { return client_; }
  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Currency available() const noexcept { return available_; }
  [[nodiscard]] common::Currency held() const noexcept { return held_; }
  [[nodiscard]] common::Currency total() const noexcept { return total_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }
  [[nodiscard]] common::Version version() const noexcept { return version_; }
  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  [[nodiscard]] AccountView view() const noexcept;

 private:
  common::ClientId client_;
  common::Currency available_{};
  common::Currency held_{};
  common::Currency total_{};
  bool locked_{false};
  common::Version version_{0};
  std::vector<Event> events_{};
  // Log positions per transaction id, ascending. Locked events are not indexed.
  std::unordered_map<common::TransactionId, std::vector<std::size_t>> tx_index_{};

  struct Balances {
    common::Currency available;
    common::Currency held;
    common::Currency total;
  };

  // Balances after `events`, or nullopt if any step leaves the int64 range.
  [[nodiscard]] std::optional<Balances> project(std::span<const Event> events) const;
  [[nodiscard]] bool has_event(const Event& event) const;
  [[nodiscard]] std::optional<common::Currency> find_genesis_amount(common::TransactionId tx) const;
  [[nodiscard]] std::optional<common::Currency> find_dispute_amount(common::TransactionId tx) const;

  HandleResult deposit(const Command& command) const;
  HandleResult withdraw(const Command& command) const;
  HandleResult dispute(const Command& command) const;
  HandleResult resolve(const Command& command) const;
  HandleResult chargeback(const Command& command) const;

  void apply_one(const Event& event);
};

static_assert(Actor<Account, Command, Event>);

}  // namespace ledger
}  // namespace txledger
