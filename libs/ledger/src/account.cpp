#include "txledger/ledger/account.hpp"

#include <stdexcept>
#include <string>

namespace txledger {
namespace ledger {

std::string_view to_string(Rejection rejection) noexcept {
  switch (rejection) {
    case Rejection::kNone:
      return "none";
    case Rejection::kLockedAccount:
      return "locked account";
    case Rejection::kMissingAmount:
      return "missing amount";
    case Rejection::kDuplicateTransaction:
      return "duplicate transaction";
    case Rejection::kInsufficientFunds:
      return "insufficient funds";
    case Rejection::kUnknownTransaction:
      return "unknown transaction";
    case Rejection::kUnknownDispute:
      return "unknown dispute";
    case Rejection::kBalanceOverflow:
      return "balance overflow";
  }
  return "unknown";
}

namespace {

HandleResult reject(Rejection rejection) {
  return HandleResult{.rejection = rejection, .events = {}};
}

HandleResult accept(std::vector<Event> events) {
  return HandleResult{.rejection = Rejection::kNone, .events = std::move(events)};
}

}  // namespace

Account::Account(common::ClientId client) : client_(client) {}

Account Account::rehydrate(common::ClientId client, std::span<const Event> history) {
  Account account{client};
  account.apply(history);
  return account;
}

HandleResult Account::handle(const Command& command) const {
  if (locked_) {
    return reject(Rejection::kLockedAccount);
  }

  HandleResult result;
  switch (command.kind) {
    case CommandKind::kDeposit:
      result = deposit(command);
      break;
    case CommandKind::kWithdraw:
      result = withdraw(command);
      break;
    case CommandKind::kDispute:
      result = dispute(command);
      break;
    case CommandKind::kResolve:
      result = resolve(command);
      break;
    case CommandKind::kChargeback:
      result = chargeback(command);
      break;
    default:
      throw std::invalid_argument("unhandled command kind " + std::to_string(static_cast<int>(command.kind)));
  }

  if (result.accepted() && !project(result.events)) {
    return reject(Rejection::kBalanceOverflow);
  }
  return result;
}

HandleResult Account::deposit(const Command& command) const {
  if (!command.amount) {
    return reject(Rejection::kMissingAmount);
  }
  const auto event = Event::credited(command.tx, *command.amount);
  if (has_event(event)) {
    return reject(Rejection::kDuplicateTransaction);
  }
  return accept({event});
}

HandleResult Account::withdraw(const Command& command) const {
  if (!command.amount) {
    return reject(Rejection::kMissingAmount);
  }
  const auto event = Event::debited(command.tx, *command.amount);
  if (has_event(event)) {
    return reject(Rejection::kDuplicateTransaction);
  }
  if (*command.amount > available_) {
    return reject(Rejection::kInsufficientFunds);
  }
  return accept({event});
}

HandleResult Account::dispute(const Command& command) const {
  const auto amount = find_genesis_amount(command.tx);
  if (!amount) {
    return reject(Rejection::kUnknownTransaction);
  }
  const auto event = Event::held(command.tx, *amount);
  if (has_event(event)) {
    return reject(Rejection::kDuplicateTransaction);
  }
  return accept({event});
}

HandleResult Account::resolve(const Command& command) const {
  const auto amount = find_dispute_amount(command.tx);
  if (!amount) {
    return reject(Rejection::kUnknownDispute);
  }
  const auto event = Event::released(command.tx, *amount);
  if (has_event(event)) {
    return reject(Rejection::kDuplicateTransaction);
  }
  return accept({event});
}

HandleResult Account::chargeback(const Command& command) const {
  const auto amount = find_dispute_amount(command.tx);
  if (!amount) {
    return reject(Rejection::kUnknownDispute);
  }
  // A released dispute no longer holds funds; reversing it would drive held
  // below zero.
  if (has_event(Event::released(command.tx, *amount))) {
    return reject(Rejection::kUnknownDispute);
  }
  const auto event = Event::reversed(command.tx, *amount);
  if (has_event(event)) {
    return reject(Rejection::kDuplicateTransaction);
  }
  return accept({event, Event::locked()});
}

void Account::apply(std::span<const Event> events) {
  bool locks = locked_;
  for (const auto& event : events) {
    if (locks) {
      throw std::logic_error("account " + std::to_string(client_) + " is locked, refusing " + describe(event));
    }
    locks = event.kind == EventKind::kLocked;
  }
  if (!project(events)) {
    throw std::logic_error("account " + std::to_string(client_) + " balance would overflow");
  }

  for (const auto& event : events) {
    apply_one(event);
  }
}

std::optional<Account::Balances> Account::project(std::span<const Event> events) const {
  std::optional<common::Currency> available = available_;
  std::optional<common::Currency> held = held_;
  for (const auto& event : events) {
    switch (event.kind) {
      case EventKind::kCredited:
        available = available->checked_add(event.amount);
        break;
      case EventKind::kDebited:
        available = available->checked_sub(event.amount);
        break;
      case EventKind::kHeld:
        available = available->checked_sub(event.amount);
        held = held->checked_add(event.amount);
        break;
      case EventKind::kReleased:
        held = held->checked_sub(event.amount);
        available = available->checked_add(event.amount);
        break;
      case EventKind::kReversed:
        held = held->checked_sub(event.amount);
        break;
      case EventKind::kLocked:
        break;
    }
    if (!available || !held || !available->checked_add(*held)) {
      return std::nullopt;
    }
  }
  return Balances{.available = *available, .held = *held, .total = *available + *held};
}

void Account::apply_one(const Event& event) {
  switch (event.kind) {
    case EventKind::kCredited:
      available_ += event.amount;
      break;
    case EventKind::kDebited:
      available_ -= event.amount;
      break;
    case EventKind::kHeld:
      available_ -= event.amount;
      held_ += event.amount;
      break;
    case EventKind::kReleased:
      held_ -= event.amount;
      available_ += event.amount;
      break;
    case EventKind::kReversed:
      held_ -= event.amount;
      break;
    case EventKind::kLocked:
      locked_ = true;
      break;
  }
  total_ = available_ + held_;
  ++version_;

  if (event.kind != EventKind::kLocked) {
    tx_index_[event.tx].push_back(events_.size());
  }
  events_.push_back(event);
}

AccountView Account::view() const noexcept {
  return AccountView{
      .client = client_,
      .available = available_,
      .held = held_,
      .total = total_,
      .locked = locked_,
  };
}

bool Account::has_event(const Event& event) const {
  if (event.kind == EventKind::kLocked) {
    return locked_;
  }
  const auto it = tx_index_.find(event.tx);
  if (it == tx_index_.end()) {
    return false;
  }
  for (const auto position : it->second) {
    if (events_[position] == event) {
      return true;
    }
  }
  return false;
}

std::optional<common::Currency> Account::find_genesis_amount(common::TransactionId tx) const {
  const auto it = tx_index_.find(tx);
  if (it == tx_index_.end()) {
    return std::nullopt;
  }
  for (const auto position : it->second) {
    if (is_genesis(events_[position].kind)) {
      return events_[position].amount;
    }
  }
  return std::nullopt;
}

std::optional<common::Currency> Account::find_dispute_amount(common::TransactionId tx) const {
  const auto it = tx_index_.find(tx);
  if (it == tx_index_.end()) {
    return std::nullopt;
  }
  for (const auto position : it->second) {
    if (events_[position].kind == EventKind::kHeld) {
      return events_[position].amount;
    }
  }
  return std::nullopt;
}

}  // namespace ledger
}  // namespace txledger
