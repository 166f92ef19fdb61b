#include "test_ledger.hpp"

#include <cassert>
#include <stdexcept>
#include <vector>

#include "txledger/ledger/account.hpp"

namespace txledger::tests {

namespace {

using common::Currency;
using ledger::Account;
using ledger::Command;
using ledger::CommandKind;
using ledger::Event;
using ledger::EventKind;
using ledger::Rejection;

Currency amount(const char* text) {
  return *Currency::parse(text);
}

Command deposit(common::TransactionId tx, const char* value) {
  return {.kind = CommandKind::kDeposit, .client = 1, .tx = tx, .amount = amount(value)};
}

Command withdraw(common::TransactionId tx, const char* value) {
  return {.kind = CommandKind::kWithdraw, .client = 1, .tx = tx, .amount = amount(value)};
}

Command follow_up(CommandKind kind, common::TransactionId tx) {
  return {.kind = kind, .client = 1, .tx = tx, .amount = std::nullopt};
}

// handle() then apply() on acceptance, as the router does.
Rejection submit(Account& account, const Command& command) {
  auto result = account.handle(command);
  if (result.accepted()) {
    account.apply(result.events);
  }
  return result.rejection;
}

void check_balances(const Account& account, const char* available, const char* held, const char* total) {
  assert(account.available() == amount(available));
  assert(account.held() == amount(held));
  assert(account.total() == amount(total));
  assert(account.total() == account.available() + account.held());
}

// Scenario A: one deposit of 99.
Account funded_account() {
  Account account{1};
  assert(submit(account, deposit(10, "99.0000")) == Rejection::kNone);
  return account;
}

}  // namespace

void test_deposit_accepted() {
  Account account = funded_account();

  assert(account.client() == 1);
  assert(account.version() == 1);
  assert(!account.locked());
  assert(account.events().size() == 1);
  assert(account.events().front() == Event::credited(10, amount("99")));
  check_balances(account, "99", "0", "99");
}

void test_withdraw_insufficient_funds() {
  Account account = funded_account();

  assert(submit(account, withdraw(11, "150.0000")) == Rejection::kInsufficientFunds);
  check_balances(account, "99", "0", "99");
  assert(account.version() == 1);

  // Withdrawing exactly the available balance is allowed.
  assert(submit(account, withdraw(12, "99")) == Rejection::kNone);
  check_balances(account, "0", "0", "0");
  assert(account.version() == 2);
}

void test_dispute_then_resolve() {
  Account account = funded_account();

  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  check_balances(account, "0", "99", "99");

  assert(submit(account, follow_up(CommandKind::kResolve, 10)) == Rejection::kNone);
  check_balances(account, "99", "0", "99");
  assert(!account.locked());
  assert(account.version() == 3);

  // The dispute is settled; neither step can be repeated.
  assert(submit(account, follow_up(CommandKind::kResolve, 10)) == Rejection::kDuplicateTransaction);
  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kDuplicateTransaction);
  check_balances(account, "99", "0", "99");
}

void test_dispute_then_chargeback_locks() {
  Account account = funded_account();

  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  const auto result = account.handle(follow_up(CommandKind::kChargeback, 10));
  assert(result.accepted());
  assert(result.events.size() == 2);
  assert(result.events[0] == Event::reversed(10, amount("99")));
  assert(result.events[1].kind == EventKind::kLocked);

  account.apply(result.events);
  check_balances(account, "0", "0", "0");
  assert(account.locked());
  assert(account.version() == 4);
  assert(account.events().back() == Event::locked());
}

void test_locked_account_is_terminal() {
  Account account = funded_account();
  assert(submit(account, deposit(11, "1")) == Rejection::kNone);
  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  assert(submit(account, follow_up(CommandKind::kChargeback, 10)) == Rejection::kNone);
  check_balances(account, "1", "0", "1");

  const auto version = account.version();
  const std::vector<Command> attempts{
      deposit(20, "5"),
      withdraw(21, "1"),
      follow_up(CommandKind::kDispute, 11),
      follow_up(CommandKind::kResolve, 10),
      follow_up(CommandKind::kChargeback, 10),
      {.kind = CommandKind::kDeposit, .client = 1, .tx = 22, .amount = std::nullopt},
  };
  for (const auto& command : attempts) {
    const auto result = account.handle(command);
    assert(result.rejection == Rejection::kLockedAccount);
    assert(result.events.empty());
  }
  check_balances(account, "1", "0", "1");
  assert(account.locked());
  assert(account.version() == version);
}

void test_handle_is_pure() {
  Account account = funded_account();
  const auto before = account.view();
  const auto version = account.version();

  for (int i = 0; i < 3; ++i) {
    (void)account.handle(deposit(50, "1"));
    (void)account.handle(withdraw(51, "2"));
    (void)account.handle(follow_up(CommandKind::kDispute, 10));
    (void)account.handle(follow_up(CommandKind::kChargeback, 10));
  }

  assert(account.view() == before);
  assert(account.version() == version);
  assert(account.events().size() == 1);
}

void test_duplicate_rejection() {
  Account account = funded_account();

  assert(submit(account, deposit(10, "99.0000")) == Rejection::kDuplicateTransaction);
  check_balances(account, "99", "0", "99");
  assert(account.version() == 1);

  assert(submit(account, withdraw(11, "9")) == Rejection::kNone);
  assert(submit(account, withdraw(11, "9")) == Rejection::kDuplicateTransaction);
  check_balances(account, "90", "0", "90");

  // Duplicate detection compares the produced event, so the same tx with a
  // different amount is a distinct event.
  assert(submit(account, deposit(10, "1")) == Rejection::kNone);
  check_balances(account, "91", "0", "91");

  assert(submit(account, follow_up(CommandKind::kDispute, 11)) == Rejection::kNone);
  assert(submit(account, follow_up(CommandKind::kDispute, 11)) == Rejection::kDuplicateTransaction);
  check_balances(account, "82", "9", "91");
}

void test_missing_amount() {
  Account account{1};
  assert(submit(account, follow_up(CommandKind::kDeposit, 1)) == Rejection::kMissingAmount);
  assert(submit(account, follow_up(CommandKind::kWithdraw, 2)) == Rejection::kMissingAmount);
  assert(account.version() == 0);
  assert(account.events().empty());
}

void test_unknown_transaction_and_dispute() {
  Account account = funded_account();

  assert(submit(account, follow_up(CommandKind::kDispute, 99)) == Rejection::kUnknownTransaction);
  assert(submit(account, follow_up(CommandKind::kResolve, 10)) == Rejection::kUnknownDispute);
  assert(submit(account, follow_up(CommandKind::kChargeback, 10)) == Rejection::kUnknownDispute);
  assert(submit(account, follow_up(CommandKind::kResolve, 99)) == Rejection::kUnknownDispute);
  check_balances(account, "99", "0", "99");
  assert(account.version() == 1);
}

void test_dispute_withdrawal() {
  Account account = funded_account();
  assert(submit(account, withdraw(11, "40")) == Rejection::kNone);
  check_balances(account, "59", "0", "59");

  // The disputed withdrawal's amount moves from available to held.
  assert(submit(account, follow_up(CommandKind::kDispute, 11)) == Rejection::kNone);
  check_balances(account, "19", "40", "59");

  assert(submit(account, follow_up(CommandKind::kResolve, 11)) == Rejection::kNone);
  check_balances(account, "59", "0", "59");
}

void test_first_genesis_wins() {
  Account account{1};
  assert(submit(account, deposit(10, "5")) == Rejection::kNone);
  assert(submit(account, deposit(10, "7")) == Rejection::kNone);

  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  assert(account.events().back() == Event::held(10, amount("5")));
  check_balances(account, "7", "5", "12");

  assert(submit(account, follow_up(CommandKind::kChargeback, 10)) == Rejection::kNone);
  assert(account.events()[account.events().size() - 2] == Event::reversed(10, amount("5")));
  check_balances(account, "7", "0", "7");
}

void test_chargeback_after_resolve_rejected() {
  Account account = funded_account();
  assert(submit(account, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  assert(submit(account, follow_up(CommandKind::kResolve, 10)) == Rejection::kNone);

  assert(submit(account, follow_up(CommandKind::kChargeback, 10)) == Rejection::kUnknownDispute);
  check_balances(account, "99", "0", "99");
  assert(account.held() >= Currency{});
  assert(!account.locked());
}

void test_rehydrate_from_history() {
  Account original = funded_account();
  assert(submit(original, withdraw(11, "9.5")) == Rejection::kNone);
  assert(submit(original, follow_up(CommandKind::kDispute, 10)) == Rejection::kNone);
  assert(submit(original, follow_up(CommandKind::kChargeback, 10)) == Rejection::kNone);

  const Account copy = Account::rehydrate(1, original.events());
  assert(copy.view() == original.view());
  assert(copy.version() == original.version());
  assert(copy.events() == original.events());
  check_balances(copy, "-9.5", "0", "-9.5");
  assert(copy.locked());
}

void test_apply_refuses_locked_account() {
  // Events past a Locked event are refused and nothing is applied.
  Account account{1};
  const std::vector<Event> bad{Event::credited(1, amount("1")), Event::locked(), Event::credited(2, amount("1"))};
  bool threw = false;
  try {
    account.apply(bad);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(account.version() == 0);
  check_balances(account, "0", "0", "0");

  const std::vector<Event> lock{Event::locked()};
  account.apply(lock);
  threw = false;
  try {
    const std::vector<Event> more{Event::credited(3, amount("1"))};
    account.apply(more);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(account.version() == 1);
}

void test_balance_overflow_rejected() {
  // Each amount is close to the largest value that parses.
  const char* large = "900000000000000";

  Account account{1};
  assert(submit(account, deposit(1, large)) == Rejection::kNone);
  const auto before = account.view();
  const auto version = account.version();

  const auto second = account.handle(deposit(2, large));
  assert(second.rejection == Rejection::kBalanceOverflow);
  assert(second.events.empty());
  assert(submit(account, deposit(2, large)) == Rejection::kBalanceOverflow);
  assert(account.view() == before);
  assert(account.version() == version);

  // Holding a second large amount would overflow held.
  assert(submit(account, withdraw(3, large)) == Rejection::kNone);
  assert(submit(account, deposit(4, large)) == Rejection::kNone);
  assert(submit(account, follow_up(CommandKind::kDispute, 3)) == Rejection::kNone);
  check_balances(account, "0", large, large);
  assert(submit(account, follow_up(CommandKind::kDispute, 4)) == Rejection::kBalanceOverflow);
  check_balances(account, "0", large, large);

  // Small commands still go through.
  assert(submit(account, follow_up(CommandKind::kResolve, 3)) == Rejection::kNone);
  assert(submit(account, withdraw(5, "1")) == Rejection::kNone);
}

void test_apply_refuses_overflow() {
  Account account{1};
  const auto large = amount("900000000000000");
  const std::vector<Event> history{Event::credited(1, large), Event::credited(2, large)};
  bool threw = false;
  try {
    account.apply(history);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(account.version() == 0);
  assert(account.events().empty());
  check_balances(account, "0", "0", "0");
}

}  // namespace txledger::tests
