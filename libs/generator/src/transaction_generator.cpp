#include "txledger/generator/transaction_generator.hpp"

#include <algorithm>
#include <numeric>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace txledger {
namespace generator {

namespace {

constexpr std::size_t kOpeningChunk = 50;

// Amount ranges in 1/10000 units.
constexpr std::uint32_t kDepositLow = 300'000;      // 30.0000
constexpr std::uint32_t kDepositHigh = 5'000'000;   // 500.0000
constexpr std::uint32_t kWithdrawLow = 100'000;     // 10.0000
constexpr std::uint32_t kWithdrawHigh = 4'000'000;  // 400.0000

}  // namespace

TransactionGenerator::TransactionGenerator(const GeneratorConfig& config, RandomSource& random)
    : config_(config), random_(random) {
  if (config_.clients < 2 || config_.clients > std::numeric_limits<common::ClientId>::max()) {
    throw std::invalid_argument("clients must be between 2 and " +
                                std::to_string(std::numeric_limits<common::ClientId>::max()));
  }
}

common::ClientId TransactionGenerator::random_client() {
  return static_cast<common::ClientId>(random_.between(1, config_.clients));
}

common::Currency TransactionGenerator::random_amount(std::uint32_t low_units, std::uint32_t high_units) {
  return common::Currency::from_units(random_.between(low_units, high_units));
}

void TransactionGenerator::emit(const Sink& sink, ledger::CommandKind kind, common::ClientId client,
                                common::TransactionId tx, std::optional<common::Currency> amount) {
  sink(ledger::Command{.kind = kind, .client = client, .tx = tx, .amount = amount});
  ++emitted_;
}

common::TransactionId TransactionGenerator::emit_genesis(const Sink& sink, ledger::CommandKind kind,
                                                         common::ClientId client, common::Currency amount) {
  const auto tx = next_tx_++;
  emit(sink, kind, client, tx, amount);
  last_genesis_[client] = tx;
  return tx;
}

GeneratorStats TransactionGenerator::run(const Sink& sink) {
  GeneratorStats stats;
  spdlog::info("Generating {} transactions for {} clients", config_.transactions, config_.clients);

  std::vector<common::ClientId> client_ids(config_.clients - 1);
  std::iota(client_ids.begin(), client_ids.end(), common::ClientId{1});

  spdlog::debug("Generating {} opening deposits", client_ids.size());
  for (std::size_t offset = 0; offset < client_ids.size() && budget_left(); offset += kOpeningChunk) {
    const auto count = std::min(kOpeningChunk, client_ids.size() - offset);
    std::span<common::ClientId> chunk(client_ids.data() + offset, count);
    random_.shuffle(chunk);
    for (const auto client : chunk) {
      if (!budget_left()) {
        break;
      }
      emit_genesis(sink, ledger::CommandKind::kDeposit, client, random_amount(kDepositLow, kDepositHigh));
      ++stats.opening_deposits;
    }
  }

  const std::uint64_t remaining = config_.transactions - emitted_;
  std::uint64_t deposits = remaining * 40 / 100;
  std::uint64_t withdrawals = remaining * 40 / 100;
  std::uint64_t disputes = remaining * 15 / 100;
  std::uint64_t resolves = remaining * 25 / 1000;
  std::uint64_t chargebacks = remaining * 25 / 1000;

  spdlog::debug("Generating {} deposits", deposits);
  spdlog::debug("Generating {} withdrawals", withdrawals);
  spdlog::debug("Generating {} disputes", disputes);
  spdlog::debug("Generating {} resolves", resolves);
  spdlog::debug("Generating {} chargebacks", chargebacks);

  while (deposits > 0 || withdrawals > 0 || disputes > 0) {
    const auto client = random_client();

    if (deposits > 0) {
      emit_genesis(sink, ledger::CommandKind::kDeposit, client, random_amount(kDepositLow, kDepositHigh));
      --deposits;
      ++stats.deposits;
    }
    if (withdrawals > 0) {
      emit_genesis(sink, ledger::CommandKind::kWithdraw, client, random_amount(kWithdrawLow, kWithdrawHigh));
      --withdrawals;
      ++stats.withdrawals;
    }
    if (disputes == 0) {
      continue;
    }

    --disputes;
    const auto genesis = last_genesis_.find(client);
    if (genesis == last_genesis_.end()) {
      spdlog::trace("client {} has no transaction to dispute", client);
      continue;
    }

    const auto disputed_tx = genesis->second;
    emit(sink, ledger::CommandKind::kDispute, client, disputed_tx, std::nullopt);
    ++stats.disputes;
    if (resolves > 0) {
      emit(sink, ledger::CommandKind::kResolve, client, disputed_tx, std::nullopt);
      --resolves;
      ++stats.resolves;
    } else if (chargebacks > 0) {
      emit(sink, ledger::CommandKind::kChargeback, client, disputed_tx, std::nullopt);
      --chargebacks;
      ++stats.chargebacks;
    }
  }

  spdlog::debug("Generating {} more deposits", config_.transactions - emitted_);
  while (budget_left()) {
    emit_genesis(sink, ledger::CommandKind::kDeposit, random_client(), random_amount(kDepositLow, kDepositHigh));
    ++stats.filler_deposits;
  }

  spdlog::info("Generated {} transactions for {} clients", stats.total(), config_.clients);
  return stats;
}

}  // namespace generator
}  // namespace txledger
