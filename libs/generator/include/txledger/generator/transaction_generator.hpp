#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <unordered_map>

#include "txledger/common/types.hpp"
#include "txledger/generator/random_source.hpp"
#include "txledger/ledger/command.hpp"

namespace txledger {
namespace generator {

struct GeneratorConfig {
  // Client ids are drawn from [1, clients).
  std::uint32_t clients{std::numeric_limits<common::ClientId>::max()};
  std::uint32_t transactions{std::numeric_limits<common::TransactionId>::max()};
};

struct GeneratorStats {
  std::uint64_t opening_deposits{0};
  std::uint64_t deposits{0};
  std::uint64_t withdrawals{0};
  std::uint64_t disputes{0};
  std::uint64_t resolves{0};
  std::uint64_t chargebacks{0};
  std::uint64_t filler_deposits{0};

  [[nodiscard]] std::uint64_t total() const noexcept {
    return opening_deposits + deposits + withdrawals + disputes + resolves + chargebacks + filler_deposits;
  }
};

// Produces a synthetic command stream:
//   1. one opening deposit per client, shuffled within chunks of 50 clients;
//   2. the remaining budget split 40/40/15/2.5/2.5 between deposits,
//      withdrawals, disputes, resolves and chargebacks, issued in rounds
//      against random clients;
//   3. deposits to fill whatever rounding left over.
// Transaction ids are sequential from 1 and exactly `transactions` commands
// are emitted.
class TransactionGenerator {
 public:
  using Sink = std::function<void(const ledger::Command&)>;

  TransactionGenerator(const GeneratorConfig& config, RandomSource& random);

  GeneratorStats run(const Sink& sink);

 private:
  GeneratorConfig config_;
  RandomSource& random_;
  common::TransactionId next_tx_{1};
  std::uint64_t emitted_{0};
  // Most recent deposit/withdrawal per client, target of later disputes.
  std::unordered_map<common::ClientId, common::TransactionId> last_genesis_{};

  [[nodiscard]] bool budget_left() const noexcept { return emitted_ < config_.transactions; }
  [[nodiscard]] common::ClientId random_client();
  [[nodiscard]] common::Currency random_amount(std::uint32_t low_units, std::uint32_t high_units);

  void emit(const Sink& sink, ledger::CommandKind kind, common::ClientId client, common::TransactionId tx,
            std::optional<common::Currency> amount);
  common::TransactionId emit_genesis(const Sink& sink, ledger::CommandKind kind, common::ClientId client,
                                     common::Currency amount);
};

}  // namespace generator
}  // namespace txledger
