#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "txledger/ledger/account.hpp"

namespace txledger {
namespace snapshot {

inline constexpr std::string_view kAccountHeader = "client,available,held,total,locked";

[[nodiscard]] std::string encode_row(const ledger::AccountView& account);

// Writes the end-of-run balances as CSV, one row per client in ascending
// client order.
class Writer {
 public:
  explicit Writer(std::ostream& output);

  void write(const ledger::Snapshot& snapshot);
  [[nodiscard]] std::size_t rows_written() const noexcept { return rows_written_; }

 private:
  std::ostream& output_;
  std::size_t rows_written_{0};
};

}  // namespace snapshot
}  // namespace txledger
