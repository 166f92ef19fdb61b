#include "txledger/snapshot/snapshot_writer.hpp"

#include <stdexcept>

namespace txledger {
namespace snapshot {

std::string encode_row(const ledger::AccountView& account) {
  std::string row = std::to_string(account.client);
  row += ',';
  row += account.available.to_string();
  row += ',';
  row += account.held.to_string();
  row += ',';
  row += account.total.to_string();
  row += ',';
  row += account.locked ? "true" : "false";
  return row;
}

Writer::Writer(std::ostream& output) : output_(output) {}

void Writer::write(const ledger::Snapshot& snapshot) {
  output_ << kAccountHeader << '\n';
  for (const auto& [client, account] : snapshot) {
    output_ << encode_row(account) << '\n';
    ++rows_written_;
  }
  output_.flush();
  if (!output_) {
    throw std::runtime_error("failed writing account snapshot");
  }
}

}  // namespace snapshot
}  // namespace txledger
