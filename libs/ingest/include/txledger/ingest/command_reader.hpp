#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include "txledger/ingest/csv_codec.hpp"
#include "txledger/ledger/command.hpp"

namespace txledger {
namespace ingest {

// Streams commands from header-named CSV. Malformed rows are logged, counted
// and skipped so they never reach an account.
class CommandReader {
 public:
  struct Config {
    bool trim_whitespace{true};
    // Throw once more than this many rows were malformed; 0 disables the limit.
    std::uint64_t max_malformed_rows{0};
  };

  struct Stats {
    std::uint64_t lines{0};
    std::uint64_t accepted{0};
    std::uint64_t malformed{0};
    std::uint64_t blank{0};
  };

  explicit CommandReader(std::istream& input);
  CommandReader(std::istream& input, const Config& config);

  // Returns false at end of input. Throws std::runtime_error on a missing or
  // invalid header, a stream failure, or when the malformed-row limit is hit.
  bool next(ledger::Command& out);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  std::istream& input_;
  Config config_{};
  std::optional<csv::Header> header_{};
  std::string line_{};
  Stats stats_{};

  bool read_line();
  void read_header();
};

}  // namespace ingest
}  // namespace txledger
