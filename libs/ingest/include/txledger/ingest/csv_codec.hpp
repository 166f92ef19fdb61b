#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "txledger/ledger/command.hpp"

namespace txledger {
namespace ingest {
namespace csv {

inline constexpr std::string_view kCommandHeader = "type,client,tx,amount";

// Column positions resolved from a header row.
struct Header {
  std::size_t type{0};
  std::size_t client{1};
  std::size_t tx{2};
  std::optional<std::size_t> amount{3};
  std::size_t columns{4};
};

struct DecodeResult {
  bool ok{false};
  ledger::Command command{};
  std::string error{};
};

// Splits on commas. Quoting is not part of the wire format.
[[nodiscard]] std::vector<std::string_view> split_row(std::string_view line);

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

// Throws std::runtime_error if type, client or tx is missing or repeated.
[[nodiscard]] Header decode_header(std::string_view line, bool trim_whitespace = true);

[[nodiscard]] DecodeResult decode_row(const Header& header, std::string_view line, bool trim_whitespace = true);

// Renders a command row, leaving the amount column empty when absent.
[[nodiscard]] std::string encode_row(const ledger::Command& command);

}  // namespace csv
}  // namespace ingest
}  // namespace txledger
