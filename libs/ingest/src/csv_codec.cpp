#include "txledger/ingest/csv_codec.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace txledger {
namespace ingest {
namespace csv {

namespace {

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  if (value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

DecodeResult fail(std::string message) {
  DecodeResult result;
  result.error = std::move(message);
  return result;
}

void assign_column(std::optional<std::size_t>& slot, std::string_view name, std::size_t index) {
  if (slot) {
    throw std::runtime_error("duplicate column '" + std::string(name) + "' in header");
  }
  slot = index;
}

}  // namespace

std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_row(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  return fields;
}

Header decode_header(std::string_view line, bool trim_whitespace) {
  const auto fields = split_row(line);

  std::optional<std::size_t> type;
  std::optional<std::size_t> client;
  std::optional<std::size_t> tx;
  std::optional<std::size_t> amount;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto name = trim_whitespace ? trim(fields[i]) : fields[i];
    if (name == "type") {
      assign_column(type, name, i);
    } else if (name == "client") {
      assign_column(client, name, i);
    } else if (name == "tx") {
      assign_column(tx, name, i);
    } else if (name == "amount") {
      assign_column(amount, name, i);
    }
  }

  if (!type || !client || !tx) {
    throw std::runtime_error("header must name type, client and tx columns, got '" + std::string(line) + "'");
  }

  return Header{
      .type = *type,
      .client = *client,
      .tx = *tx,
      .amount = amount,
      .columns = fields.size(),
  };
}

DecodeResult decode_row(const Header& header, std::string_view line, bool trim_whitespace) {
  const auto fields = split_row(line);
  auto field = [&](std::size_t index) -> std::string_view {
    if (index >= fields.size()) {
      return {};
    }
    return trim_whitespace ? trim(fields[index]) : fields[index];
  };

  if (fields.size() > header.columns) {
    return fail("expected at most " + std::to_string(header.columns) + " fields, got " +
                std::to_string(fields.size()));
  }

  const auto type_token = field(header.type);
  const auto kind = ledger::parse_command_kind(type_token);
  if (!kind) {
    return fail("unknown transaction type '" + std::string(type_token) + "'");
  }

  const auto client_token = field(header.client);
  const auto client = parse_unsigned<common::ClientId>(client_token);
  if (!client) {
    return fail("invalid client '" + std::string(client_token) + "'");
  }

  const auto tx_token = field(header.tx);
  const auto tx = parse_unsigned<common::TransactionId>(tx_token);
  if (!tx) {
    return fail("invalid tx '" + std::string(tx_token) + "'");
  }

  DecodeResult result;
  result.command.kind = *kind;
  result.command.client = *client;
  result.command.tx = *tx;

  // Amounts on dispute/resolve/chargeback rows are ignored.
  if (header.amount && ledger::carries_amount(*kind)) {
    const auto amount_token = field(*header.amount);
    if (!amount_token.empty()) {
      const auto amount = common::Currency::parse(amount_token);
      if (!amount) {
        return fail("invalid amount '" + std::string(amount_token) + "'");
      }
      if (amount->is_negative()) {
        return fail("negative amount '" + std::string(amount_token) + "'");
      }
      result.command.amount = *amount;
    }
  }

  result.ok = true;
  return result;
}

std::string encode_row(const ledger::Command& command) {
  std::string row{ledger::to_string(command.kind)};
  row += ',';
  row += std::to_string(command.client);
  row += ',';
  row += std::to_string(command.tx);
  row += ',';
  if (command.amount) {
    row += command.amount->to_string();
  }
  return row;
}

}  // namespace csv
}  // namespace ingest
}  // namespace txledger
