#include "txledger/ingest/command_reader.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace txledger {
namespace ingest {

CommandReader::CommandReader(std::istream& input) : CommandReader(input, Config{}) {}

CommandReader::CommandReader(std::istream& input, const Config& config) : input_(input), config_(config) {}

bool CommandReader::read_line() {
  if (!std::getline(input_, line_)) {
    if (input_.bad()) {
      throw std::runtime_error("failed reading transactions at line " + std::to_string(stats_.lines + 1));
    }
    return false;
  }
  ++stats_.lines;
  return true;
}

void CommandReader::read_header() {
  while (read_line()) {
    if (csv::trim(line_).empty()) {
      ++stats_.blank;
      continue;
    }
    header_ = csv::decode_header(line_, config_.trim_whitespace);
    return;
  }
  throw std::runtime_error("transactions input is empty, expected a header row");
}

bool CommandReader::next(ledger::Command& out) {
  if (!header_) {
    read_header();
  }

  while (read_line()) {
    if (csv::trim(line_).empty()) {
      ++stats_.blank;
      continue;
    }

    auto decoded = csv::decode_row(*header_, line_, config_.trim_whitespace);
    if (!decoded.ok) {
      ++stats_.malformed;
      spdlog::warn("skipping line {}: {}", stats_.lines, decoded.error);
      if (config_.max_malformed_rows != 0 && stats_.malformed > config_.max_malformed_rows) {
        throw std::runtime_error("more than " + std::to_string(config_.max_malformed_rows) +
                                 " malformed rows, giving up at line " + std::to_string(stats_.lines));
      }
      continue;
    }

    ++stats_.accepted;
    out = decoded.command;
    return true;
  }
  return false;
}

}  // namespace ingest
}  // namespace txledger
