#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "txledger/common/logging.hpp"
#include "txledger/generator/random_source.hpp"
#include "txledger/generator/transaction_generator.hpp"
#include "txledger/ingest/csv_codec.hpp"

namespace {

struct Options {
  txledger::generator::GeneratorConfig generator;
  std::optional<std::string> seed;
  int verbosity{0};
  bool help{false};
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [options]\n"
            << "  -c, --clients N        number of clients (default 65535)\n"
            << "  -t, --transactions N   number of transactions (default 4294967295)\n"
            << "  -s, --seed TEXT        deterministic output for a given seed\n"
            << "  -v                     sets the level of verbosity, repeatable\n"
            << "  -h, --help             show this help\n";
}

std::optional<std::uint32_t> parse_count(std::string_view text, std::uint64_t max) {
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(std::string{text}, &consumed);
    if (consumed != text.size() || value > max) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<Options> parse_args(int argc, char* argv[]) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    auto value = [&]() -> std::optional<std::string_view> {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }
      return std::string_view{argv[++i]};
    };

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg.size() >= 2 && arg.starts_with("-v") && arg.find_first_not_of('v', 1) == std::string_view::npos) {
      options.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "-c" || arg == "--clients") {
      auto v = value();
      auto parsed = v ? parse_count(*v, std::numeric_limits<std::uint16_t>::max()) : std::nullopt;
      if (!parsed) {
        std::cerr << "invalid client count\n";
        return std::nullopt;
      }
      options.generator.clients = *parsed;
    } else if (arg == "-t" || arg == "--transactions") {
      auto v = value();
      auto parsed = v ? parse_count(*v, std::numeric_limits<std::uint32_t>::max()) : std::nullopt;
      if (!parsed) {
        std::cerr << "invalid transaction count\n";
        return std::nullopt;
      }
      options.generator.transactions = *parsed;
    } else if (arg == "-s" || arg == "--seed") {
      auto v = value();
      if (!v) {
        return std::nullopt;
      }
      options.seed = std::string{*v};
    } else {
      std::cerr << "unknown argument " << arg << "\n";
      return std::nullopt;
    }
  }
  return options;
}

spdlog::level::level_enum level_for(int verbosity) {
  switch (verbosity) {
    case 0:
      return spdlog::level::off;
    case 1:
      return spdlog::level::info;
    case 2:
      return spdlog::level::debug;
    default:
      return spdlog::level::trace;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txledger;

  const auto options = parse_args(argc, argv);
  if (!options) {
    print_usage(argv[0]);
    return 2;
  }
  if (options->help) {
    print_usage(argv[0]);
    return EXIT_SUCCESS;
  }

  common::init_logging(level_for(options->verbosity));

  try {
    generator::RandomSource random = options->seed
                                         ? generator::RandomSource{generator::RandomSource::derive_seed(*options->seed)}
                                         : generator::RandomSource{};
    generator::TransactionGenerator gen(options->generator, random);

    std::ios::sync_with_stdio(false);
    std::cout << ingest::csv::kCommandHeader << '\n';
    gen.run([](const ledger::Command& command) { std::cout << ingest::csv::encode_row(command) << '\n'; });
    std::cout.flush();
    if (!std::cout) {
      spdlog::error("failed writing transactions");
      return 1;
    }
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return EXIT_SUCCESS;
}
