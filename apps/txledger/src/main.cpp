#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "txledger/common/logging.hpp"
#include "txledger/config/config_loader.hpp"
#include "txledger/ingest/command_reader.hpp"
#include "txledger/ledger/account.hpp"
#include "txledger/router/ingestion_router.hpp"
#include "txledger/router/sharded_router.hpp"
#include "txledger/snapshot/snapshot_writer.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitUsage = 2;

struct Options {
  std::filesystem::path source;
  std::filesystem::path config_path;
  std::filesystem::path output_path;
  std::optional<std::size_t> shards;
  int verbosity{0};
  bool quiet{false};
  bool help{false};
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [options] <transactions.csv>\n"
            << "  -c, --config PATH   TOML configuration file\n"
            << "                      (default: ./txledger.toml, /etc/txledger/txledger.toml,\n"
            << "                       ~/.config/txledger/txledger.toml, else built-in defaults)\n"
            << "  -j, --shards N      route clients across N worker threads\n"
            << "  -o, --output PATH   write balances to PATH instead of stdout\n"
            << "  -v                  more logging, repeatable (-vv, -vvv)\n"
            << "  -q                  log errors only\n"
            << "  -h, --help          show this help\n";
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
    } else if (arg == "-q") {
      options.quiet = true;
    } else if (arg.size() >= 2 && arg.starts_with("-v") && arg.find_first_not_of('v', 1) == std::string_view::npos) {
      options.verbosity += static_cast<int>(arg.size() - 1);
    } else if (arg == "-c" || arg == "--config") {
      auto v = value();
      if (!v) {
        return std::nullopt;
      }
      options.config_path = std::filesystem::path{*v};
    } else if (arg == "-o" || arg == "--output") {
      auto v = value();
      if (!v) {
        return std::nullopt;
      }
      options.output_path = std::filesystem::path{*v};
    } else if (arg == "-j" || arg == "--shards") {
      auto v = value();
      if (!v) {
        return std::nullopt;
      }
      try {
        const auto parsed = std::stoul(std::string{*v});
        if (parsed == 0) {
          throw std::invalid_argument("zero");
        }
        options.shards = parsed;
      } catch (const std::exception&) {
        std::cerr << "invalid shard count '" << *v << "'\n";
        return std::nullopt;
      }
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "unknown option " << arg << "\n";
      return std::nullopt;
    } else if (options.source.empty()) {
      options.source = std::filesystem::path{arg};
    } else {
      std::cerr << "unexpected argument " << arg << "\n";
      return std::nullopt;
    }
  }

  if (!options.help && options.source.empty()) {
    std::cerr << "missing transactions source\n";
    return std::nullopt;
  }
  return options;
}

std::filesystem::path find_config_path(const Options& options) {
  if (!options.config_path.empty()) {
    return options.config_path;
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./txledger.toml",
      "/etc/txledger/txledger.toml",
      home ? std::filesystem::path{home} / ".config/txledger/txledger.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<txledger::config::LedgerConfig> load_config(const std::filesystem::path& config_path) {
  using txledger::config::ConfigLoader;

  const auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                          : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return result.config;
}

void setup_logging(const txledger::config::LoggingConfig& logging, const Options& options) {
  using namespace txledger;

  // validate() already rejected unknown levels.
  auto level = common::parse_log_level(logging.level).value_or(spdlog::level::warn);
  if (options.quiet) {
    level = spdlog::level::err;
  } else if (options.verbosity > 0) {
    level = common::raise_verbosity(level, options.verbosity);
  }
  common::init_logging(level, logging.pattern);
}

void log_summary(const txledger::router::RouterStats& stats, const txledger::ingest::CommandReader::Stats& rows,
                 txledger::telemetry::TelemetrySink* telemetry) {
  using namespace txledger;

  spdlog::info("read {} lines: {} commands, {} malformed, {} blank", rows.lines, rows.accepted, rows.malformed,
               rows.blank);
  spdlog::info("routed {} commands: {} applied, {} rejected", stats.routed, stats.applied, stats.rejected);
  for (std::size_t i = 1; i < stats.rejected_by_reason.size(); ++i) {
    if (stats.rejected_by_reason[i] != 0) {
      spdlog::info("  {}: {}", ledger::to_string(static_cast<ledger::Rejection>(i)), stats.rejected_by_reason[i]);
    }
  }

  if (!telemetry) {
    return;
  }
  for (const auto& counter : telemetry->counters()) {
    spdlog::debug("counter {} = {}", telemetry::to_string(counter.metric), counter.value);
  }
  for (const auto& latency : telemetry->drain_latency()) {
    spdlog::info("{}: n={} mean={:.0f}ns p99={:.0f}ns max={}ns", telemetry::to_string(latency.metric), latency.count,
                 latency.mean_ns, latency.p99_ns, latency.max_ns);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txledger;

  const auto options = parse_args(argc, argv);
  if (!options) {
    print_usage(argv[0]);
    return kExitUsage;
  }
  if (options->help) {
    print_usage(argv[0]);
    return EXIT_SUCCESS;
  }

  const auto config_path = find_config_path(*options);
  auto cfg = load_config(config_path);
  if (!cfg) {
    return kExitRuntimeError;
  }
  if (options->shards) {
    cfg->router.shards = *options->shards;
    const auto errors = config::ConfigLoader::validate(*cfg);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return kExitUsage;
    }
  }

  setup_logging(cfg->logging, *options);
  if (config_path.empty()) {
    spdlog::debug("No config file found, using defaults");
  } else {
    spdlog::debug("Loaded config from {}", config_path.string());
  }

  try {
    std::ifstream input(options->source);
    if (!input) {
      spdlog::error("cannot open transactions source {}", options->source.string());
      return kExitRuntimeError;
    }

    telemetry::TelemetrySink telemetry;
    telemetry::TelemetrySink* sink = cfg->telemetry.enabled ? &telemetry : nullptr;

    ingest::CommandReader reader(input, {.trim_whitespace = cfg->ingest.trim_whitespace,
                                         .max_malformed_rows = cfg->ingest.max_malformed_rows});

    ledger::Snapshot balances;
    router::RouterStats stats;
    ledger::Command command;
    if (cfg->router.shards <= 1) {
      router::IngestionRouter router{sink};
      while (reader.next(command)) {
        router.route(command);
      }
      balances = router.snapshot();
      stats = router.stats();
    } else {
      spdlog::info("routing across {} shards", cfg->router.shards);
      router::ShardedRouter router{{.shards = cfg->router.shards, .queue_depth = cfg->router.queue_depth}, sink};
      while (reader.next(command)) {
        router.route(command);
      }
      router.finish();
      balances = router.snapshot();
      stats = router.stats();
    }

    if (sink) {
      sink->increment(telemetry::Metric::kRowsMalformed, static_cast<std::int64_t>(reader.stats().malformed));
    }

    if (options->output_path.empty()) {
      snapshot::Writer writer(std::cout);
      writer.write(balances);
    } else {
      std::ofstream output(options->output_path, std::ios::trunc);
      if (!output) {
        spdlog::error("cannot open output {}", options->output_path.string());
        return kExitRuntimeError;
      }
      snapshot::Writer writer(output);
      writer.write(balances);
    }

    log_summary(stats, reader.stats(), sink);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return kExitRuntimeError;
  }

  return EXIT_SUCCESS;
}
