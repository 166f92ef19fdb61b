#include "txledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <limits>
#include <sstream>

#include "txledger/common/logging.hpp"

namespace txledger {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Negative values are kept as a huge unsigned number so validate() rejects them
// instead of silently clamping.
std::uint64_t get_count_or(const toml::table& tbl, std::string_view key, std::uint64_t default_val) {
  return static_cast<std::uint64_t>(get_int_or(tbl, key, static_cast<std::int64_t>(default_val)));
}

IngestConfig parse_ingest(const toml::table& root) {
  IngestConfig cfg;
  if (auto* ingest = root["ingest"].as_table()) {
    cfg.trim_whitespace = get_bool_or(*ingest, "trim_whitespace", cfg.trim_whitespace);
    cfg.max_malformed_rows = get_count_or(*ingest, "max_malformed_rows", cfg.max_malformed_rows);
  }
  return cfg;
}

RouterConfig parse_router(const toml::table& root) {
  RouterConfig cfg;
  if (auto* router = root["router"].as_table()) {
    cfg.shards = static_cast<std::size_t>(get_count_or(*router, "shards", cfg.shards));
    cfg.queue_depth = static_cast<std::size_t>(get_count_or(*router, "queue_depth", cfg.queue_depth));
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
    cfg.pattern = get_str_or(*logging, "pattern", cfg.pattern);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

LedgerConfig parse_config(const toml::table& root) {
  LedgerConfig cfg;
  cfg.ingest = parse_ingest(root);
  cfg.router = parse_router(root);
  cfg.logging = parse_logging(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

LoadResult finish(const toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }
  return finish(toml::parse_file(path.string()));
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return finish(toml::parse(toml_content));
}

std::vector<ValidationError> ConfigLoader::validate(const LedgerConfig& config) {
  std::vector<ValidationError> errors;

  constexpr std::size_t kMaxShards = RouterConfig::kMaxShards;
  if (config.router.shards == 0 || config.router.shards > kMaxShards) {
    errors.push_back({"router.shards", "must be between 1 and " + std::to_string(kMaxShards)});
  }

  const auto depth = config.router.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"router.queue_depth", "must be a power of two >= 2"});
  }

  if (config.ingest.max_malformed_rows > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    errors.push_back({"ingest.max_malformed_rows", "must not be negative"});
  }

  if (!common::parse_log_level(config.logging.level)) {
    errors.push_back({"logging.level", "unknown level '" + config.logging.level +
                                           "', expected trace, debug, info, warn, error or off"});
  }

  if (config.logging.pattern.empty()) {
    errors.push_back({"logging.pattern", "pattern cannot be empty"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# txledger configuration
# Generated default configuration

[ingest]
trim_whitespace = true
max_malformed_rows = 0   # 0 = unlimited

[router]
shards = 1               # 1 = sequential router
queue_depth = 4096       # per shard, power of two

[logging]
level = "warn"           # trace, debug, info, warn, error, off
pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace txledger
