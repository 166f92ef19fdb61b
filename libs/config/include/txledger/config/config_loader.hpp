#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace txledger {
namespace config {

struct IngestConfig {
  bool trim_whitespace{true};
  std::uint64_t max_malformed_rows{0};
};

struct RouterConfig {
  static constexpr std::size_t kMaxShards = 256;

  std::size_t shards{1};
  std::size_t queue_depth{1 << 12};
};

struct LoggingConfig {
  std::string level{"warn"};
  std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct LedgerConfig {
  IngestConfig ingest;
  RouterConfig router;
  LoggingConfig logging;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LedgerConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LedgerConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace txledger
