#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace txledger {
namespace common {

inline constexpr std::string_view kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Maps "trace|debug|info|warn|error|off" (and spdlog's own aliases) to a level.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Installs a stderr logger as the spdlog default. Stdout stays reserved for
// CSV output.
void init_logging(spdlog::level::level_enum level, std::string_view pattern = kDefaultLogPattern);

// Raises verbosity by `steps` levels, saturating at trace.
[[nodiscard]] spdlog::level::level_enum raise_verbosity(spdlog::level::level_enum level, int steps) noexcept;

}  // namespace common
}  // namespace txledger
