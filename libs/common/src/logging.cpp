#include "txledger/common/logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace txledger {
namespace common {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  if (name == "warn") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str falls back to off for unknown names.
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

void init_logging(spdlog::level::level_enum level, std::string_view pattern) {
  auto logger = spdlog::get("txledger");
  if (!logger) {
    logger = spdlog::stderr_color_mt("txledger");
  }
  logger->set_level(level);
  logger->set_pattern(std::string(pattern));
  spdlog::set_default_logger(logger);
}

spdlog::level::level_enum raise_verbosity(spdlog::level::level_enum level, int steps) noexcept {
  int value = static_cast<int>(level) - steps;
  if (value < static_cast<int>(spdlog::level::trace)) {
    value = static_cast<int>(spdlog::level::trace);
  }
  return static_cast<spdlog::level::level_enum>(value);
}

}  // namespace common
}  // namespace txledger
