#pragma once

#include <chrono>

namespace txledger {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

inline std::chrono::nanoseconds elapsed_since(std::chrono::nanoseconds start) noexcept {
  return now_steady() - start;
}

}  // namespace common
}  // namespace txledger
