#include "txledger/ledger/event.hpp"

namespace txledger {
namespace ledger {

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kCredited:
      return "Credited";
    case EventKind::kDebited:
      return "Debited";
    case EventKind::kHeld:
      return "Held";
    case EventKind::kReleased:
      return "Released";
    case EventKind::kReversed:
      return "Reversed";
    case EventKind::kLocked:
      return "Locked";
  }
  return "Unknown";
}

std::string describe(const Event& event) {
  std::string out{to_string(event.kind)};
  if (event.kind == EventKind::kLocked) {
    return out;
  }
  out += "{tx=";
  out += std::to_string(event.tx);
  out += ", amount=";
  out += event.amount.to_string();
  out += '}';
  return out;
}

}  // namespace ledger
}  // namespace txledger
