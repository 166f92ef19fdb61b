#pragma once

#include <cstdint>

namespace txledger {
namespace common {

// Client identifier, equivalent to the account aggregate id.
using ClientId = std::uint16_t;
// Identifies the deposit or withdrawal a later dispute refers to.
using TransactionId = std::uint32_t;
// Count of events applied to an aggregate.
using Version = std::uint32_t;

}  // namespace common
}  // namespace txledger
