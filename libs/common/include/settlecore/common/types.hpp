#pragma once

#include <cstdint>

namespace settlecore {
namespace common {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;
using TimestampNs = std::int64_t;

}  // namespace common
}  // namespace settlecore
