#pragma once

#include <cstdint>

namespace clearcore {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

}  // namespace common
}  // namespace clearcore
