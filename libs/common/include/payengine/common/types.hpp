#pragma once

#include <cstdint>

namespace payengine {
namespace common {

using ClientId = std::uint16_t;
using TxnId = std::uint32_t;

}  // namespace common
}  // namespace payengine
