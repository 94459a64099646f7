#pragma once

#include <cstddef>
#include <cstdint>

#include "mavlink_gateway/types.hpp"

namespace mavgw {
namespace mavlink {

// CRC-16/MCRF4XX (X.25), as used by MAVLink
constexpr uint16_t CRC_INIT = 0xFFFF;

// Fold one byte into a running CRC
uint16_t crcAccumulate(uint8_t byte, uint16_t crc);

// CRC over a byte range, starting from CRC_INIT
uint16_t crcCalculate(const uint8_t* data, size_t len);
uint16_t crcCalculate(const ByteBuffer& data);

}  // namespace mavlink
}  // namespace mavgw
