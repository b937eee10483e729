#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace cfdp {

constexpr uint16_t CRC16_INIT = 0xFFFF;

/**
 * CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF, MSB first, no final xor).
 *
 * Running the CRC over a message followed by its big-endian CRC yields 0.
 */
uint16_t crc16(const uint8_t* data, size_t len, uint16_t crc = CRC16_INIT);

inline uint16_t crc16(const std::vector<uint8_t>& data) {
    return crc16(data.data(), data.size());
}

} // namespace cfdp
