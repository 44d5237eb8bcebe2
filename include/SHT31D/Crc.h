/// @file Crc.h
/// @brief CRC-8 used to protect every data word on the wire
#pragma once

#include <cstddef>
#include <cstdint>

namespace SHT31D {

/// CRC-8, polynomial 0x31, init 0xFF, no reflection, no final XOR
/// @return 0xFF for an empty input
uint8_t crc8(const uint8_t* data, size_t len);

} // namespace SHT31D
