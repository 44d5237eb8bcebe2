/**
 * @file Crc.cpp
 * @brief SHT31D CRC-8 implementation.
 */

#include "SHT31D/Crc.h"
#include "SHT31D/CommandTable.h"

namespace SHT31D {

uint8_t crc8(const uint8_t* data, size_t len) {
  uint8_t crc = cmd::CRC_INIT;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      if (crc & 0x80) {
        crc = static_cast<uint8_t>((crc << 1) ^ cmd::CRC_POLY);
      } else {
        crc = static_cast<uint8_t>(crc << 1);
      }
    }
  }
  return crc;
}

}  // namespace SHT31D
