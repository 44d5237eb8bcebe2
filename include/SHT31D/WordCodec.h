/// @file WordCodec.h
/// @brief Command encoding and checksum-validated word decoding
#pragma once

#include <cstddef>
#include <cstdint>
#include "SHT31D/CommandTable.h"
#include "SHT31D/Status.h"

namespace SHT31D {

class DecodedWords;

/// Decode consecutive (MSB, LSB, CRC) groups into validated words
/// Stops at the first checksum mismatch and keeps the valid prefix.
/// @param buf  Receive buffer
/// @param len  Buffer length, must be a multiple of 3
/// @param out  Receives the validated words (cleared first)
/// @return CRC_MISMATCH if the first group fails or len is not a multiple of 3,
///         INVALID_PARAM if buf is null with len > 0 or the buffer holds more
///         groups than DecodedWords::CAPACITY
Status decodeWords(const uint8_t* buf, size_t len, DecodedWords& out);

/// Words whose checksum has been verified
/// Only decodeWords() can fill this container.
class DecodedWords {
public:
  static constexpr size_t CAPACITY = cmd::PERIODIC_DATA_LEN / cmd::DATA_WORD_WITH_CRC;

  /// Number of validated words
  size_t size() const { return _count; }

  /// True if no word was accepted
  bool empty() const { return _count == 0; }

  /// Word at index (index must be < size())
  uint16_t operator[](size_t index) const { return _words[index]; }

private:
  friend Status decodeWords(const uint8_t* buf, size_t len, DecodedWords& out);

  uint16_t _words[CAPACITY] = {};
  size_t _count = 0;
};

/// Serialize a 16-bit command big-endian
inline void encodeCommand(uint16_t code, uint8_t out[cmd::COMMAND_LEN]) {
  out[0] = static_cast<uint8_t>(code >> 8);
  out[1] = static_cast<uint8_t>(code & 0xFF);
}

/// Parse a big-endian 16-bit command
inline uint16_t decodeCommand(const uint8_t in[cmd::COMMAND_LEN]) {
  return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) | in[1]);
}

} // namespace SHT31D
