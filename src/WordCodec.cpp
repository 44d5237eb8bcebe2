/**
 * @file WordCodec.cpp
 * @brief SHT31D reply frame decoding.
 */

#include "SHT31D/WordCodec.h"
#include "SHT31D/Crc.h"

namespace SHT31D {

Status decodeWords(const uint8_t* buf, size_t len, DecodedWords& out) {
  out._count = 0;

  if (len == 0) {
    return Status::Ok();
  }
  if (buf == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Invalid decode buffer");
  }
  if (len % cmd::DATA_WORD_WITH_CRC != 0) {
    return Status::Error(Err::CRC_MISMATCH, "Truncated word group",
                         static_cast<int32_t>(len));
  }

  const size_t groups = len / cmd::DATA_WORD_WITH_CRC;
  if (groups > DecodedWords::CAPACITY) {
    return Status::Error(Err::INVALID_PARAM, "Decode buffer too large",
                         static_cast<int32_t>(len));
  }

  for (size_t i = 0; i < groups; ++i) {
    const uint8_t* group = &buf[i * cmd::DATA_WORD_WITH_CRC];
    if (crc8(group, cmd::DATA_WORD_BYTES) != group[cmd::DATA_WORD_BYTES]) {
      // Unfilled tail of a periodic buffer ends here.
      break;
    }
    out._words[out._count++] =
        static_cast<uint16_t>((static_cast<uint16_t>(group[0]) << 8) | group[1]);
  }

  if (out._count == 0) {
    return Status::Error(Err::CRC_MISMATCH, "CRC mismatch (first word)");
  }
  return Status::Ok();
}

}  // namespace SHT31D
