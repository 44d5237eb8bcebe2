/// @file FakeBus.h
/// @brief Scripted I2C bus and clock for SHT31D unit tests
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "SHT31D/Config.h"
#include "SHT31D/Crc.h"
#include "SHT31D/Status.h"
#include "SHT31D/WordCodec.h"

namespace fake {

using SHT31D::Err;
using SHT31D::Status;

static constexpr size_t MAX_LOG = 64;
static constexpr size_t MAX_FRAMES = 8;
static constexpr size_t MAX_FRAME_LEN = 48;

/// Records every command/delay/read and replays queued reply frames
struct Bus {
  // Clock
  uint64_t nowUs = 0;

  // Command log; delayUs[i] accumulates waits issued after commands[i]
  uint16_t commands[MAX_LOG] = {};
  uint32_t delayUs[MAX_LOG] = {};
  size_t commandCount = 0;

  // Read log
  size_t readLens[MAX_LOG] = {};
  size_t readCount = 0;

  // Scripted replies
  uint8_t frames[MAX_FRAMES][MAX_FRAME_LEN] = {};
  size_t frameLens[MAX_FRAMES] = {};
  size_t frameCount = 0;
  size_t frameIdx = 0;

  // Injected failures
  Status writeStatus = Status::Ok();
  Status readStatus = Status::Ok();

  void advanceMs(uint32_t ms) { nowUs += static_cast<uint64_t>(ms) * 1000U; }

  void clearLog() {
    commandCount = 0;
    readCount = 0;
    for (size_t i = 0; i < MAX_LOG; ++i) {
      commands[i] = 0;
      delayUs[i] = 0;
      readLens[i] = 0;
    }
  }

  size_t countCommand(uint16_t code) const {
    size_t n = 0;
    for (size_t i = 0; i < commandCount; ++i) {
      if (commands[i] == code) {
        n++;
      }
    }
    return n;
  }

  /// Queue a raw reply; bytes beyond len are left as the driver filled them
  void queueFrame(const uint8_t* data, size_t len) {
    if (frameCount >= MAX_FRAMES || len > MAX_FRAME_LEN) {
      return;
    }
    std::memcpy(frames[frameCount], data, len);
    frameLens[frameCount] = len;
    frameCount++;
  }

  /// Queue a reply made of checksum-valid words
  void queueWords(const uint16_t* words, size_t count) {
    uint8_t buf[MAX_FRAME_LEN] = {};
    size_t len = 0;
    for (size_t i = 0; i < count && len + 3 <= MAX_FRAME_LEN; ++i) {
      putWord(&buf[len], words[i]);
      len += 3;
    }
    queueFrame(buf, len);
  }

  /// Write one (MSB, LSB, CRC) group
  static void putWord(uint8_t* dst, uint16_t word) {
    dst[0] = static_cast<uint8_t>(word >> 8);
    dst[1] = static_cast<uint8_t>(word & 0xFF);
    dst[2] = SHT31D::crc8(dst, 2);
  }
};

inline Status busWrite(uint8_t addr, const uint8_t* data, size_t len,
                       uint32_t timeoutMs, void* user) {
  (void)addr;
  (void)timeoutMs;
  auto* bus = static_cast<Bus*>(user);
  if (len >= 2 && bus->commandCount < MAX_LOG) {
    bus->commands[bus->commandCount++] = SHT31D::decodeCommand(data);
  }
  return bus->writeStatus;
}

inline Status busRead(uint8_t addr, uint8_t* data, size_t len,
                      uint32_t timeoutMs, void* user) {
  (void)addr;
  (void)timeoutMs;
  auto* bus = static_cast<Bus*>(user);
  if (bus->readCount < MAX_LOG) {
    bus->readLens[bus->readCount++] = len;
  }
  if (!bus->readStatus.ok()) {
    return bus->readStatus;
  }
  if (bus->frameIdx >= bus->frameCount) {
    return Status::Error(Err::I2C_ERROR, "No scripted reply");
  }

  const size_t idx = bus->frameIdx++;
  const size_t n = bus->frameLens[idx] < len ? bus->frameLens[idx] : len;
  std::memcpy(data, bus->frames[idx], n);
  return Status::Ok();
}

inline uint32_t busNowMs(void* user) {
  auto* bus = static_cast<Bus*>(user);
  return static_cast<uint32_t>(bus->nowUs / 1000U);
}

inline void busDelayUs(uint32_t us, void* user) {
  auto* bus = static_cast<Bus*>(user);
  bus->nowUs += us;
  if (bus->commandCount > 0) {
    bus->delayUs[bus->commandCount - 1] += us;
  }
}

/// Config wired to the fake bus
inline SHT31D::Config makeConfig(Bus& bus) {
  SHT31D::Config cfg;
  cfg.i2cWrite = busWrite;
  cfg.i2cRead = busRead;
  cfg.i2cUser = &bus;
  cfg.nowMs = busNowMs;
  cfg.delayUs = busDelayUs;
  cfg.timeUser = &bus;
  return cfg;
}

} // namespace fake
