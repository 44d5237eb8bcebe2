/// @file Config.h
/// @brief Configuration structure for SHT31D driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "SHT31D/Status.h"

namespace SHT31D {

/// I2C write callback signature
/// @param addr      I2C device address (7-bit)
/// @param data      Pointer to data to write
/// @param len       Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from Config
/// @return Status indicating success or failure. Transport SHOULD distinguish:
///         - Err::I2C_NACK_ADDR (address NACK)
///         - Err::I2C_NACK_DATA (data NACK)
///         - Err::I2C_TIMEOUT (timeout)
///         - Err::I2C_BUS (bus/arbitration error)
///         - Err::I2C_ERROR (unspecified I2C error)
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// I2C read callback signature
/// @param addr      I2C device address (7-bit)
/// @param data      Buffer receiving up to len bytes (unreceived bytes left as is)
/// @param len       Number of bytes to read
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from Config
/// @return Status indicating success or failure (same codes as I2cWriteFn)
/// @note The driver always issues the command write first, waits, and then
///       reads with a separate transaction. No repeated-start is required.
using I2cReadFn = Status (*)(uint8_t addr, uint8_t* data, size_t len,
                             uint32_t timeoutMs, void* user);

/// Monotonic millisecond clock (wraps at 2^32)
using NowMsFn = uint32_t (*)(void* user);

/// Blocking delay in microseconds
using DelayUsFn = void (*)(uint32_t us, void* user);

/// Measurement repeatability
enum class Repeatability : uint8_t {
  LOW_REPEATABILITY = 0,
  MEDIUM_REPEATABILITY = 1,
  HIGH_REPEATABILITY = 2
};

/// Clock stretching mode for single-shot/serial reads
enum class ClockStretching : uint8_t {
  STRETCH_DISABLED = 0,
  STRETCH_ENABLED = 1
};

/// Periodic acquisition frequency
enum class Frequency : uint8_t {
  HZ_0_5 = 0,
  HZ_1 = 1,
  HZ_2 = 2,
  HZ_4 = 3,
  HZ_10 = 4
};

/// Acquisition mode
enum class Mode : uint8_t {
  SINGLE = 0,   ///< Each read triggers a measurement
  PERIODIC = 1  ///< Sensor samples autonomously, reads fetch its buffer
};

/// Configuration for SHT31D driver
struct Config {
  // === I2C Transport (required) ===
  I2cWriteFn i2cWrite = nullptr;   ///< I2C write function pointer
  I2cReadFn i2cRead = nullptr;     ///< I2C read function pointer
  void* i2cUser = nullptr;         ///< User context for I2C callbacks

  // === Clock (required) ===
  NowMsFn nowMs = nullptr;         ///< Millisecond clock
  DelayUsFn delayUs = nullptr;     ///< Blocking delay
  void* timeUser = nullptr;        ///< User context for clock callbacks

  // === Device Settings ===
  uint8_t i2cAddress = 0x44;       ///< 0x44 (ADDR=GND) or 0x45 (ADDR=VDD)
  uint32_t i2cTimeoutMs = 50;      ///< I2C transaction timeout in ms

  // === Health Tracking ===
  uint8_t offlineThreshold = 5;    ///< Consecutive failures before OFFLINE
};

} // namespace SHT31D
