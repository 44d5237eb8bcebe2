/// @file BoardConfig.h
/// @brief I2C wiring for the ESP32-S2/S3 reference board used by the examples
/// @note NOT part of the library - override for your hardware
#pragma once

#include <stdint.h>

#include "common/I2cTransport.h"

namespace board {

static constexpr int I2C_SDA = 8;
static constexpr int I2C_SCL = 9;
static constexpr uint32_t I2C_FREQ_HZ = 400000;
static constexpr uint32_t I2C_TIMEOUT_MS = 50;

inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

}  // namespace board
