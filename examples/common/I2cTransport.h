/// @file I2cTransport.h
/// @brief Wire-based I2C transport and Arduino clock adapters for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>
#include "SHT31D/Status.h"

namespace transport {

using SHT31D::Status;
using SHT31D::Err;

/// Initialize Wire for examples
/// @param sda SDA pin
/// @param scl SCL pin
/// @param freqHz I2C clock frequency
/// @param timeoutMs Wire timeout in milliseconds
/// @return true if initialized
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// I2C write callback using Wire library
/// @param addr I2C device address (7-bit)
/// @param data Data buffer to write
/// @param len Number of bytes to write
/// @param timeoutMs Timeout requested by the driver (Wire timeout is set in initWire)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                        uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  Wire.beginTransmission(addr);
  size_t written = Wire.write(data, len);
  // STOP is required between the command write and the read header.
  uint8_t result = Wire.endTransmission(true);

  if (result != 0) {
    // Arduino Wire error codes (core-dependent): 1=data too long, 2=NACK addr, 3=NACK data,
    // 4=other, 5=timeout (ESP32 Arduino core).
    switch (result) {
      case 1: return Status::Error(Err::INVALID_PARAM, "I2C write too long", result);
      case 2: return Status::Error(Err::I2C_NACK_ADDR, "I2C NACK addr", result);
      case 3: return Status::Error(Err::I2C_NACK_DATA, "I2C NACK data", result);
      case 4: return Status::Error(Err::I2C_BUS, "I2C bus error", result);
      case 5: return Status::Error(Err::I2C_TIMEOUT, "I2C timeout", result);
      default: return Status::Error(Err::I2C_ERROR, "I2C write failed", result);
    }
  }
  if (written != len) {
    return Status::Error(Err::I2C_ERROR, "I2C write incomplete", static_cast<int32_t>(written));
  }

  return Status::Ok();
}

/// I2C read callback using Wire library
/// A short read leaves the tail of the buffer untouched; the driver
/// pre-fills it so unfilled word groups fail their checksum.
/// @param addr I2C device address (7-bit)
/// @param data Buffer for read data
/// @param len Number of bytes to read
/// @param timeoutMs Timeout requested by the driver (Wire timeout is set in initWire)
/// @param user User context (unused)
/// @return Status indicating success or failure
inline Status wireRead(uint8_t addr, uint8_t* data, size_t len,
                       uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;

  size_t received = Wire.requestFrom(addr, len);
  if (received == 0) {
    return Status::Error(Err::I2C_NACK_ADDR, "I2C read returned 0 bytes");
  }

  for (size_t i = 0; i < received && i < len; i++) {
    data[i] = static_cast<uint8_t>(Wire.read());
  }
  while (Wire.available()) {
    (void)Wire.read();
  }

  return Status::Ok();
}

/// Monotonic millisecond clock callback
inline uint32_t arduinoNowMs(void* user) {
  (void)user;
  return millis();
}

/// Blocking microsecond delay callback
inline void arduinoDelayUs(uint32_t us, void* user) {
  (void)user;
  if (us >= 1000) {
    delay(us / 1000);
    us %= 1000;
  }
  if (us > 0) {
    delayMicroseconds(us);
  }
}

} // namespace transport
