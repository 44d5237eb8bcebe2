/// @file Status.h
/// @brief Error codes and status handling for SHT31D driver
#pragma once

#include <cstdint>

namespace SHT31D {

/// Error codes for all SHT31D operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  NOT_INITIALIZED,        ///< begin() not called
  INVALID_CONFIG,         ///< Invalid Config passed to begin()
  INVALID_PARAM,          ///< Parameter outside its allowed domain
  CONFIG_LOCKED,          ///< Frequency change attempted while ART enabled
  DEVICE_NOT_FOUND,       ///< Device not responding on I2C bus
  CRC_MISMATCH,           ///< Word checksum failed or required word missing
  I2C_ERROR,              ///< Unspecified I2C failure
  I2C_NACK_ADDR,          ///< Address not acknowledged
  I2C_NACK_DATA,          ///< Data byte not acknowledged
  I2C_TIMEOUT,            ///< Bus transaction timed out
  I2C_BUS                 ///< Bus or arbitration error
};

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., I2C error code)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

/// @return true for errors reported by the transport callbacks
inline constexpr bool isTransportError(Err code) {
  return code == Err::I2C_ERROR || code == Err::I2C_NACK_ADDR ||
         code == Err::I2C_NACK_DATA || code == Err::I2C_TIMEOUT ||
         code == Err::I2C_BUS;
}

} // namespace SHT31D
