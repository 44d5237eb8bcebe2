/// @file SHT31D.h
/// @brief Main driver class for SHT31D
#pragma once

#include <cstddef>
#include <cstdint>
#include "SHT31D/Status.h"
#include "SHT31D/Config.h"
#include "SHT31D/CommandTable.h"
#include "SHT31D/WordCodec.h"
#include "SHT31D/Version.h"

namespace SHT31D {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// One converted sample
struct Sample {
  float temperatureC = 0.0f; ///< Temperature in Celsius
  float humidityPct = 0.0f;  ///< Relative humidity in percent
};

/// Result of a read: one sample in SINGLE mode, up to eight in PERIODIC mode
/// Periodic samples keep the order in which the sensor returned them.
struct Measurement {
  Sample samples[cmd::MAX_PERIODIC_SAMPLES] = {};
  size_t count = 0;
};

/// A single quantity extracted from a Measurement
struct Series {
  float values[cmd::MAX_PERIODIC_SAMPLES] = {};
  size_t count = 0;
};

/// Parsed status register
struct StatusRegister {
  uint16_t raw = 0;
  bool alertPending = false;
  bool heaterOn = false;
  bool rhAlert = false;
  bool tAlert = false;
  bool resetDetected = false;
  bool commandError = false;
  bool writeCrcError = false;
};

/// Acquisition settings owned by the driver
struct Settings {
  Mode mode = Mode::SINGLE;
  Repeatability repeatability = Repeatability::HIGH_REPEATABILITY;
  ClockStretching clockStretching = ClockStretching::STRETCH_DISABLED;
  bool art = false;                   ///< Accelerated response time
  Frequency frequency = Frequency::HZ_4;
};

/// SHT31D driver class
class SHT31D {
public:
  // =========================================================================
  // Lifecycle
  // =========================================================================

  /// Initialize the driver: validate config, reset the sensor, load defaults
  /// @param config Configuration including transport and clock callbacks
  /// @return Status::Ok() on success, error otherwise
  Status begin(const Config& config);

  /// Shutdown the driver (no bus traffic)
  void end();

  /// Break periodic acquisition and soft reset the sensor
  /// Leaves the driver in SINGLE mode with an invalidated cache.
  Status reset();

  // =========================================================================
  // Driver State
  // =========================================================================

  /// Get current driver state
  DriverState state() const { return _driverState; }

  /// Check if driver is ready for operations
  bool isOnline() const {
    return _driverState == DriverState::READY ||
           _driverState == DriverState::DEGRADED;
  }

  // =========================================================================
  // Health Tracking
  // =========================================================================

  /// Timestamp of last successful I2C operation
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// Timestamp of last failed I2C operation
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  /// Most recent error status
  Status lastError() const { return _lastError; }

  /// Consecutive failures since last success
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }

  /// Total failure count (lifetime)
  uint32_t totalFailures() const { return _totalFailures; }

  /// Total success count (lifetime)
  uint32_t totalSuccess() const { return _totalSuccess; }

  // =========================================================================
  // Measurement API
  // =========================================================================

  /// Whether a read at nowMs would hit the bus (SINGLE: always)
  bool needsRefresh(uint32_t nowMs) const;

  /// Read temperature and humidity, refreshing the cache when needed
  Status readMeasurement(Measurement& out);

  /// Read temperature only (same refresh rules as readMeasurement)
  Status readTemperature(Series& out);

  /// Read relative humidity only (same refresh rules as readMeasurement)
  Status readHumidity(Series& out);

  /// Timestamp of the last cache refresh (0 if none)
  uint32_t lastReadMs() const { return _lastReadMs; }

  /// Pad a periodic measurement to eight samples with the sensor's maximum
  /// outputs. Presentation helper only; reads never apply it.
  static void backfill(Measurement& m);

  // =========================================================================
  // Configuration
  // =========================================================================

  /// Set acquisition mode (starts or breaks periodic acquisition)
  Status setMode(Mode mode);

  /// Get current acquisition mode
  Status getMode(Mode& out) const;

  /// Set measurement repeatability (restarts periodic acquisition if active)
  Status setRepeatability(Repeatability rep);

  /// Get current repeatability
  Status getRepeatability(Repeatability& out) const;

  /// Set clock stretching for single-shot reads
  Status setClockStretching(ClockStretching stretch);

  /// Get current clock stretching mode
  Status getClockStretching(ClockStretching& out) const;

  /// Enable/disable accelerated response time (forces 4 Hz when enabled)
  Status setAcceleratedResponseTime(bool enable);

  /// Get accelerated response time flag
  Status getAcceleratedResponseTime(bool& out) const;

  /// Set periodic frequency
  /// @return CONFIG_LOCKED while accelerated response time is enabled
  Status setFrequency(Frequency freq);

  /// Get periodic frequency
  Status getFrequency(Frequency& out) const;

  /// Get a snapshot of current settings (no I2C)
  Status getSettings(Settings& out) const;

  // =========================================================================
  // Status / Heater / Serial Number
  // =========================================================================

  /// Read raw status register (2 bytes, checksum byte not read)
  Status readStatus(uint16_t& raw);

  /// Read and parse status register
  Status readStatus(StatusRegister& out);

  /// Clear status flags
  Status clearStatus();

  /// Enable/disable heater (no read-back; query readHeater() to confirm)
  Status setHeater(bool enable);

  /// Read heater state from status register
  Status readHeater(bool& enabled);

  /// Read electronic identification code (serial number)
  Status readSerialNumber(uint32_t& serial,
                          ClockStretching stretch = ClockStretching::STRETCH_ENABLED);

  // =========================================================================
  // Helpers
  // =========================================================================

  /// Parse status register bits
  static StatusRegister parseStatus(uint16_t raw);

  /// Convert raw temperature to Celsius (float)
  static float convertTemperatureC(uint16_t raw);

  /// Convert raw humidity to percent (float)
  static float convertHumidityPct(uint16_t raw);

  /// Convert raw temperature to Celsius * 100
  static int32_t convertTemperatureC_x100(uint16_t raw);

  /// Convert raw humidity to percent * 100
  static uint32_t convertHumidityPct_x100(uint16_t raw);

private:
  // =========================================================================
  // Transport Wrappers
  // =========================================================================

  /// Tracked I2C write (updates health)
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);

  /// Tracked I2C read (updates health)
  Status _i2cReadTracked(uint8_t* buf, size_t len);

  // =========================================================================
  // Command Access
  // =========================================================================

  Status _writeCommand(uint16_t code, uint32_t delayUs);
  Status _readFrame(uint8_t* buf, size_t len);

  // =========================================================================
  // Health Management
  // =========================================================================

  /// Update health counters and state based on operation result
  /// Called ONLY from tracked transport wrappers
  Status _updateHealth(const Status& st);

  // =========================================================================
  // Internal Helpers
  // =========================================================================

  uint32_t _now() const;
  void _wait(uint32_t delayUs);
  Status _requireInitialized() const;
  Status _resetSequence();
  Status _startPeriodic(Repeatability rep, Frequency freq, bool art);
  Status _stopPeriodic();
  Status _acquireSingle();
  Status _acquirePeriodic();
  Status _refreshIfNeeded();
  void _invalidateCache();

  // =========================================================================
  // State
  // =========================================================================

  Config _config;
  bool _initialized = false;
  DriverState _driverState = DriverState::UNINIT;

  // Health counters
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;

  Settings _settings;

  // Reading cache
  Measurement _cache;
  uint32_t _lastReadMs = 0;
  bool _cacheValid = false;
};

} // namespace SHT31D
