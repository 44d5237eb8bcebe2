/// @file CommandTable.h
/// @brief Command definitions, bit masks and static lookups for SHT31D
#pragma once

#include <cstdint>
#include <cstddef>
#include "SHT31D/Config.h"
#include "SHT31D/Status.h"

namespace SHT31D {
namespace cmd {

// ============================================================================
// I2C Addresses (7-bit)
// ============================================================================

static constexpr uint8_t I2C_ADDR_LOW = 0x44;
static constexpr uint8_t I2C_ADDR_HIGH = 0x45;

// ============================================================================
// CRC-8 parameters
// ============================================================================

static constexpr uint8_t CRC_INIT = 0xFF;
static constexpr uint8_t CRC_POLY = 0x31;

// ============================================================================
// Measurement Commands (16-bit)
// ============================================================================

// Single-shot measurement (clock stretching enabled)
static constexpr uint16_t CMD_SINGLE_SHOT_STRETCH_HIGH = 0x2C06;
static constexpr uint16_t CMD_SINGLE_SHOT_STRETCH_MED = 0x2C0D;
static constexpr uint16_t CMD_SINGLE_SHOT_STRETCH_LOW = 0x2C10;

// Single-shot measurement (clock stretching disabled)
static constexpr uint16_t CMD_SINGLE_SHOT_NO_STRETCH_HIGH = 0x2400;
static constexpr uint16_t CMD_SINGLE_SHOT_NO_STRETCH_MED = 0x240B;
static constexpr uint16_t CMD_SINGLE_SHOT_NO_STRETCH_LOW = 0x2416;

// Periodic measurement commands (repeatability + frequency)
static constexpr uint16_t CMD_PERIODIC_0_5_HIGH = 0x2032;
static constexpr uint16_t CMD_PERIODIC_0_5_MED = 0x2024;
static constexpr uint16_t CMD_PERIODIC_0_5_LOW = 0x202F;

static constexpr uint16_t CMD_PERIODIC_1_HIGH = 0x2130;
static constexpr uint16_t CMD_PERIODIC_1_MED = 0x2126;
static constexpr uint16_t CMD_PERIODIC_1_LOW = 0x212D;

static constexpr uint16_t CMD_PERIODIC_2_HIGH = 0x2236;
static constexpr uint16_t CMD_PERIODIC_2_MED = 0x2220;
static constexpr uint16_t CMD_PERIODIC_2_LOW = 0x222B;

static constexpr uint16_t CMD_PERIODIC_4_HIGH = 0x2334;
static constexpr uint16_t CMD_PERIODIC_4_MED = 0x2322;
static constexpr uint16_t CMD_PERIODIC_4_LOW = 0x2329;

static constexpr uint16_t CMD_PERIODIC_10_HIGH = 0x2737;
static constexpr uint16_t CMD_PERIODIC_10_MED = 0x2721;
static constexpr uint16_t CMD_PERIODIC_10_LOW = 0x272A;

// Accelerated response time (periodic, 4 Hz)
static constexpr uint16_t CMD_ART = 0x2B32;

// Fetch data (periodic readout)
static constexpr uint16_t CMD_FETCH_DATA = 0xE000;

// Stop periodic mode
static constexpr uint16_t CMD_BREAK = 0x3093;

// ============================================================================
// Status, reset, heater
// ============================================================================

static constexpr uint16_t CMD_READ_STATUS = 0xF32D;
static constexpr uint16_t CMD_CLEAR_STATUS = 0x3041;
static constexpr uint16_t CMD_SOFT_RESET = 0x30A2;

static constexpr uint16_t CMD_HEATER_ENABLE = 0x306D;
static constexpr uint16_t CMD_HEATER_DISABLE = 0x3066;

// ============================================================================
// Serial number
// ============================================================================

static constexpr uint16_t CMD_SERIAL_STRETCH = 0x3780;
static constexpr uint16_t CMD_SERIAL_NO_STRETCH = 0x3682;

// ============================================================================
// Status register bit masks (16-bit)
// ============================================================================

static constexpr uint16_t STATUS_ALERT_PENDING = 0x8000;
static constexpr uint16_t STATUS_HEATER_ON = 0x2000;
static constexpr uint16_t STATUS_RH_ALERT = 0x0800;
static constexpr uint16_t STATUS_T_ALERT = 0x0400;
static constexpr uint16_t STATUS_RESET_DETECTED = 0x0010;
static constexpr uint16_t STATUS_COMMAND_ERROR = 0x0002;
static constexpr uint16_t STATUS_WRITE_CRC_ERROR = 0x0001;

// ============================================================================
// Data lengths
// ============================================================================

static constexpr size_t COMMAND_LEN = 2;
static constexpr size_t DATA_WORD_BYTES = 2;
static constexpr size_t DATA_CRC_BYTES = 1;
static constexpr size_t DATA_WORD_WITH_CRC = 3;

static constexpr size_t MAX_PERIODIC_SAMPLES = 8;

static constexpr size_t MEASUREMENT_DATA_LEN = 6; // T (2+1) + RH (2+1)
static constexpr size_t PERIODIC_DATA_LEN =
    MEASUREMENT_DATA_LEN * MAX_PERIODIC_SAMPLES;  // 8 x (T + RH)
static constexpr size_t STATUS_DATA_LEN = 2;      // Status word, CRC not read
static constexpr size_t SERIAL_DATA_LEN = 6;      // SN (2+1 + 2+1)

// ============================================================================
// Timing (microseconds)
// ============================================================================

static constexpr uint32_t COMMAND_DELAY_US = 1000;
static constexpr uint32_t SOFT_RESET_DELAY_US = 1500;
static constexpr uint32_t SETTLE_LOW_US = 4500;
static constexpr uint32_t SETTLE_MEDIUM_US = 6500;
static constexpr uint32_t SETTLE_HIGH_US = 15500;

// ============================================================================
// Conversion constants
// ============================================================================

// Integer forms feed the x100 conversions; float forms are derived from them.
static constexpr int32_t TEMPERATURE_OFFSET_C_INT = -45;
static constexpr int32_t TEMPERATURE_SPAN_C_INT = 175;
static constexpr uint32_t TEMPERATURE_DIVISOR_RAW = 65535;
static constexpr uint32_t HUMIDITY_SPAN_PCT_INT = 100;
/// Some sensor revisions document 65523; this driver uses full scale.
static constexpr uint32_t HUMIDITY_DIVISOR_RAW = 65535;

static constexpr float TEMPERATURE_OFFSET_C = static_cast<float>(TEMPERATURE_OFFSET_C_INT);
static constexpr float TEMPERATURE_SPAN_C = static_cast<float>(TEMPERATURE_SPAN_C_INT);
static constexpr float TEMPERATURE_DIVISOR = static_cast<float>(TEMPERATURE_DIVISOR_RAW);
static constexpr float HUMIDITY_SPAN_PCT = static_cast<float>(HUMIDITY_SPAN_PCT_INT);
static constexpr float HUMIDITY_DIVISOR = static_cast<float>(HUMIDITY_DIVISOR_RAW);

// ============================================================================
// Lookup tables
// ============================================================================

/// Single-shot command record
struct SingleShotEntry {
  Repeatability repeatability;
  ClockStretching clockStretching;
  uint16_t code;
};

/// Periodic command record (art == true matches regardless of the other fields)
struct PeriodicEntry {
  bool art;
  Repeatability repeatability;
  Frequency frequency;
  uint16_t code;
};

/// Settling delay record
struct DelayEntry {
  Repeatability repeatability;
  uint32_t delayUs;
};

static constexpr size_t SINGLE_SHOT_ENTRY_COUNT = 6;
static constexpr size_t PERIODIC_ENTRY_COUNT = 16;
static constexpr size_t DELAY_ENTRY_COUNT = 3;

extern const SingleShotEntry SINGLE_SHOT_TABLE[SINGLE_SHOT_ENTRY_COUNT];
extern const PeriodicEntry PERIODIC_TABLE[PERIODIC_ENTRY_COUNT];
extern const DelayEntry DELAY_TABLE[DELAY_ENTRY_COUNT];

/// Look up the single-shot command for (repeatability, stretching)
/// @return INVALID_PARAM if the combination is not in the table
Status singleShotCommand(Repeatability rep, ClockStretching stretch, uint16_t& out);

/// Look up the periodic-start command
/// @param art When true, the ART command is returned and rep/freq are ignored
/// @return INVALID_PARAM if the combination is not in the table
Status periodicCommand(Repeatability rep, Frequency freq, bool art, uint16_t& out);

/// Look up the single-shot settling delay for a repeatability level
Status settleDelayUs(Repeatability rep, uint32_t& out);

/// Sampling period for a periodic frequency (0 if not a valid frequency)
uint32_t periodMsForFrequency(Frequency freq);

} // namespace cmd
} // namespace SHT31D
