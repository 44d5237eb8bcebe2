/**
 * @file SHT31D.cpp
 * @brief SHT31D driver implementation.
 */

#include "SHT31D/SHT31D.h"

#include <cstring>
#include <limits>

namespace SHT31D {
namespace {

static constexpr uint8_t FRAME_FILL = 0xFF;
static constexpr size_t WORDS_PER_SAMPLE = 2;

static bool isValidRepeatability(Repeatability rep) {
  return rep == Repeatability::LOW_REPEATABILITY || rep == Repeatability::MEDIUM_REPEATABILITY ||
         rep == Repeatability::HIGH_REPEATABILITY;
}

static bool isValidClockStretching(ClockStretching stretch) {
  return stretch == ClockStretching::STRETCH_DISABLED || stretch == ClockStretching::STRETCH_ENABLED;
}

static bool isValidFrequency(Frequency freq) {
  return freq == Frequency::HZ_0_5 || freq == Frequency::HZ_1 ||
         freq == Frequency::HZ_2 || freq == Frequency::HZ_4 ||
         freq == Frequency::HZ_10;
}

static bool isValidMode(Mode mode) {
  return mode == Mode::SINGLE || mode == Mode::PERIODIC;
}

}  // namespace

Status SHT31D::begin(const Config& config) {
  _initialized = false;
  _driverState = DriverState::UNINIT;

  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;
  _settings = Settings{};
  _invalidateCache();

  if (config.i2cWrite == nullptr || config.i2cRead == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "I2C callbacks not set");
  }
  if (config.nowMs == nullptr || config.delayUs == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "Clock callbacks not set");
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.i2cAddress != cmd::I2C_ADDR_LOW &&
      config.i2cAddress != cmd::I2C_ADDR_HIGH) {
    return Status::Error(Err::INVALID_CONFIG, "Invalid I2C address");
  }

  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }

  Status st = _resetSequence();
  if (!st.ok()) {
    if (isTransportError(st.code)) {
      return Status::Error(Err::DEVICE_NOT_FOUND, "Device not responding", st.detail);
    }
    return st;
  }

  _settings = Settings{};
  _initialized = true;
  _driverState = DriverState::READY;

  return Status::Ok();
}

void SHT31D::end() {
  _initialized = false;
  _driverState = DriverState::UNINIT;
  _invalidateCache();
}

Status SHT31D::reset() {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  return _resetSequence();
}

bool SHT31D::needsRefresh(uint32_t nowMs) const {
  if (_settings.mode == Mode::SINGLE || !_cacheValid) {
    return true;
  }

  const uint32_t periodMs = cmd::periodMsForFrequency(_settings.frequency);
  return static_cast<uint32_t>(nowMs - _lastReadMs) > periodMs;
}

Status SHT31D::readMeasurement(Measurement& out) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  st = _refreshIfNeeded();
  if (!st.ok()) {
    return st;
  }

  out = _cache;
  return Status::Ok();
}

Status SHT31D::readTemperature(Series& out) {
  Measurement m;
  Status st = readMeasurement(m);
  if (!st.ok()) {
    return st;
  }

  out.count = m.count;
  for (size_t i = 0; i < m.count; ++i) {
    out.values[i] = m.samples[i].temperatureC;
  }
  return Status::Ok();
}

Status SHT31D::readHumidity(Series& out) {
  Measurement m;
  Status st = readMeasurement(m);
  if (!st.ok()) {
    return st;
  }

  out.count = m.count;
  for (size_t i = 0; i < m.count; ++i) {
    out.values[i] = m.samples[i].humidityPct;
  }
  return Status::Ok();
}

void SHT31D::backfill(Measurement& m) {
  const float maxTemp = convertTemperatureC(0xFFFF);
  const float maxHumidity = convertHumidityPct(0xFFFF);
  for (size_t i = m.count; i < cmd::MAX_PERIODIC_SAMPLES; ++i) {
    m.samples[i].temperatureC = maxTemp;
    m.samples[i].humidityPct = maxHumidity;
  }
  m.count = cmd::MAX_PERIODIC_SAMPLES;
}

Status SHT31D::setMode(Mode mode) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  if (!isValidMode(mode)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid mode");
  }

  if (mode == _settings.mode) {
    return Status::Ok();
  }

  if (mode == Mode::SINGLE) {
    return _stopPeriodic();
  }

  return _startPeriodic(_settings.repeatability, _settings.frequency, _settings.art);
}

Status SHT31D::getMode(Mode& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings.mode;
  return Status::Ok();
}

Status SHT31D::setRepeatability(Repeatability rep) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  if (!isValidRepeatability(rep)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid repeatability");
  }

  if (rep == _settings.repeatability) {
    return Status::Ok();
  }

  if (_settings.mode == Mode::PERIODIC) {
    return _startPeriodic(rep, _settings.frequency, _settings.art);
  }

  _settings.repeatability = rep;
  return Status::Ok();
}

Status SHT31D::getRepeatability(Repeatability& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings.repeatability;
  return Status::Ok();
}

Status SHT31D::setClockStretching(ClockStretching stretch) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  if (!isValidClockStretching(stretch)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid clock stretching");
  }

  _settings.clockStretching = stretch;
  return Status::Ok();
}

Status SHT31D::getClockStretching(ClockStretching& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings.clockStretching;
  return Status::Ok();
}

Status SHT31D::setAcceleratedResponseTime(bool enable) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  if (enable == _settings.art) {
    return Status::Ok();
  }

  // ART runs at a fixed 4 Hz; the frequency stays there after disabling.
  const Frequency freq = enable ? Frequency::HZ_4 : _settings.frequency;

  if (_settings.mode == Mode::PERIODIC) {
    return _startPeriodic(_settings.repeatability, freq, enable);
  }

  _settings.art = enable;
  _settings.frequency = freq;
  return Status::Ok();
}

Status SHT31D::getAcceleratedResponseTime(bool& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings.art;
  return Status::Ok();
}

Status SHT31D::setFrequency(Frequency freq) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  if (_settings.art) {
    return Status::Error(Err::CONFIG_LOCKED, "Frequency locked to 4 Hz while ART enabled");
  }
  if (!isValidFrequency(freq)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid frequency");
  }

  if (freq == _settings.frequency) {
    return Status::Ok();
  }

  if (_settings.mode == Mode::PERIODIC) {
    return _startPeriodic(_settings.repeatability, freq, false);
  }

  _settings.frequency = freq;
  return Status::Ok();
}

Status SHT31D::getFrequency(Frequency& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings.frequency;
  return Status::Ok();
}

Status SHT31D::getSettings(Settings& out) const {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  out = _settings;
  return Status::Ok();
}

Status SHT31D::readStatus(uint16_t& raw) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  st = _writeCommand(cmd::CMD_READ_STATUS, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::STATUS_DATA_LEN] = {};
  st = _readFrame(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  raw = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
  return Status::Ok();
}

Status SHT31D::readStatus(StatusRegister& out) {
  uint16_t raw = 0;
  Status st = readStatus(raw);
  if (!st.ok()) {
    return st;
  }

  out = parseStatus(raw);
  return Status::Ok();
}

Status SHT31D::clearStatus() {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  return _writeCommand(cmd::CMD_CLEAR_STATUS, cmd::COMMAND_DELAY_US);
}

Status SHT31D::setHeater(bool enable) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }

  return _writeCommand(enable ? cmd::CMD_HEATER_ENABLE : cmd::CMD_HEATER_DISABLE,
                       cmd::COMMAND_DELAY_US);
}

Status SHT31D::readHeater(bool& enabled) {
  StatusRegister stReg;
  Status st = readStatus(stReg);
  if (!st.ok()) {
    return st;
  }
  enabled = stReg.heaterOn;
  return Status::Ok();
}

Status SHT31D::readSerialNumber(uint32_t& serial, ClockStretching stretch) {
  Status st = _requireInitialized();
  if (!st.ok()) {
    return st;
  }
  if (!isValidClockStretching(stretch)) {
    return Status::Error(Err::INVALID_PARAM, "Invalid clock stretching");
  }

  const uint16_t code = (stretch == ClockStretching::STRETCH_ENABLED)
      ? cmd::CMD_SERIAL_STRETCH
      : cmd::CMD_SERIAL_NO_STRETCH;

  st = _writeCommand(code, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::SERIAL_DATA_LEN];
  std::memset(buf, FRAME_FILL, sizeof(buf));
  st = _readFrame(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  DecodedWords words;
  st = decodeWords(buf, sizeof(buf), words);
  if (!st.ok()) {
    return st;
  }
  if (words.size() != 2) {
    return Status::Error(Err::CRC_MISMATCH, "CRC mismatch (serial word2)");
  }

  serial = (static_cast<uint32_t>(words[0]) << 16) | words[1];
  return Status::Ok();
}

StatusRegister SHT31D::parseStatus(uint16_t raw) {
  StatusRegister out;
  out.raw = raw;
  out.alertPending = (raw & cmd::STATUS_ALERT_PENDING) != 0;
  out.heaterOn = (raw & cmd::STATUS_HEATER_ON) != 0;
  out.rhAlert = (raw & cmd::STATUS_RH_ALERT) != 0;
  out.tAlert = (raw & cmd::STATUS_T_ALERT) != 0;
  out.resetDetected = (raw & cmd::STATUS_RESET_DETECTED) != 0;
  out.commandError = (raw & cmd::STATUS_COMMAND_ERROR) != 0;
  out.writeCrcError = (raw & cmd::STATUS_WRITE_CRC_ERROR) != 0;
  return out;
}

float SHT31D::convertTemperatureC(uint16_t raw) {
  return cmd::TEMPERATURE_OFFSET_C +
         (cmd::TEMPERATURE_SPAN_C * static_cast<float>(raw) / cmd::TEMPERATURE_DIVISOR);
}

float SHT31D::convertHumidityPct(uint16_t raw) {
  return (cmd::HUMIDITY_SPAN_PCT * static_cast<float>(raw)) / cmd::HUMIDITY_DIVISOR;
}

int32_t SHT31D::convertTemperatureC_x100(uint16_t raw) {
  const int32_t divisor = static_cast<int32_t>(cmd::TEMPERATURE_DIVISOR_RAW);
  const int32_t numerator = cmd::TEMPERATURE_SPAN_C_INT * 100 * static_cast<int32_t>(raw);
  return (numerator + divisor / 2) / divisor + cmd::TEMPERATURE_OFFSET_C_INT * 100;
}

uint32_t SHT31D::convertHumidityPct_x100(uint16_t raw) {
  const uint32_t divisor = cmd::HUMIDITY_DIVISOR_RAW;
  const uint32_t numerator = cmd::HUMIDITY_SPAN_PCT_INT * 100U * static_cast<uint32_t>(raw);
  return (numerator + divisor / 2U) / divisor;
}

Status SHT31D::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _config.i2cWrite(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                               _config.i2cUser);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status SHT31D::_i2cReadTracked(uint8_t* buf, size_t len) {
  if (buf == nullptr || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C buffer");
  }

  Status st = _config.i2cRead(_config.i2cAddress, buf, len, _config.i2cTimeoutMs,
                              _config.i2cUser);
  if (st.code == Err::INVALID_CONFIG || st.code == Err::INVALID_PARAM) {
    return st;
  }
  return _updateHealth(st);
}

Status SHT31D::_writeCommand(uint16_t code, uint32_t delayUs) {
  uint8_t buf[cmd::COMMAND_LEN] = {};
  encodeCommand(code, buf);

  Status st = _i2cWriteTracked(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  _wait(delayUs);
  return Status::Ok();
}

Status SHT31D::_readFrame(uint8_t* buf, size_t len) {
  return _i2cReadTracked(buf, len);
}

Status SHT31D::_updateHealth(const Status& st) {
  const uint32_t now = _now();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (!_initialized) {
    if (st.ok()) {
      _lastOkMs = now;
    } else {
      _lastError = st;
      _lastErrorMs = now;
    }
    return st;
  }

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _driverState = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _driverState = DriverState::OFFLINE;
  } else {
    _driverState = DriverState::DEGRADED;
  }

  return st;
}

uint32_t SHT31D::_now() const {
  return _config.nowMs(_config.timeUser);
}

void SHT31D::_wait(uint32_t delayUs) {
  if (delayUs == 0) {
    return;
  }
  _config.delayUs(delayUs, _config.timeUser);
}

Status SHT31D::_requireInitialized() const {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "begin() not called");
  }
  return Status::Ok();
}

Status SHT31D::_resetSequence() {
  // Soft reset is ignored while the sensor streams, so always break first.
  Status st = _writeCommand(cmd::CMD_BREAK, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  st = _writeCommand(cmd::CMD_SOFT_RESET, cmd::SOFT_RESET_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  _settings.mode = Mode::SINGLE;
  _invalidateCache();
  return Status::Ok();
}

Status SHT31D::_startPeriodic(Repeatability rep, Frequency freq, bool art) {
  uint16_t code = 0;
  Status st = cmd::periodicCommand(rep, freq, art, code);
  if (!st.ok()) {
    return st;
  }

  st = _writeCommand(code, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  _settings.mode = Mode::PERIODIC;
  _settings.repeatability = rep;
  _settings.frequency = freq;
  _settings.art = art;
  _invalidateCache();
  return Status::Ok();
}

Status SHT31D::_stopPeriodic() {
  Status st = _writeCommand(cmd::CMD_BREAK, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  _settings.mode = Mode::SINGLE;
  _invalidateCache();
  return Status::Ok();
}

Status SHT31D::_acquireSingle() {
  uint16_t code = 0;
  Status st = cmd::singleShotCommand(_settings.repeatability,
                                     _settings.clockStretching, code);
  if (!st.ok()) {
    return st;
  }

  // With clock stretching the bus blocks until data is ready.
  uint32_t delayUs = cmd::COMMAND_DELAY_US;
  if (_settings.clockStretching == ClockStretching::STRETCH_DISABLED) {
    st = cmd::settleDelayUs(_settings.repeatability, delayUs);
    if (!st.ok()) {
      return st;
    }
  }

  st = _writeCommand(code, delayUs);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::MEASUREMENT_DATA_LEN];
  std::memset(buf, FRAME_FILL, sizeof(buf));
  st = _readFrame(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  DecodedWords words;
  st = decodeWords(buf, sizeof(buf), words);
  if (!st.ok()) {
    return st;
  }
  if (words.size() < WORDS_PER_SAMPLE) {
    return Status::Error(Err::CRC_MISMATCH, "CRC mismatch (humidity)");
  }

  _cache.samples[0].temperatureC = convertTemperatureC(words[0]);
  _cache.samples[0].humidityPct = convertHumidityPct(words[1]);
  _cache.count = 1;
  _lastReadMs = _now();
  _cacheValid = true;
  return Status::Ok();
}

Status SHT31D::_acquirePeriodic() {
  Status st = _writeCommand(cmd::CMD_FETCH_DATA, cmd::COMMAND_DELAY_US);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::PERIODIC_DATA_LEN];
  std::memset(buf, FRAME_FILL, sizeof(buf));
  st = _readFrame(buf, sizeof(buf));
  if (!st.ok()) {
    return st;
  }

  DecodedWords words;
  st = decodeWords(buf, sizeof(buf), words);
  if (!st.ok()) {
    return st;
  }

  // A temperature word without its humidity partner is dropped.
  const size_t pairs = words.size() / WORDS_PER_SAMPLE;
  if (pairs == 0) {
    return Status::Error(Err::CRC_MISMATCH, "CRC mismatch (humidity)");
  }

  for (size_t i = 0; i < pairs; ++i) {
    _cache.samples[i].temperatureC = convertTemperatureC(words[i * WORDS_PER_SAMPLE]);
    _cache.samples[i].humidityPct = convertHumidityPct(words[i * WORDS_PER_SAMPLE + 1]);
  }
  _cache.count = pairs;
  _lastReadMs = _now();
  _cacheValid = true;
  return Status::Ok();
}

Status SHT31D::_refreshIfNeeded() {
  if (!needsRefresh(_now())) {
    return Status::Ok();
  }

  if (_settings.mode == Mode::PERIODIC) {
    return _acquirePeriodic();
  }
  return _acquireSingle();
}

void SHT31D::_invalidateCache() {
  _cacheValid = false;
  _lastReadMs = 0;
}

}  // namespace SHT31D
