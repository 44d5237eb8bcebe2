/// @file main.cpp
/// @brief Serial bringup console for SHT31D
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"

#include "SHT31D/SHT31D.h"

// ============================================================================
// Globals
// ============================================================================

/// ADDR pin low; use 0x45 with ADDR pulled high
static constexpr uint8_t SENSOR_ADDR = 0x44;

SHT31D::SHT31D device;
SHT31D::Config gConfig;
bool gConfigReady = false;
bool backfillMode = false;

// ============================================================================
// Formatting
// ============================================================================

const char* errToStr(SHT31D::Err err) {
  using namespace SHT31D;
  switch (err) {
    case Err::OK: return "OK";
    case Err::NOT_INITIALIZED: return "NOT_INITIALIZED";
    case Err::INVALID_CONFIG: return "INVALID_CONFIG";
    case Err::INVALID_PARAM: return "INVALID_PARAM";
    case Err::CONFIG_LOCKED: return "CONFIG_LOCKED";
    case Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    case Err::CRC_MISMATCH: return "CRC_MISMATCH";
    case Err::I2C_ERROR: return "I2C_ERROR";
    case Err::I2C_NACK_ADDR: return "I2C_NACK_ADDR";
    case Err::I2C_NACK_DATA: return "I2C_NACK_DATA";
    case Err::I2C_TIMEOUT: return "I2C_TIMEOUT";
    case Err::I2C_BUS: return "I2C_BUS";
    default: return "UNKNOWN";
  }
}

const char* stateToStr(SHT31D::DriverState st) {
  static const char* const NAMES[] = {"UNINIT", "READY", "DEGRADED", "OFFLINE"};
  const size_t idx = static_cast<size_t>(st);
  return idx < 4 ? NAMES[idx] : "UNKNOWN";
}

const char* repToStr(SHT31D::Repeatability rep) {
  static const char* const NAMES[] = {"low", "med", "high"};
  const size_t idx = static_cast<size_t>(rep);
  return idx < 3 ? NAMES[idx] : "?";
}

const char* freqToStr(SHT31D::Frequency freq) {
  static const char* const NAMES[] = {"0.5", "1", "2", "4", "10"};
  const size_t idx = static_cast<size_t>(freq);
  return idx < 5 ? NAMES[idx] : "?";
}

/// Report a result; silent on success unless verbose
void report(const SHT31D::Status& st, bool verbose = true) {
  if (st.ok()) {
    if (verbose) {
      Serial.println("OK");
    }
    return;
  }
  LOGW("%s (detail=%ld): %s", errToStr(st.code), static_cast<long>(st.detail),
       st.msg ? st.msg : "");
}

void printHealth() {
  Serial.printf("state=%s online=%d consecutive=%u fail=%lu ok=%lu lastOk=%lu lastErr=%lu",
                stateToStr(device.state()),
                device.isOnline() ? 1 : 0,
                static_cast<unsigned>(device.consecutiveFailures()),
                static_cast<unsigned long>(device.totalFailures()),
                static_cast<unsigned long>(device.totalSuccess()),
                static_cast<unsigned long>(device.lastOkMs()),
                static_cast<unsigned long>(device.lastErrorMs()));
  if (device.lastError().code != SHT31D::Err::OK) {
    Serial.printf(" (%s)", errToStr(device.lastError().code));
  }
  Serial.println();
}

void printSettings() {
  SHT31D::Settings s;
  const SHT31D::Status st = device.getSettings(s);
  if (!st.ok()) {
    report(st);
    return;
  }
  Serial.printf("addr=0x%02X mode=%s rep=%s freq=%sHz stretch=%d art=%d backfill=%d\n",
                gConfig.i2cAddress,
                s.mode == SHT31D::Mode::PERIODIC ? "periodic" : "single",
                repToStr(s.repeatability), freqToStr(s.frequency),
                s.clockStretching == SHT31D::ClockStretching::STRETCH_ENABLED ? 1 : 0,
                s.art ? 1 : 0, backfillMode ? 1 : 0);
}

// ============================================================================
// Argument Parsing
// ============================================================================

bool parseRepeatability(const String& arg, SHT31D::Repeatability& out) {
  for (uint8_t i = 0; i < 3; ++i) {
    const auto rep = static_cast<SHT31D::Repeatability>(i);
    if (arg == repToStr(rep)) {
      out = rep;
      return true;
    }
  }
  return false;
}

bool parseFrequency(const String& arg, SHT31D::Frequency& out) {
  for (uint8_t i = 0; i < 5; ++i) {
    const auto freq = static_cast<SHT31D::Frequency>(i);
    if (arg == freqToStr(freq)) {
      out = freq;
      return true;
    }
  }
  return false;
}

bool parseOnOff(const String& arg, bool& out) {
  if (arg == "on" || arg == "1") {
    out = true;
    return true;
  }
  if (arg == "off" || arg == "0") {
    out = false;
    return true;
  }
  return false;
}

// ============================================================================
// Commands
// ============================================================================

using Handler = void (*)(const String& arg);

struct Command {
  const char* name;
  const char* usage;
  Handler handler;
};

void cmdHelp(const String& arg);

void cmdRead(const String& arg) {
  (void)arg;
  SHT31D::Measurement m;
  const SHT31D::Status st = device.readMeasurement(m);
  if (!st.ok()) {
    report(st);
    return;
  }
  SHT31D::Mode mode = SHT31D::Mode::SINGLE;
  if (backfillMode && device.getMode(mode).ok() && mode == SHT31D::Mode::PERIODIC) {
    SHT31D::SHT31D::backfill(m);
  }
  for (size_t i = 0; i < m.count; ++i) {
    Serial.printf("[%u] %.2f C  %.2f %%RH\n", static_cast<unsigned>(i),
                  m.samples[i].temperatureC, m.samples[i].humidityPct);
  }
}

void cmdSeries(const String& arg) {
  const bool temperature = (arg != "hum");
  SHT31D::Series series;
  const SHT31D::Status st = temperature ? device.readTemperature(series)
                                        : device.readHumidity(series);
  if (!st.ok()) {
    report(st);
    return;
  }
  for (size_t i = 0; i < series.count; ++i) {
    Serial.printf("[%u] %.2f\n", static_cast<unsigned>(i), series.values[i]);
  }
}

void cmdMode(const String& arg) {
  if (arg == "single") {
    report(device.setMode(SHT31D::Mode::SINGLE));
  } else if (arg == "periodic") {
    report(device.setMode(SHT31D::Mode::PERIODIC));
  } else if (arg.length() == 0) {
    printSettings();
  } else {
    LOGW("Invalid mode: %s", arg.c_str());
  }
}

void cmdRepeat(const String& arg) {
  SHT31D::Repeatability rep;
  if (!parseRepeatability(arg, rep)) {
    LOGW("Invalid repeatability: %s", arg.c_str());
    return;
  }
  report(device.setRepeatability(rep));
}

void cmdFreq(const String& arg) {
  SHT31D::Frequency freq;
  if (!parseFrequency(arg, freq)) {
    LOGW("Invalid frequency: %s", arg.c_str());
    return;
  }
  report(device.setFrequency(freq));
}

void cmdStretch(const String& arg) {
  bool enable = false;
  if (!parseOnOff(arg, enable)) {
    LOGW("Usage: stretch on|off");
    return;
  }
  report(device.setClockStretching(enable ? SHT31D::ClockStretching::STRETCH_ENABLED
                                          : SHT31D::ClockStretching::STRETCH_DISABLED));
}

void cmdArt(const String& arg) {
  bool enable = false;
  if (!parseOnOff(arg, enable)) {
    LOGW("Usage: art on|off");
    return;
  }
  report(device.setAcceleratedResponseTime(enable));
}

void cmdBackfill(const String& arg) {
  if (!parseOnOff(arg, backfillMode)) {
    LOGW("Usage: backfill on|off");
  }
}

void cmdStatus(const String& arg) {
  (void)arg;
  SHT31D::StatusRegister reg;
  const SHT31D::Status st = device.readStatus(reg);
  if (!st.ok()) {
    report(st);
    return;
  }
  Serial.printf("0x%04X alert=%d heater=%d rh=%d t=%d reset=%d cmd=%d crc=%d\n",
                reg.raw, reg.alertPending, reg.heaterOn, reg.rhAlert, reg.tAlert,
                reg.resetDetected, reg.commandError, reg.writeCrcError);
}

void cmdClearStatus(const String& arg) {
  (void)arg;
  report(device.clearStatus());
}

void cmdHeater(const String& arg) {
  bool enable = false;
  if (parseOnOff(arg, enable)) {
    report(device.setHeater(enable));
    return;
  }
  bool on = false;
  const SHT31D::Status st = device.readHeater(on);
  if (!st.ok()) {
    report(st);
    return;
  }
  Serial.printf("heater=%s\n", on ? "on" : "off");
}

void cmdSerial(const String& arg) {
  const SHT31D::ClockStretching stretch = (arg == "nostretch")
      ? SHT31D::ClockStretching::STRETCH_DISABLED
      : SHT31D::ClockStretching::STRETCH_ENABLED;
  uint32_t serial = 0;
  const SHT31D::Status st = device.readSerialNumber(serial, stretch);
  if (!st.ok()) {
    report(st);
    return;
  }
  Serial.printf("serial=0x%08lX\n", static_cast<unsigned long>(serial));
}

void cmdConvert(const String& arg) {
  const int split = arg.indexOf(' ');
  if (split < 0) {
    LOGW("Usage: convert <rawT> <rawRH>");
    return;
  }
  const long rawT = strtol(arg.substring(0, split).c_str(), nullptr, 0);
  const long rawRh = strtol(arg.substring(split + 1).c_str(), nullptr, 0);
  if (rawT < 0 || rawT > 0xFFFF || rawRh < 0 || rawRh > 0xFFFF) {
    LOGW("Raw values must be 0..0xFFFF");
    return;
  }
  const uint16_t t = static_cast<uint16_t>(rawT);
  const uint16_t rh = static_cast<uint16_t>(rawRh);
  Serial.printf("%.2f C (x100=%ld)  %.2f %%RH (x100=%lu)\n",
                SHT31D::SHT31D::convertTemperatureC(t),
                static_cast<long>(SHT31D::SHT31D::convertTemperatureC_x100(t)),
                SHT31D::SHT31D::convertHumidityPct(rh),
                static_cast<unsigned long>(SHT31D::SHT31D::convertHumidityPct_x100(rh)));
}

void cmdReset(const String& arg) {
  (void)arg;
  report(device.reset());
}

void cmdBegin(const String& arg) {
  (void)arg;
  if (!gConfigReady) {
    LOGW("Config not ready");
    return;
  }
  report(device.begin(gConfig));
}

void cmdEnd(const String& arg) {
  (void)arg;
  device.end();
  LOGI("Driver ended");
}

void cmdDrv(const String& arg) {
  (void)arg;
  printHealth();
  printSettings();
}

const Command COMMANDS[] = {
    {"help", "", cmdHelp},
    {"read", "", cmdRead},
    {"temp", "", cmdSeries},
    {"hum", "", cmdSeries},
    {"mode", "[single|periodic]", cmdMode},
    {"repeat", "low|med|high", cmdRepeat},
    {"freq", "0.5|1|2|4|10", cmdFreq},
    {"stretch", "on|off", cmdStretch},
    {"art", "on|off", cmdArt},
    {"backfill", "on|off", cmdBackfill},
    {"status", "", cmdStatus},
    {"clearstatus", "", cmdClearStatus},
    {"heater", "[on|off]", cmdHeater},
    {"serial", "[nostretch]", cmdSerial},
    {"convert", "<rawT> <rawRH>", cmdConvert},
    {"reset", "", cmdReset},
    {"begin", "", cmdBegin},
    {"end", "", cmdEnd},
    {"drv", "", cmdDrv},
};

void cmdHelp(const String& arg) {
  (void)arg;
  for (const Command& c : COMMANDS) {
    Serial.printf("  %s %s\n", c.name, c.usage);
  }
}

void processCommand(const String& line) {
  String input = line;
  input.trim();
  const int space = input.indexOf(' ');
  const String name = (space < 0) ? input : input.substring(0, space);
  String arg = (space < 0) ? String() : input.substring(space + 1);
  arg.trim();

  for (const Command& c : COMMANDS) {
    if (name == c.name) {
      // temp/hum share a handler keyed by the command name
      c.handler(c.handler == cmdSeries ? name : arg);
      return;
    }
  }
  LOGW("Unknown command: %s", name.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);
  LOGI("SHT31D bringup v%s", SHT31D::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }

  gConfig.i2cWrite = transport::wireWrite;
  gConfig.i2cRead = transport::wireRead;
  gConfig.nowMs = transport::arduinoNowMs;
  gConfig.delayUs = transport::arduinoDelayUs;
  gConfig.i2cAddress = SENSOR_ADDR;
  gConfig.i2cTimeoutMs = board::I2C_TIMEOUT_MS;
  gConfigReady = true;

  const SHT31D::Status st = device.begin(gConfig);
  if (!st.ok()) {
    LOGE("Failed to initialize device");
    report(st);
    return;
  }

  printHealth();
  cmdHelp(String());
  Serial.print("> ");
}

void loop() {
  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
