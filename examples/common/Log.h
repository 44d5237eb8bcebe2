/// @file Log.h
/// @brief Serial logging macros for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  const uint32_t startMs = millis();
  while (!Serial && (millis() - startMs) < 2000) {
    delay(10);
  }
}

#define LOG_AT(level, fmt, ...)                                          \
  do {                                                                   \
    Serial.printf("[%lu] %s: " fmt "\n",                                 \
                  static_cast<unsigned long>(millis()), level, ##__VA_ARGS__); \
  } while (0)

#define LOGI(fmt, ...) LOG_AT("I", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) LOG_AT("W", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) LOG_AT("E", fmt, ##__VA_ARGS__)
