/**
 * @file CommandTable.cpp
 * @brief SHT31D command lookup tables.
 */

#include "SHT31D/CommandTable.h"

namespace SHT31D {
namespace cmd {

const SingleShotEntry SINGLE_SHOT_TABLE[SINGLE_SHOT_ENTRY_COUNT] = {
    {Repeatability::LOW_REPEATABILITY, ClockStretching::STRETCH_DISABLED,
     CMD_SINGLE_SHOT_NO_STRETCH_LOW},
    {Repeatability::MEDIUM_REPEATABILITY, ClockStretching::STRETCH_DISABLED,
     CMD_SINGLE_SHOT_NO_STRETCH_MED},
    {Repeatability::HIGH_REPEATABILITY, ClockStretching::STRETCH_DISABLED,
     CMD_SINGLE_SHOT_NO_STRETCH_HIGH},
    {Repeatability::LOW_REPEATABILITY, ClockStretching::STRETCH_ENABLED,
     CMD_SINGLE_SHOT_STRETCH_LOW},
    {Repeatability::MEDIUM_REPEATABILITY, ClockStretching::STRETCH_ENABLED,
     CMD_SINGLE_SHOT_STRETCH_MED},
    {Repeatability::HIGH_REPEATABILITY, ClockStretching::STRETCH_ENABLED,
     CMD_SINGLE_SHOT_STRETCH_HIGH},
};

const PeriodicEntry PERIODIC_TABLE[PERIODIC_ENTRY_COUNT] = {
    {true, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_4, CMD_ART},
    {false, Repeatability::LOW_REPEATABILITY, Frequency::HZ_0_5, CMD_PERIODIC_0_5_LOW},
    {false, Repeatability::MEDIUM_REPEATABILITY, Frequency::HZ_0_5, CMD_PERIODIC_0_5_MED},
    {false, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_0_5, CMD_PERIODIC_0_5_HIGH},
    {false, Repeatability::LOW_REPEATABILITY, Frequency::HZ_1, CMD_PERIODIC_1_LOW},
    {false, Repeatability::MEDIUM_REPEATABILITY, Frequency::HZ_1, CMD_PERIODIC_1_MED},
    {false, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_1, CMD_PERIODIC_1_HIGH},
    {false, Repeatability::LOW_REPEATABILITY, Frequency::HZ_2, CMD_PERIODIC_2_LOW},
    {false, Repeatability::MEDIUM_REPEATABILITY, Frequency::HZ_2, CMD_PERIODIC_2_MED},
    {false, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_2, CMD_PERIODIC_2_HIGH},
    {false, Repeatability::LOW_REPEATABILITY, Frequency::HZ_4, CMD_PERIODIC_4_LOW},
    {false, Repeatability::MEDIUM_REPEATABILITY, Frequency::HZ_4, CMD_PERIODIC_4_MED},
    {false, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_4, CMD_PERIODIC_4_HIGH},
    {false, Repeatability::LOW_REPEATABILITY, Frequency::HZ_10, CMD_PERIODIC_10_LOW},
    {false, Repeatability::MEDIUM_REPEATABILITY, Frequency::HZ_10, CMD_PERIODIC_10_MED},
    {false, Repeatability::HIGH_REPEATABILITY, Frequency::HZ_10, CMD_PERIODIC_10_HIGH},
};

const DelayEntry DELAY_TABLE[DELAY_ENTRY_COUNT] = {
    {Repeatability::LOW_REPEATABILITY, SETTLE_LOW_US},
    {Repeatability::MEDIUM_REPEATABILITY, SETTLE_MEDIUM_US},
    {Repeatability::HIGH_REPEATABILITY, SETTLE_HIGH_US},
};

Status singleShotCommand(Repeatability rep, ClockStretching stretch, uint16_t& out) {
  for (size_t i = 0; i < SINGLE_SHOT_ENTRY_COUNT; ++i) {
    const SingleShotEntry& e = SINGLE_SHOT_TABLE[i];
    if (e.repeatability == rep && e.clockStretching == stretch) {
      out = e.code;
      return Status::Ok();
    }
  }
  return Status::Error(Err::INVALID_PARAM, "Invalid single-shot configuration");
}

Status periodicCommand(Repeatability rep, Frequency freq, bool art, uint16_t& out) {
  for (size_t i = 0; i < PERIODIC_ENTRY_COUNT; ++i) {
    const PeriodicEntry& e = PERIODIC_TABLE[i];
    if (art) {
      if (e.art) {
        out = e.code;
        return Status::Ok();
      }
      continue;
    }
    if (!e.art && e.repeatability == rep && e.frequency == freq) {
      out = e.code;
      return Status::Ok();
    }
  }
  return Status::Error(Err::INVALID_PARAM, "Invalid periodic configuration");
}

Status settleDelayUs(Repeatability rep, uint32_t& out) {
  for (size_t i = 0; i < DELAY_ENTRY_COUNT; ++i) {
    if (DELAY_TABLE[i].repeatability == rep) {
      out = DELAY_TABLE[i].delayUs;
      return Status::Ok();
    }
  }
  return Status::Error(Err::INVALID_PARAM, "Invalid repeatability");
}

uint32_t periodMsForFrequency(Frequency freq) {
  switch (freq) {
    case Frequency::HZ_0_5: return 2000;
    case Frequency::HZ_1: return 1000;
    case Frequency::HZ_2: return 500;
    case Frequency::HZ_4: return 250;
    case Frequency::HZ_10: return 100;
    default: return 0;
  }
}

}  // namespace cmd
}  // namespace SHT31D
