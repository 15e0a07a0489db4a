#pragma once
/**
 * @file IrrigationDefaults.h
 * @brief Timing, physical and policy constants of the irrigation engine.
 */
#include <stdint.h>

namespace IrrigationDefaults {

// Timers
constexpr uint32_t ZoneTickMs = 1000;        // countdown + virtual zone hand-off
constexpr uint32_t FlowSampleMs = 1000;      // flow counter read-out period
constexpr uint32_t PauseCheckMs = 5000;      // pause expiry polling
constexpr uint32_t TankSampleMs = 60000;     // ultrasonic sampling period
constexpr uint32_t DebounceWindowMs = 500;   // request batch window
constexpr uint32_t RevertDelayMs = 500;      // cosmetic revert of rejected requests
constexpr uint32_t ShutdownGraceMs = 2000;   // max wait for the core mutex on restart

// Leak heuristic
constexpr uint32_t LeakWindowMs = 30000;     // flow samples considered
constexpr uint32_t LeakSettleMs = 10000;     // ignore flow this long after a valve closes
constexpr uint8_t LeakNonZeroPct = 80;       // raise above this share of non-zero samples

// Zone policy
constexpr int32_t DefaultZoneRuntimeSec = 300;
constexpr int32_t MaxRuntimeSec = 7200;
constexpr uint8_t MaxActiveZones = 1;

// Flow sensor (L/min per Hz), 0 disables rate computation
constexpr float DefaultFlowFactor = 0.0f;

// Ultrasonic sensor (JSN-SR04T class)
constexpr float UsonicMinRangeMm = 200.0f;
constexpr float UsonicMaxRangeMm = 4500.0f;
constexpr uint8_t UsonicReadings = 1;
constexpr uint32_t UsonicEchoTimeoutUs = 30000;

// Pause
constexpr uint8_t PauseMaxDays = 7;
constexpr uint32_t SecondsPerDay = 86400;
constexpr uint32_t MinValidEpoch = 1609459200; // 2021-01-01, earlier means clock not set

}  // namespace IrrigationDefaults
