#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer (48 bytes max).

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[32];
};

/** @brief Payload for ValveOpened / ValveClosed. */
struct ValveEventPayload {
    uint8_t valveId;
    uint8_t zoneId;
    uint8_t pin;
    uint32_t tsMs;
    float waterL;         // closed only: litres accumulated while open
    uint32_t durationSec; // closed only: open duration
    uint16_t session;     // zone session that opened the valve
};

/** @brief Payload for FlowSampled. */
struct FlowSamplePayload {
    uint32_t tsMs;
    float rateLpm;
    float volumeL;
};

/** @brief Raw ultrasonic outcome carried by TankDistanceMeasured. */
enum class TankReadingStatus : uint8_t {
    Ok = 0,
    OutOfRange = 1,
    NoReading = 2,
};

/** @brief Payload for TankDistanceMeasured. */
struct TankDistancePayload {
    uint8_t tankId;
    TankReadingStatus status;
    float distanceMm;
    uint32_t tsMs;
};

/** @brief Payload for TankLevelChanged. */
struct TankLevelPayload {
    uint8_t tankId;
    float levelMm;
    float percent;
};

/** @brief Payload for TankAggregateChanged. */
struct TankAggregatePayload {
    float percent;
    uint8_t tanksReporting;
};

/** @brief Payload for LeakDetected / LeakCleared. */
struct LeakPayload {
    uint32_t tsMs;
    uint8_t nonZeroPct;
    uint8_t samples;
};

/** @brief Why a zone changed state. */
enum class ZoneChangeReason : uint8_t {
    Request = 0,
    Expired = 1,
    Evicted = 2,
    Disabled = 3,
    PowerOff = 4,
    Reverted = 5,
    Shutdown = 6,
};

/** @brief Payload for ZoneStateChanged. */
struct ZoneStatePayload {
    uint8_t zoneId;
    bool active;
    ZoneChangeReason reason;
    uint32_t remainingSec;
};

/** @brief Payload for ZoneCountdown. */
struct ZoneCountdownPayload {
    uint8_t zoneId;
    uint8_t openValve;   // index within the zone, 0xFF when none
    uint32_t remainingSec;
};

/** @brief Payload for ZoneSessionEnded. */
struct ZoneSessionPayload {
    uint8_t zoneId;
    float waterL;
    uint32_t durationSec;
};

/** @brief Which zone setting changed. */
enum class ZoneConfigField : uint8_t {
    Name = 0,
    Enabled = 1,
    Runtime = 2,
};

/** @brief Payload for ZoneConfigChanged. */
struct ZoneConfigPayload {
    uint8_t zoneId;
    ZoneConfigField field;
};

/** @brief Payload for PowerChanged. */
struct PowerPayload {
    bool power;
    uint32_t pauseUntil; // epoch seconds, 0 = none
};
