#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // Configuration
    ConfigChanged = 100,

    // Valves
    ValveOpened = 300,
    ValveClosed = 301,

    // Flow sensor
    FlowSampled = 310,

    // Tanks
    TankDistanceMeasured = 320,
    TankLevelChanged = 321,
    TankAggregateChanged = 322,

    // Leak heuristic
    LeakDetected = 330,
    LeakCleared = 331,

    // Zones
    ZoneStateChanged = 340,
    ZoneCountdown = 341,
    ZoneSessionEnded = 342,
    ZoneConfigChanged = 343,

    // System power / pause
    PowerChanged = 350,
};
