#pragma once
/**
 * @file TankLevel.h
 * @brief Ultrasonic tank level computation and multi-tank aggregation.
 *
 * The sensor sits at the top of the tank looking down. Its blind zone
 * (UsonicMinRangeMm) is mapped to "full" by rescaling the operating range
 * [blind zone, usable height] onto [0, usable height].
 */
#include <stdint.h>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Services/IIO.h"
#include "Core/SystemLimits.h"

struct TankGeometry {
    bool enabled = false;
    uint32_t sensorHeightMm = 0;   // sensor face to tank bottom
    uint32_t minimumLevelMm = 0;   // unusable water below the outlet
    uint8_t trigPin = IO_PIN_NONE;
    uint8_t echoPin = IO_PIN_NONE;
    uint32_t capacityL = 0;        // informational
};

struct TankLevelResult {
    float levelMm = 0.0f;
    float percent = 0.0f;
};

struct TankSnapshot {
    uint8_t id = 0;
    bool enabled = false;
    bool valid = false;
    bool hasReading = false;
    float levelMm = 0.0f;
    float percent = 0.0f;
    uint32_t lastReadingMs = 0;
    uint32_t failedReadings = 0;
};

/** @brief Complete geometry: enabled, pins set and usable height beyond the blind zone. */
bool tankGeometryValid(const TankGeometry& g);

/**
 * @brief Distance (mm) to level and percentage. Any finite input yields a
 * percentage within [0,100]. Returns false on invalid geometry or NaN input.
 */
bool computeTankLevel(const TankGeometry& g, float distanceMm, TankLevelResult& out);

class TankLevelAggregator {
public:
    static constexpr uint8_t MAX_TANKS = Limits::Tank::MaxTanks;

    explicit TankLevelAggregator(EventChannel* bus = nullptr) : bus_(bus) {}

    void setBus(EventChannel* bus) { bus_ = bus; }
    /** @brief Subscribe to TankDistanceMeasured. */
    bool attach();

    /** @brief Set geometry; the last reading is discarded when it changes. */
    bool defineTank(uint8_t tankId, const TankGeometry& g);
    const TankGeometry* geometry(uint8_t tankId) const;
    bool measurable(uint8_t tankId) const;

    /**
     * @brief Apply one raw measurement. Failed readings keep the last value.
     * @return true when the tank level was updated and published.
     */
    bool onDistance(const TankDistancePayload& p);

    /** @brief Clamped sum of the percentages of tanks that reported. false until one did. */
    bool aggregatePercent(float& out, uint8_t* reporting = nullptr) const;
    bool snapshot(uint8_t tankId, TankSnapshot& out) const;

private:
    struct Tank {
        TankGeometry geo{};
        bool hasReading = false;
        TankLevelResult last{};
        uint32_t lastReadingMs = 0;
        uint32_t failed = 0;
    };

    static void onEventStatic_(const Event& e, void* user);

    EventChannel* bus_ = nullptr;
    Tank tanks_[MAX_TANKS];
};
