#pragma once
/**
 * @file PowerScheduler.h
 * @brief System power flag and timed pause.
 *
 * Power off always stops running zones first. A pause is an epoch deadline;
 * tick() turns power back on once it is reached, exactly once.
 */
#include <stdint.h>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"
#include "ZoneController.h"

class PowerScheduler {
public:
    explicit PowerScheduler(ZoneController& zones, EventChannel* bus = nullptr) : zones_(zones), bus_(bus) {}

    void setBus(EventChannel* bus) { bus_ = bus; }

    /** @brief Restore persisted state: power only stays on when no pause is pending. */
    void begin(bool power, uint32_t pauseUntil);

    bool setPower(bool on, uint32_t nowMs);
    /**
     * @brief Pause until an epoch second; 0 clears the pause.
     * Rejects deadlines not in the future and an unset clock.
     */
    bool setPause(uint32_t untilEpochSec, uint32_t nowEpochSec, uint32_t nowMs);
    /** @brief Pause until local midnight plus (days - 1) whole days, days 1..PauseMaxDays. */
    bool pauseForDays(uint8_t days, uint32_t nowEpochSec, int32_t utcOffsetSec, uint32_t nowMs);

    /** @brief Resume power when the pause deadline is reached. Returns true on resume. */
    bool tick(uint32_t nowEpochSec, uint32_t nowMs);

    bool powered() const { return power_; }
    uint32_t pauseUntil() const { return pauseUntil_; }

    /** @brief Deadline for pauseForDays(); 0 when days is out of range. */
    static uint32_t computePauseUntil(uint32_t nowEpochSec, uint8_t days, int32_t utcOffsetSec);
    static bool clockValid(uint32_t nowEpochSec);

private:
    void post_();

    ZoneController& zones_;
    EventChannel* bus_ = nullptr;
    bool power_ = false;
    uint32_t pauseUntil_ = 0;
};
