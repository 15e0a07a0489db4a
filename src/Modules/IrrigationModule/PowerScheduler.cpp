/**
 * @file PowerScheduler.cpp
 * @brief Implementation file.
 */
#include "PowerScheduler.h"
#define LOG_TAG "PowerSch"
#include "Core/ModuleLog.h"
#include "Domain/IrrigationDefaults.h"

bool PowerScheduler::clockValid(uint32_t nowEpochSec)
{
    return nowEpochSec >= IrrigationDefaults::MinValidEpoch;
}

uint32_t PowerScheduler::computePauseUntil(uint32_t nowEpochSec, uint8_t days, int32_t utcOffsetSec)
{
    if (days == 0 || days > IrrigationDefaults::PauseMaxDays) return 0;

    const int64_t local = (int64_t)nowEpochSec + utcOffsetSec;
    const int64_t day = IrrigationDefaults::SecondsPerDay;
    int64_t intoDay = local % day;
    if (intoDay < 0) intoDay += day;

    const int64_t toMidnight = day - intoDay;
    return (uint32_t)((int64_t)nowEpochSec + toMidnight + (int64_t)(days - 1) * day);
}

void PowerScheduler::begin(bool power, uint32_t pauseUntil)
{
    pauseUntil_ = pauseUntil;
    power_ = power && pauseUntil == 0;
    zones_.setPowered(power_);
    LOGI("Irrigation system %s%s", power_ ? "on" : "off", pauseUntil_ ? " (paused)" : "");
}

bool PowerScheduler::setPower(bool on, uint32_t nowMs)
{
    const bool wasPower = power_;
    const uint32_t wasPause = pauseUntil_;

    if (on) {
        pauseUntil_ = 0;
        power_ = true;
        zones_.setPowered(true);
    } else {
        // Stop zones while still powered so every stop goes through the normal path.
        zones_.deactivateAll(nowMs, ZoneChangeReason::PowerOff);
        zones_.setPowered(false);
        power_ = false;
    }

    if (wasPower != power_) LOGI("Irrigation system turned %s", power_ ? "on" : "off");
    if (wasPower != power_ || wasPause != pauseUntil_) post_();
    return true;
}

bool PowerScheduler::setPause(uint32_t untilEpochSec, uint32_t nowEpochSec, uint32_t nowMs)
{
    if (untilEpochSec == 0) {
        if (pauseUntil_ == 0) return true;
        pauseUntil_ = 0;
        LOGI("Pause cleared");
        post_();
        return true;
    }

    if (!clockValid(nowEpochSec)) {
        LOGW("Pause rejected, clock not set");
        return false;
    }
    if (untilEpochSec <= nowEpochSec) {
        LOGW("Pause rejected, deadline %lu not in the future", (unsigned long)untilEpochSec);
        return false;
    }

    pauseUntil_ = untilEpochSec;
    LOGI("Irrigation paused for %lus", (unsigned long)(untilEpochSec - nowEpochSec));

    if (power_) {
        zones_.deactivateAll(nowMs, ZoneChangeReason::PowerOff);
        zones_.setPowered(false);
        power_ = false;
    }
    post_();
    return true;
}

bool PowerScheduler::pauseForDays(uint8_t days, uint32_t nowEpochSec, int32_t utcOffsetSec, uint32_t nowMs)
{
    const uint32_t until = computePauseUntil(nowEpochSec, days, utcOffsetSec);
    if (until == 0) return false;
    return setPause(until, nowEpochSec, nowMs);
}

bool PowerScheduler::tick(uint32_t nowEpochSec, uint32_t nowMs)
{
    if (pauseUntil_ == 0) return false;
    if (!clockValid(nowEpochSec)) return false;
    if (nowEpochSec < pauseUntil_) return false;

    LOGI("Pause elapsed, resuming irrigation");
    setPower(true, nowMs);
    return true;
}

void PowerScheduler::post_()
{
    if (!bus_) return;
    PowerPayload p{};
    p.power = power_;
    p.pauseUntil = pauseUntil_;
    bus_->post(EventId::PowerChanged, &p, sizeof(p));
}
