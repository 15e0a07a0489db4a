/**
 * @file RequestDebouncer.cpp
 * @brief Implementation file.
 */
#include "RequestDebouncer.h"
#include "PowerScheduler.h"
#include "ZoneController.h"
#define LOG_TAG "Debounce"
#include "Core/ModuleLog.h"

static bool isSystemType_(RequestSource s)
{
    return s == RequestSource::System || s == RequestSource::Switch;
}

bool RequestDebouncer::submit(const ActivationRequest& req, uint32_t nowMs)
{
    if (count_ >= Limits::Irrigation::DebounceBatch) {
        LOGW("Request batch full, dropping request (source=%u zone=%u)",
             (unsigned)req.source, (unsigned)req.zoneId);
        return false;
    }
    if (count_ == 0) windowStartMs_ = nowMs;
    batch_[count_++] = req;
    return true;
}

uint8_t RequestDebouncer::resolve(const ActivationRequest* batch, uint8_t count, uint8_t enabledZones, bool* suppressed)
{
    if (!batch || !suppressed) return 0;

    uint8_t systemCount = 0;
    uint8_t zoneCount = 0;
    for (uint8_t i = 0; i < count; ++i) {
        if (isSystemType_(batch[i].source)) systemCount++;
        else zoneCount++;
    }

    // System command fanned out to every zone: keep only the system action.
    const bool fanOut = (systemCount == 1 && zoneCount == enabledZones);
    // One zone toggled by hand must not flip system power.
    const bool singleZone = !fanOut && zoneCount == 1;

    uint8_t remaining = 0;
    for (uint8_t i = 0; i < count; ++i) {
        const bool drop = isSystemType_(batch[i].source) ? singleZone : fanOut;
        suppressed[i] = drop;
        if (!drop) remaining++;
    }
    return remaining;
}

bool RequestDebouncer::tick(uint32_t nowMs)
{
    if (count_ == 0) return false;
    if ((uint32_t)(nowMs - windowStartMs_) < IrrigationDefaults::DebounceWindowMs) return false;
    execute_(nowMs);
    return true;
}

void RequestDebouncer::execute_(uint32_t nowMs)
{
    bool suppressed[Limits::Irrigation::DebounceBatch] = {false};
    const uint8_t n = count_;
    const uint8_t kept = resolve(batch_, n, zones_.enabledCount(), suppressed);
    count_ = 0;

    LOGD("Resolving %u request(s), %u kept", (unsigned)n, (unsigned)kept);

    for (uint8_t i = 0; i < n; ++i) {
        const ActivationRequest& r = batch_[i];
        if (suppressed[i]) {
            if (r.source == RequestSource::Zone && r.on) zones_.scheduleRevert(r.zoneId, nowMs);
            continue;
        }

        if (isSystemType_(r.source)) {
            power_.setPower(r.on, nowMs);
        } else if (r.on) {
            zones_.activate(r.zoneId, nowMs);
        } else {
            zones_.deactivate(r.zoneId, nowMs);
        }
    }
}
