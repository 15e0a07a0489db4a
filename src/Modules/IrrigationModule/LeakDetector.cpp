/**
 * @file LeakDetector.cpp
 * @brief Implementation file.
 */
#include "LeakDetector.h"
#define LOG_TAG "LeakDet"
#include "Core/ModuleLog.h"

static_assert(Limits::Irrigation::MaxZones <= 32, "zone mask is 32 bits");

bool LeakDetector::attach()
{
    if (!bus_) return false;
    bool ok = bus_->subscribe(EventId::FlowSampled, &LeakDetector::onEventStatic_, this);
    ok = bus_->subscribe(EventId::ValveClosed, &LeakDetector::onEventStatic_, this) && ok;
    ok = bus_->subscribe(EventId::ZoneStateChanged, &LeakDetector::onEventStatic_, this) && ok;
    ok = bus_->subscribe(EventId::ZoneCountdown, &LeakDetector::onEventStatic_, this) && ok;
    return ok;
}

void LeakDetector::reset()
{
    head_ = 0;
    count_ = 0;
    leak_ = false;
    anyClose_ = false;
    lastCloseMs_ = 0;
    activeMask_ = 0;
}

uint8_t LeakDetector::activeZones() const
{
    uint8_t n = 0;
    for (uint32_t m = activeMask_; m; m &= (m - 1)) n++;
    return n;
}

const FlowSamplePayload& LeakDetector::at_(uint8_t i) const
{
    return ring_[(uint8_t)((head_ + i) % Limits::Irrigation::LeakSampleSlots)];
}

void LeakDetector::push_(const FlowSamplePayload& s)
{
    if (count_ == Limits::Irrigation::LeakSampleSlots) {
        head_ = (uint8_t)((head_ + 1) % Limits::Irrigation::LeakSampleSlots);
        count_--;
    }
    ring_[(uint8_t)((head_ + count_) % Limits::Irrigation::LeakSampleSlots)] = s;
    count_++;
}

void LeakDetector::evict_(uint32_t newestMs)
{
    while (count_ > 1 && (uint32_t)(newestMs - at_(0).tsMs) > cfg_.windowMs) {
        head_ = (uint8_t)((head_ + 1) % Limits::Irrigation::LeakSampleSlots);
        count_--;
    }
}

uint8_t LeakDetector::nonZeroPct() const
{
    if (count_ == 0) return 0;
    uint16_t nonZero = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (at_(i).volumeL != 0.0f) nonZero++;
    }
    return (uint8_t)((nonZero * 100U) / count_);
}

void LeakDetector::onValveClosed(uint32_t tsMs)
{
    anyClose_ = true;
    lastCloseMs_ = tsMs;
}

void LeakDetector::onZoneState(uint8_t zoneId, bool active)
{
    if (zoneId >= 32) return;
    if (active) activeMask_ |= (1UL << zoneId);
    else activeMask_ &= ~(1UL << zoneId);
}

void LeakDetector::onFlowSample(const FlowSamplePayload& s)
{
    push_(s);
    evict_(s.tsMs);

    if (activeMask_ != 0) return;

    // Exact ratio test: nonZero * 100 > pct * count.
    uint16_t nonZero = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (at_(i).volumeL != 0.0f) nonZero++;
    }

    const bool settled = !anyClose_ || (uint32_t)(s.tsMs - lastCloseMs_) > cfg_.settleMs;
    LeakPayload p{};
    p.tsMs = s.tsMs;
    p.samples = count_;
    p.nonZeroPct = count_ ? (uint8_t)((nonZero * 100U) / count_) : 0;

    if (!leak_ && settled && count_ > 0 &&
        (uint32_t)nonZero * 100U > (uint32_t)cfg_.nonZeroPct * count_) {
        leak_ = true;
        LOGW("Detected suspected water leak (%u%% of %u samples with flow)",
             (unsigned)p.nonZeroPct, (unsigned)p.samples);
        if (bus_) bus_->post(EventId::LeakDetected, &p, sizeof(p));
        return;
    }

    if (leak_ && nonZero == 0) {
        leak_ = false;
        LOGI("Suspected water leak has cleared");
        if (bus_) bus_->post(EventId::LeakCleared, &p, sizeof(p));
    }
}

void LeakDetector::onEventStatic_(const Event& e, void* user)
{
    LeakDetector* self = static_cast<LeakDetector*>(user);
    if (!self) return;

    switch (e.id) {
    case EventId::FlowSampled: {
        const FlowSamplePayload* p = eventPayload<FlowSamplePayload>(e);
        if (p) self->onFlowSample(*p);
        break;
    }
    case EventId::ValveClosed: {
        const ValveEventPayload* p = eventPayload<ValveEventPayload>(e);
        if (p) self->onValveClosed(p->tsMs);
        break;
    }
    case EventId::ZoneStateChanged: {
        const ZoneStatePayload* p = eventPayload<ZoneStatePayload>(e);
        if (p) self->onZoneState(p->zoneId, p->active);
        break;
    }
    case EventId::ZoneCountdown: {
        // Countdowns only run for active zones: resync a missed activation.
        const ZoneCountdownPayload* p = eventPayload<ZoneCountdownPayload>(e);
        if (p) self->onZoneState(p->zoneId, true);
        break;
    }
    default:
        break;
    }
}
