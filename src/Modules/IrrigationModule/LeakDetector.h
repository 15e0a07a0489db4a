#pragma once
/**
 * @file LeakDetector.h
 * @brief Sliding-window leak heuristic over flow samples.
 *
 * With no zone running, flow in more than LeakNonZeroPct of the window's
 * samples raises the leak flag, provided the last valve close is older than
 * the settle time. A window with no flow at all clears it. The flag is frozen
 * while any zone runs. Only transitions are published.
 */
#include <stdint.h>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"

struct LeakDetectorConfig {
    uint32_t windowMs = IrrigationDefaults::LeakWindowMs;
    uint32_t settleMs = IrrigationDefaults::LeakSettleMs;
    uint8_t nonZeroPct = IrrigationDefaults::LeakNonZeroPct;
};

class LeakDetector {
public:
    explicit LeakDetector(EventChannel* bus = nullptr) : bus_(bus) {}

    void setBus(EventChannel* bus) { bus_ = bus; }
    void setConfig(const LeakDetectorConfig& cfg) { cfg_ = cfg; }

    /** @brief Subscribe to flow, valve-close, zone-state and countdown events. */
    bool attach();

    /** @brief Feed one sample (called by the event handler, public for tests). */
    void onFlowSample(const FlowSamplePayload& s);
    void onValveClosed(uint32_t tsMs);
    void onZoneState(uint8_t zoneId, bool active);

    bool leak() const { return leak_; }
    uint8_t sampleCount() const { return count_; }
    uint8_t activeZones() const;
    /** @brief Share of buffered samples with flow, 0..100. */
    uint8_t nonZeroPct() const;

    void reset();

private:
    static void onEventStatic_(const Event& e, void* user);
    void push_(const FlowSamplePayload& s);
    void evict_(uint32_t newestMs);
    const FlowSamplePayload& at_(uint8_t i) const;

    EventChannel* bus_ = nullptr;
    LeakDetectorConfig cfg_{};

    FlowSamplePayload ring_[Limits::Irrigation::LeakSampleSlots]{};
    uint8_t head_ = 0;   // oldest
    uint8_t count_ = 0;

    bool leak_ = false;
    bool anyClose_ = false;
    uint32_t lastCloseMs_ = 0;
    uint32_t activeMask_ = 0;
};
