#pragma once
/**
 * @file FlowSampler.h
 * @brief Turns flow-meter pulses into rate and volume samples.
 */
#include <stdint.h>
#include <atomic>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"

class FlowSampler {
public:
    explicit FlowSampler(EventChannel* bus = nullptr) : bus_(bus) {}

    void setBus(EventChannel* bus) { bus_ = bus; }
    /** @brief L/min produced by a 1 Hz pulse train (sensor K factor inverse). */
    void setCalibration(float lpmPerHz) { lpmPerHz_ = lpmPerHz; }
    float calibration() const { return lpmPerHz_; }

    /** @brief Reset the counter and anchor the first interval at nowMs. */
    void begin(uint32_t nowMs);
    bool started() const { return started_; }

    /** @brief Count one pulse. ISR-safe. */
    void onPulse() { pulses_.fetch_add(1U, std::memory_order_relaxed); }

    /**
     * @brief Close the running interval if at least periodMs elapsed.
     * Publishes FlowSampled and fills out when provided.
     * @return true when a sample was produced.
     */
    bool sample(uint32_t nowMs, uint32_t periodMs, FlowSamplePayload* out = nullptr);

    /** @brief Pure conversion used by sample(). */
    static void compute(uint32_t pulses, uint32_t elapsedMs, float lpmPerHz, float& rateLpm, float& volumeL);

    float lastRateLpm() const { return lastRateLpm_; }
    float totalVolumeL() const { return totalVolumeL_; }

private:
    EventChannel* bus_ = nullptr;
    std::atomic<uint32_t> pulses_{0};
    float lpmPerHz_ = 0.0f;
    bool started_ = false;
    uint32_t anchorMs_ = 0;
    float lastRateLpm_ = 0.0f;
    float totalVolumeL_ = 0.0f;
};
