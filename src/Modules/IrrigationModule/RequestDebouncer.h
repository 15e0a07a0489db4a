#pragma once
/**
 * @file RequestDebouncer.h
 * @brief Coalesces bursts of activation requests into the intended action.
 *
 * A voice "turn irrigation on" typically arrives as one system request plus
 * one request per zone within a few hundred milliseconds. Requests are
 * batched for DebounceWindowMs from the first one, then resolved:
 *  - exactly one system request and as many zone requests as enabled zones:
 *    the zone requests are dropped (their UI state is reverted);
 *  - otherwise, exactly one zone request: system requests are dropped.
 * Survivors execute in arrival order.
 */
#include <stdint.h>

#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"

class ZoneController;
class PowerScheduler;

enum class RequestSource : uint8_t {
    System = 0,
    Switch = 1,
    Zone = 2,
};

struct ActivationRequest {
    RequestSource source = RequestSource::System;
    uint8_t zoneId = 0;
    bool on = false;
};

class RequestDebouncer {
public:
    RequestDebouncer(ZoneController& zones, PowerScheduler& power) : zones_(zones), power_(power) {}

    /** @brief Queue a request; opens a window when none is pending. */
    bool submit(const ActivationRequest& req, uint32_t nowMs);
    /** @brief Resolve and execute the batch once its window has elapsed. */
    bool tick(uint32_t nowMs);

    bool pending() const { return count_ > 0; }
    uint8_t pendingCount() const { return count_; }

    /**
     * @brief Pure resolution: marks suppressed[i] for every dropped request.
     * @return number of requests left to execute.
     */
    static uint8_t resolve(const ActivationRequest* batch, uint8_t count, uint8_t enabledZones, bool* suppressed);

private:
    void execute_(uint32_t nowMs);

    ZoneController& zones_;
    PowerScheduler& power_;
    ActivationRequest batch_[Limits::Irrigation::DebounceBatch];
    uint8_t count_ = 0;
    uint32_t windowStartMs_ = 0;
};
