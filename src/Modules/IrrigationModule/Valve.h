#pragma once
/**
 * @file Valve.h
 * @brief One relay-driven irrigation valve.
 *
 * While open the valve adds every FlowSampled volume to its running total;
 * the total is reported once in the ValveClosed event and then reset.
 * A valve without relay pin is a configuration gap: open/close do nothing.
 */
#include <stdint.h>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Services/IIO.h"

class Valve {
public:
    Valve() = default;

    /** @brief Bind identity, relay and collaborators. Subscribes to flow once. */
    void configure(uint8_t id, uint8_t zoneId, uint8_t relayPin, const IOService* io, EventChannel* bus);

    /** @brief Energize the relay and start a new usage record tagged with session. */
    bool open(uint32_t nowMs, uint16_t session = 0);
    /** @brief De-energize the relay and publish the usage record. */
    bool close(uint32_t nowMs);
    /** @brief Close if open, otherwise just drive the relay inactive. Silent when already closed. */
    void forceOff(uint32_t nowMs);

    bool isOpen() const { return open_; }
    bool hasRelay() const { return pin_ != IO_PIN_NONE; }
    bool configured() const { return configured_; }
    uint8_t id() const { return id_; }
    uint8_t zoneId() const { return zoneId_; }
    uint8_t pin() const { return pin_; }
    float waterL() const { return waterL_; }
    uint32_t openedAtMs() const { return openedAtMs_; }
    uint16_t session() const { return session_; }

private:
    static void onEventStatic_(const Event& e, void* user);
    void onFlow_(const FlowSamplePayload& p);
    bool driveRelay_(bool on);

    uint8_t id_ = 0;
    uint8_t zoneId_ = 0;
    uint8_t pin_ = IO_PIN_NONE;
    const IOService* io_ = nullptr;
    EventChannel* bus_ = nullptr;
    bool configured_ = false;
    bool subscribed_ = false;

    bool open_ = false;
    uint32_t openedAtMs_ = 0;
    float waterL_ = 0.0f;
    uint16_t session_ = 0;
};
