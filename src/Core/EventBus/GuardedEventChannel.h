#pragma once
/**
 * @file GuardedEventChannel.h
 * @brief EventChannel adapter that runs every subscriber under a module mutex.
 *
 * A module owning non thread-safe core objects hands this channel to them.
 * Posts go straight to the underlying bus; callbacks delivered by the
 * eventbus task first take the owner's mutex, so they serialize with the
 * owner's own task and with its command handlers.
 */
#include "EventChannel.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

class GuardedEventChannel : public EventChannel {
public:
    GuardedEventChannel() = default;

    /** @brief Bind to the shared bus and the owner's mutex (call once in init). */
    void bind(EventChannel* bus, SemaphoreHandle_t mutex);

    bool subscribe(EventId id, EventCallback cb, void* user) override;
    bool post(EventId id, const void* payload = nullptr, size_t len = 0) override;

private:
    struct Slot {
        GuardedEventChannel* owner = nullptr;
        EventCallback cb = nullptr;
        void* user = nullptr;
    };

    static void trampoline_(const Event& e, void* user);

    EventChannel* bus_ = nullptr;
    SemaphoreHandle_t mutex_ = nullptr;
    Slot slots_[Limits::GuardedSubscribers];
    uint8_t slotCount_ = 0;
};
