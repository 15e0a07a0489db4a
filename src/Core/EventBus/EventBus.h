#pragma once
/**
 * @file EventBus.h
 * @brief Queued event bus with fixed-size payloads, backed by a FreeRTOS queue.
 */
#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include "EventChannel.h"
#include "Core/SystemLimits.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#ifndef EVENTBUS_PROFILE
#define EVENTBUS_PROFILE 1
#endif

#ifndef EVENTBUS_HANDLER_WARN_US
#define EVENTBUS_HANDLER_WARN_US 5000  // 5ms
#endif

#ifndef EVENTBUS_DISPATCH_WARN_US
#define EVENTBUS_DISPATCH_WARN_US 20000 // 20ms for a batch
#endif

#ifndef EVENTBUS_WARN_MIN_INTERVAL_MS
#define EVENTBUS_WARN_MIN_INTERVAL_MS 2000
#endif

/**
 * @brief Thread-safe event queue with subscriber dispatch.
 *
 * Posting never blocks; a full queue drops the event and counts it.
 */
class EventBus : public EventChannel {
public:
    static constexpr uint16_t MAX_SUBSCRIBERS = Limits::EventSubscribers;
    static constexpr uint8_t MAX_PAYLOAD_SIZE = 48;
    static constexpr uint8_t QUEUE_LENGTH = Limits::EventQueueLen;

    EventBus();
    ~EventBus() override;

    /** @brief Subscribe to an event id (not thread-safe; call during init). */
    bool subscribe(EventId id, EventCallback cb, void* user) override;

    /** @brief Post an event from any task; payload is copied into the queue. */
    bool post(EventId id, const void* payload = nullptr, size_t len = 0) override;

    /** @brief Dispatch up to maxEvents queued events to subscribers. */
    void dispatch(uint16_t maxEvents = 8);

    uint32_t droppedCount() const { return dropped_; }

private:
    struct Subscriber {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct QueuedEvent {
        EventId id;
        uint8_t len;
        uint8_t data[MAX_PAYLOAD_SIZE];
    };

    static bool fill_(QueuedEvent& qe, EventId id, const void* payload, size_t len);
    void dispatchOne_(const QueuedEvent& qe);

    Subscriber subs_[MAX_SUBSCRIBERS];
    uint16_t count_ = 0;
    QueueHandle_t queue_ = nullptr;
    volatile uint32_t dropped_ = 0;
};
