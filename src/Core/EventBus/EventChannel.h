#pragma once
/**
 * @file EventChannel.h
 * @brief Publish/subscribe seam shared by the FreeRTOS EventBus and host builds.
 *
 * Irrigation core components only ever see this interface. On target it is
 * backed by EventBus (queued, dispatched from the eventbus task); in tests a
 * plain in-memory queue implements it.
 */
#include <stdint.h>
#include <stddef.h>

#include "EventId.h"

/** @brief Event delivered to subscribers during dispatch. */
struct Event {
    EventId id;
    const void* payload;
    size_t len;
};

/** @brief Callback signature for event subscribers. */
using EventCallback = void(*)(const Event& e, void* user);

/** @brief Abstract event channel. Payloads are copied on post. */
class EventChannel {
public:
    virtual ~EventChannel() = default;

    virtual bool subscribe(EventId id, EventCallback cb, void* user) = 0;
    virtual bool post(EventId id, const void* payload = nullptr, size_t len = 0) = 0;
};

/** @brief Typed payload access; returns nullptr when the size does not match. */
template <typename T>
inline const T* eventPayload(const Event& e) {
    if (!e.payload || e.len != sizeof(T)) return nullptr;
    return static_cast<const T*>(e.payload);
}
