/**
 * @file EventBus.cpp
 * @brief Implementation file.
 */
#include "EventBus.h"
#include <Arduino.h>  // micros(), millis()
#include "Core/Log.h"

#define LOG_TAG_CORE "EventBus"

#if EVENTBUS_PROFILE
static uint32_t g_lastWarnMs = 0;
static bool canWarnNow() {
    uint32_t now = millis();
    if ((uint32_t)(now - g_lastWarnMs) < EVENTBUS_WARN_MIN_INTERVAL_MS) return false;
    g_lastWarnMs = now;
    return true;
}
#endif

EventBus::EventBus() {
    queue_ = xQueueCreate(QUEUE_LENGTH, sizeof(QueuedEvent));
}

EventBus::~EventBus() {
    if (queue_) vQueueDelete(queue_);
}

bool EventBus::subscribe(EventId id, EventCallback cb, void* user) {
    if (cb == nullptr) return false;
    if (count_ >= MAX_SUBSCRIBERS) {
        Log::error(LOG_TAG_CORE, "subscriber table full (event=%u)", (unsigned)id);
        return false;
    }

    subs_[count_].id = id;
    subs_[count_].cb = cb;
    subs_[count_].user = user;
    count_++;
    return true;
}

bool EventBus::fill_(QueuedEvent& qe, EventId id, const void* payload, size_t len) {
    if (len > MAX_PAYLOAD_SIZE) return false;
    qe.id = id;
    qe.len = static_cast<uint8_t>(len);
    if (len > 0 && payload != nullptr) {
        memcpy(qe.data, payload, len);
    }
    return true;
}

bool EventBus::post(EventId id, const void* payload, size_t len) {
    if (queue_ == nullptr) return false;

    QueuedEvent qe;
    if (!fill_(qe, id, payload, len)) return false;

    /// non-blocking send (0 ticks) to keep real-time constraints
    if (xQueueSend(queue_, &qe, 0) != pdTRUE) {
        dropped_ = dropped_ + 1;
#if EVENTBUS_PROFILE
        if (canWarnNow()) Log::warn(LOG_TAG_CORE, "queue full, dropped event=%u", (unsigned)id);
#endif
        return false;
    }
    return true;
}

void EventBus::dispatch(uint16_t maxEvents) {
    if (queue_ == nullptr) return;

#if EVENTBUS_PROFILE
    const uint32_t tDispatch0 = micros();
    uint16_t dispatched = 0;
#endif

    for (uint16_t i = 0; i < maxEvents; i++) {
        QueuedEvent qe;
        if (xQueueReceive(queue_, &qe, 0) != pdTRUE) break;

        dispatchOne_(qe);

#if EVENTBUS_PROFILE
        dispatched++;
#endif
    }

#if EVENTBUS_PROFILE
    const uint32_t dt = (uint32_t)(micros() - tDispatch0);
    if (dispatched > 0 && dt > EVENTBUS_DISPATCH_WARN_US && canWarnNow()) {
        Log::warn(LOG_TAG_CORE, "dispatch slow: %u events dt=%lu us", (unsigned)dispatched, (unsigned long)dt);
    }
#endif
}

void EventBus::dispatchOne_(const QueuedEvent& qe) {
    Event e;
    e.id = qe.id;
    e.payload = (qe.len > 0) ? qe.data : nullptr;
    e.len = qe.len;

    for (uint16_t i = 0; i < count_; i++) {
        if (subs_[i].id != qe.id || subs_[i].cb == nullptr) continue;

#if EVENTBUS_PROFILE
        const uint32_t t0 = micros();
#endif

        subs_[i].cb(e, subs_[i].user);

#if EVENTBUS_PROFILE
        const uint32_t dt = (uint32_t)(micros() - t0);
        if (dt > EVENTBUS_HANDLER_WARN_US && canWarnNow()) {
            Log::warn(LOG_TAG_CORE, "slow handler: event=%u user=%p dt=%lu us",
                      (unsigned)qe.id, subs_[i].user, (unsigned long)dt);
        }
#endif
    }
}
