/**
 * @file GuardedEventChannel.cpp
 * @brief Implementation file.
 */
#include "GuardedEventChannel.h"
#include "Core/Log.h"

#define LOG_TAG_CORE "EvGuard"

void GuardedEventChannel::bind(EventChannel* bus, SemaphoreHandle_t mutex) {
    bus_ = bus;
    mutex_ = mutex;
}

bool GuardedEventChannel::subscribe(EventId id, EventCallback cb, void* user) {
    if (!bus_ || !cb) return false;
    if (slotCount_ >= Limits::GuardedSubscribers) {
        Log::error(LOG_TAG_CORE, "guarded slots full (event=%u)", (unsigned)id);
        return false;
    }

    Slot& s = slots_[slotCount_];
    s.owner = this;
    s.cb = cb;
    s.user = user;
    if (!bus_->subscribe(id, &GuardedEventChannel::trampoline_, &s)) return false;
    slotCount_++;
    return true;
}

bool GuardedEventChannel::post(EventId id, const void* payload, size_t len) {
    if (!bus_) return false;
    return bus_->post(id, payload, len);
}

void GuardedEventChannel::trampoline_(const Event& e, void* user) {
    Slot* s = static_cast<Slot*>(user);
    if (!s || !s->owner || !s->cb) return;

    SemaphoreHandle_t m = s->owner->mutex_;
    if (m && xSemaphoreTake(m, portMAX_DELAY) != pdTRUE) return;
    s->cb(e, s->user);
    if (m) xSemaphoreGive(m);
}
