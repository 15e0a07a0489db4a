#pragma once
/**
 * @file TestEventChannel.h
 * @brief In-memory EventChannel for host tests.
 *
 * post() queues a copy of the payload and records it; dispatch() drains the
 * queue, including events posted by subscribers while draining.
 */
#include <stdint.h>
#include <string.h>

#include "Core/EventBus/EventChannel.h"

class TestEventChannel : public EventChannel {
public:
    static constexpr size_t MaxPayload = 48;
    static constexpr uint16_t MaxSubscribers = 96;
    static constexpr uint16_t MaxQueued = 256;
    static constexpr uint16_t MaxRecorded = 1024;

    bool subscribe(EventId id, EventCallback cb, void* user) override
    {
        if (!cb || subCount_ >= MaxSubscribers) return false;
        subs_[subCount_++] = {id, cb, user};
        return true;
    }

    bool post(EventId id, const void* payload = nullptr, size_t len = 0) override
    {
        if (len > MaxPayload || (len > 0 && !payload)) return false;
        if (queued_ >= MaxQueued) return false;

        Slot& q = queue_[(uint16_t)((head_ + queued_) % MaxQueued)];
        fill_(q, id, payload, len);
        queued_++;

        if (recCount_ < MaxRecorded) fill_(rec_[recCount_++], id, payload, len);
        return true;
    }

    /** @brief Deliver queued events in order. Returns the number delivered. */
    uint16_t dispatch()
    {
        uint16_t n = 0;
        while (queued_ > 0) {
            const Slot s = queue_[head_];
            head_ = (uint16_t)((head_ + 1) % MaxQueued);
            queued_--;

            const Event e{s.id, s.len ? s.data : nullptr, s.len};
            for (uint16_t i = 0; i < subCount_; ++i) {
                if (subs_[i].id == s.id) subs_[i].cb(e, subs_[i].user);
            }
            n++;
        }
        return n;
    }

    uint16_t pending() const { return queued_; }
    uint16_t subscriberCount() const { return subCount_; }

    uint16_t count(EventId id) const
    {
        uint16_t n = 0;
        for (uint16_t i = 0; i < recCount_; ++i) if (rec_[i].id == id) n++;
        return n;
    }

    /** @brief Payload of the nth recorded event with this id (0 = first). */
    template <typename T>
    bool nth(EventId id, uint16_t index, T& out) const
    {
        for (uint16_t i = 0; i < recCount_; ++i) {
            if (rec_[i].id != id) continue;
            if (index-- != 0) continue;
            if (rec_[i].len != sizeof(T)) return false;
            memcpy(&out, rec_[i].data, sizeof(T));
            return true;
        }
        return false;
    }

    template <typename T>
    bool last(EventId id, T& out) const
    {
        const uint16_t n = count(id);
        if (n == 0) return false;
        return nth(id, (uint16_t)(n - 1), out);
    }

    void clearRecorded() { recCount_ = 0; }

    void reset()
    {
        subCount_ = 0;
        head_ = 0;
        queued_ = 0;
        recCount_ = 0;
    }

private:
    struct Sub {
        EventId id;
        EventCallback cb;
        void* user;
    };

    struct Slot {
        EventId id = EventId::None;
        size_t len = 0;
        alignas(8) uint8_t data[MaxPayload] = {0};
    };

    static void fill_(Slot& s, EventId id, const void* payload, size_t len)
    {
        s.id = id;
        s.len = len;
        if (len) memcpy(s.data, payload, len);
    }

    Sub subs_[MaxSubscribers]{};
    uint16_t subCount_ = 0;

    Slot queue_[MaxQueued]{};
    uint16_t head_ = 0;
    uint16_t queued_ = 0;

    Slot rec_[MaxRecorded]{};
    uint16_t recCount_ = 0;
};
