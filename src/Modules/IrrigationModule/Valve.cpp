/**
 * @file Valve.cpp
 * @brief Implementation file.
 */
#include "Valve.h"
#define LOG_TAG "Valve"
#include "Core/ModuleLog.h"

void Valve::configure(uint8_t id, uint8_t zoneId, uint8_t relayPin, const IOService* io, EventChannel* bus)
{
    id_ = id;
    zoneId_ = zoneId;
    pin_ = relayPin;
    io_ = io;
    bus_ = bus;
    open_ = false;
    waterL_ = 0.0f;
    configured_ = true;

    if (!hasRelay()) {
        LOGW("No relay pin for valve %u (zone %u)", (unsigned)id_, (unsigned)zoneId_);
        return;
    }

    // Start from a known state: relay released.
    driveRelay_(false);

    if (bus_ && !subscribed_) {
        subscribed_ = bus_->subscribe(EventId::FlowSampled, &Valve::onEventStatic_, this);
        if (!subscribed_) LOGW("Valve %u cannot track flow", (unsigned)id_);
    }
}

bool Valve::driveRelay_(bool on)
{
    if (!io_) return false;
    const bool ok = on ? (io_->openRelay && io_->openRelay(io_->ctx, pin_))
                       : (io_->closeRelay && io_->closeRelay(io_->ctx, pin_));
    if (!ok) LOGE("Relay pin %u write failed (%s)", (unsigned)pin_, on ? "open" : "close");
    return ok;
}

bool Valve::open(uint32_t nowMs, uint16_t session)
{
    if (!hasRelay()) return false;
    if (open_) return true;

    if (!driveRelay_(true)) return false;

    open_ = true;
    openedAtMs_ = nowMs;
    waterL_ = 0.0f;
    session_ = session;
    LOGD("Valve %u open (pin %u)", (unsigned)id_, (unsigned)pin_);

    if (bus_) {
        ValveEventPayload p{};
        p.valveId = id_;
        p.zoneId = zoneId_;
        p.pin = pin_;
        p.tsMs = nowMs;
        p.session = session_;
        bus_->post(EventId::ValveOpened, &p, sizeof(p));
    }
    return true;
}

bool Valve::close(uint32_t nowMs)
{
    if (!hasRelay()) return false;

    const bool relayOk = driveRelay_(false);

    const uint32_t durationSec = open_ ? (uint32_t)(nowMs - openedAtMs_) / 1000U : 0U;
    if (bus_) {
        ValveEventPayload p{};
        p.valveId = id_;
        p.zoneId = zoneId_;
        p.pin = pin_;
        p.tsMs = nowMs;
        p.waterL = waterL_;
        p.durationSec = durationSec;
        p.session = session_;
        bus_->post(EventId::ValveClosed, &p, sizeof(p));
    }

    if (durationSec > 0) {
        LOGD("Valve %u recorded %.3fL over %lus (avg %.3fLPM)",
             (unsigned)id_, (double)waterL_, (unsigned long)durationSec,
             (double)(waterL_ / (float)durationSec * 60.0f));
    } else {
        LOGD("Valve %u closed (pin %u)", (unsigned)id_, (unsigned)pin_);
    }

    open_ = false;
    openedAtMs_ = 0;
    waterL_ = 0.0f;
    return relayOk;
}

void Valve::forceOff(uint32_t nowMs)
{
    if (!hasRelay()) return;
    if (open_) {
        close(nowMs);
        return;
    }
    driveRelay_(false);
}

void Valve::onEventStatic_(const Event& e, void* user)
{
    Valve* self = static_cast<Valve*>(user);
    if (!self || e.id != EventId::FlowSampled) return;
    const FlowSamplePayload* p = eventPayload<FlowSamplePayload>(e);
    if (p) self->onFlow_(*p);
}

void Valve::onFlow_(const FlowSamplePayload& p)
{
    if (!open_) return;
    if (!(p.volumeL > 0.0f)) return;
    waterL_ += p.volumeL;
}
