/**
 * @file ZoneController.cpp
 * @brief Implementation file.
 */
#include "ZoneController.h"
#define LOG_TAG "ZoneCtrl"
#include "Core/ModuleLog.h"
#include <stdio.h>
#include <string.h>
#include <stdlib.h>

ZoneController::~ZoneController()
{
    forceCloseAll(lastNowMs_);
}

uint8_t ZoneController::parsePins(const char* csv, uint8_t* out, uint8_t max)
{
    if (!csv || !out || max == 0) return 0;

    uint8_t n = 0;
    const char* p = csv;
    while (*p) {
        while (*p == ' ') ++p;
        if (*p == '\0') break;

        char* end = nullptr;
        const long v = strtol(p, &end, 10);
        if (end == p || v < 0 || v > 0xFE) return 0;
        if (n >= max) return 0;
        out[n++] = (uint8_t)v;

        p = end;
        while (*p == ' ') ++p;
        if (*p == ',') {
            ++p;
        } else if (*p != '\0') {
            return 0;
        }
    }
    return n;
}

bool ZoneController::defineZone(uint8_t zoneId, const ZoneDefinition& def, uint32_t nowMs)
{
    lastNowMs_ = nowMs;
    if (zoneId >= MAX_ZONES) return false;

    Zone& z = zones_[zoneId];
    if (z.active) stop_(zoneId, nowMs, ZoneChangeReason::Disabled);

    z.def = def;
    z.def.name[sizeof(z.def.name) - 1] = '\0';
    if (z.def.name[0] == '\0') {
        snprintf(z.def.name, sizeof(z.def.name), "Zone %u", (unsigned)(zoneId + 1));
    }
    if (z.def.runtimeSec == 0) z.def.runtimeSec = IrrigationDefaults::DefaultZoneRuntimeSec;
    if (z.def.runtimeSec > maxRuntimeSec_) z.def.runtimeSec = maxRuntimeSec_;
    if (z.def.pinCount > MAX_VALVES) z.def.pinCount = MAX_VALVES;

    // No pin list still yields one valve so the zone stays addressable.
    z.valveCount = z.def.pinCount ? z.def.pinCount : 1;
    for (uint8_t i = 0; i < z.valveCount; ++i) {
        const uint8_t pin = z.def.pinCount ? z.def.pins[i] : IO_PIN_NONE;
        z.valves[i].configure((uint8_t)(zoneId * MAX_VALVES + i), zoneId, pin, io_, bus_);
    }

    z.defined = true;
    z.revertPending = false;
    LOGI("Zone %u '%s' %s, %u valve(s), runtime %lus",
         (unsigned)zoneId, z.def.name, z.def.enabled ? "enabled" : "disabled",
         (unsigned)z.valveCount, (unsigned long)z.def.runtimeSec);
    return true;
}

uint8_t ZoneController::definedCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < MAX_ZONES; ++i) if (zones_[i].defined) n++;
    return n;
}

uint8_t ZoneController::enabledCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < MAX_ZONES; ++i) if (zones_[i].defined && zones_[i].def.enabled) n++;
    return n;
}

uint8_t ZoneController::activeCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < MAX_ZONES; ++i) if (zones_[i].defined && zones_[i].active) n++;
    return n;
}

bool ZoneController::activate(uint8_t zoneId, uint32_t nowMs)
{
    lastNowMs_ = nowMs;
    if (!isDefined(zoneId)) {
        LOGW("Activate: unknown zone %u", (unsigned)zoneId);
        return false;
    }

    Zone& z = zones_[zoneId];
    if (!z.def.enabled) {
        LOGW("Activate: zone '%s' is disabled", z.def.name);
        return false;
    }
    if (!powered_) {
        LOGI("Irrigation system is powered off, reverting zone '%s'", z.def.name);
        scheduleRevert(zoneId, nowMs);
        return false;
    }
    if (z.active) return true;

    while (activeCount() >= maxActive_) {
        uint8_t victim = MAX_ZONES;
        uint32_t least = 0;
        for (uint8_t i = 0; i < MAX_ZONES; ++i) {
            if (!zones_[i].defined || !zones_[i].active) continue;
            const uint32_t rem = (uint32_t)(zones_[i].endMs - nowMs);
            if (victim == MAX_ZONES || rem < least) {
                victim = i;
                least = rem;
            }
        }
        if (victim == MAX_ZONES) break;
        stop_(victim, nowMs, ZoneChangeReason::Evicted);
    }

    start_(zoneId, nowMs);
    return true;
}

void ZoneController::start_(uint8_t zoneId, uint32_t nowMs)
{
    Zone& z = zones_[zoneId];

    uint32_t runtimeSec = z.def.runtimeSec;
    if (runtimeSec > maxRuntimeSec_) runtimeSec = maxRuntimeSec_;
    if (runtimeSec == 0) runtimeSec = 1;

    z.generation++;
    z.session++;
    z.active = true;
    z.revertPending = false;
    z.startMs = nowMs;
    z.runtimeMs = runtimeSec * 1000U;
    z.endMs = nowMs + z.runtimeMs;
    z.nextTickMs = nowMs + IrrigationDefaults::ZoneTickMs;
    z.current = 0;
    z.waterL = 0.0f;
    z.durationSec = 0;

    z.valves[0].open(nowMs, z.session);

    LOGI("Zone '%s' turned on for %lus (%u valve%s)", z.def.name, (unsigned long)runtimeSec,
         (unsigned)z.valveCount, z.valveCount > 1 ? "s" : "");
    postState_(zoneId, true, ZoneChangeReason::Request, runtimeSec);
}

bool ZoneController::deactivate(uint8_t zoneId, uint32_t nowMs, ZoneChangeReason reason)
{
    lastNowMs_ = nowMs;
    if (!isDefined(zoneId)) {
        LOGW("Deactivate: unknown zone %u", (unsigned)zoneId);
        return false;
    }
    if (!zones_[zoneId].active) return true;
    stop_(zoneId, nowMs, reason);
    return true;
}

void ZoneController::stop_(uint8_t zoneId, uint32_t nowMs, ZoneChangeReason reason)
{
    Zone& z = zones_[zoneId];

    // Cancel the countdown before touching relays.
    z.generation++;
    z.active = false;

    for (uint8_t i = 0; i < z.valveCount; ++i) closeValve_(z, i, nowMs);

    postState_(zoneId, false, reason, 0);
    emitSummary_(zoneId);
}

void ZoneController::closeValve_(Zone& z, uint8_t idx, uint32_t nowMs)
{
    Valve& v = z.valves[idx];
    if (!v.isOpen()) return;
    // Credit the session before close() resets the valve's record.
    z.waterL += v.waterL();
    z.durationSec += (uint32_t)(nowMs - v.openedAtMs()) / 1000U;
    v.close(nowMs);
}

void ZoneController::deactivateAll(uint32_t nowMs, ZoneChangeReason reason)
{
    lastNowMs_ = nowMs;
    for (uint8_t i = 0; i < MAX_ZONES; ++i) {
        if (zones_[i].defined && zones_[i].active) stop_(i, nowMs, reason);
    }
}

void ZoneController::forceCloseAll(uint32_t nowMs)
{
    for (uint8_t i = 0; i < MAX_ZONES; ++i) {
        Zone& z = zones_[i];
        if (!z.defined) continue;

        const bool wasActive = z.active;
        z.generation++;
        z.active = false;
        z.revertPending = false;
        for (uint8_t v = 0; v < z.valveCount; ++v) z.valves[v].forceOff(nowMs);
        if (wasActive) postState_(i, false, ZoneChangeReason::Shutdown, 0);
    }
}

bool ZoneController::scheduleRevert(uint8_t zoneId, uint32_t nowMs)
{
    if (!isDefined(zoneId)) return false;
    Zone& z = zones_[zoneId];
    if (z.active) return false;

    z.revertPending = true;
    z.revertAtMs = nowMs + IrrigationDefaults::RevertDelayMs;
    z.revertGen = z.generation;
    return true;
}

uint32_t ZoneController::valveEndMs_(const Zone& z, uint8_t idx) const
{
    const uint32_t sliceMs = z.runtimeMs / z.valveCount;
    return z.endMs - sliceMs * (uint32_t)(z.valveCount - idx - 1);
}

uint32_t ZoneController::remainingSec_(const Zone& z, uint32_t nowMs) const
{
    if (!z.active || reached_(nowMs, z.endMs)) return 0;
    return (uint32_t)(z.endMs - nowMs) / 1000U;
}

void ZoneController::tick(uint32_t nowMs)
{
    lastNowMs_ = nowMs;
    for (uint8_t i = 0; i < MAX_ZONES; ++i) {
        Zone& z = zones_[i];
        if (!z.defined) continue;

        if (z.revertPending && reached_(nowMs, z.revertAtMs)) {
            z.revertPending = false;
            // Stale if the zone started or stopped since the revert was armed.
            if (!z.active && z.revertGen == z.generation) {
                postState_(i, false, ZoneChangeReason::Reverted, 0);
            }
        }

        if (z.active && reached_(nowMs, z.nextTickMs)) tickZone_(i, nowMs);
    }
}

void ZoneController::tickZone_(uint8_t zoneId, uint32_t nowMs)
{
    Zone& z = zones_[zoneId];
    while (reached_(nowMs, z.nextTickMs)) z.nextTickMs += IrrigationDefaults::ZoneTickMs;

    if (reached_(nowMs, z.endMs)) {
        LOGI("Zone '%s' runtime elapsed", z.def.name);
        stop_(zoneId, nowMs, ZoneChangeReason::Expired);
        return;
    }

    // Hand-off, cascading when ticks were missed.
    while (z.current + 1 < z.valveCount && reached_(nowMs, valveEndMs_(z, z.current))) {
        closeValve_(z, z.current, nowMs);
        z.current++;
        z.valves[z.current].open(nowMs, z.session);
        LOGD("Zone '%s' switched to valve %u/%u", z.def.name, (unsigned)(z.current + 1), (unsigned)z.valveCount);
    }

    if (bus_) {
        ZoneCountdownPayload p{};
        p.zoneId = zoneId;
        p.openValve = z.valves[z.current].isOpen() ? z.current : 0xFF;
        p.remainingSec = remainingSec_(z, nowMs);
        bus_->post(EventId::ZoneCountdown, &p, sizeof(p));
    }
}

void ZoneController::emitSummary_(uint8_t zoneId)
{
    const Zone& z = zones_[zoneId];
    LOGI("Zone '%s' turned off, used %.3fL over %lus",
         z.def.name, (double)z.waterL, (unsigned long)z.durationSec);

    if (bus_) {
        ZoneSessionPayload p{};
        p.zoneId = zoneId;
        p.waterL = z.waterL;
        p.durationSec = z.durationSec;
        bus_->post(EventId::ZoneSessionEnded, &p, sizeof(p));
    }
}

bool ZoneController::renameZone(uint8_t zoneId, const char* name)
{
    if (!isDefined(zoneId) || !name || name[0] == '\0') return false;

    Zone& z = zones_[zoneId];
    if (strncmp(z.def.name, name, sizeof(z.def.name) - 1) == 0 &&
        strlen(name) <= sizeof(z.def.name) - 1) {
        return true;
    }
    strncpy(z.def.name, name, sizeof(z.def.name) - 1);
    z.def.name[sizeof(z.def.name) - 1] = '\0';
    LOGI("Zone %u renamed to '%s'", (unsigned)zoneId, z.def.name);
    postConfig_(zoneId, ZoneConfigField::Name);
    return true;
}

bool ZoneController::setZoneEnabled(uint8_t zoneId, bool enabled, uint32_t nowMs)
{
    lastNowMs_ = nowMs;
    if (!isDefined(zoneId)) return false;

    Zone& z = zones_[zoneId];
    if (z.def.enabled == enabled) return true;
    if (!enabled && z.active) stop_(zoneId, nowMs, ZoneChangeReason::Disabled);

    z.def.enabled = enabled;
    LOGI("Zone '%s' %s", z.def.name, enabled ? "enabled" : "disabled");
    postConfig_(zoneId, ZoneConfigField::Enabled);
    return true;
}

bool ZoneController::setZoneRuntime(uint8_t zoneId, uint32_t seconds)
{
    if (!isDefined(zoneId)) return false;
    if (seconds == 0 || seconds > maxRuntimeSec_) {
        LOGW("Runtime %lus rejected for zone %u (max %lus)",
             (unsigned long)seconds, (unsigned)zoneId, (unsigned long)maxRuntimeSec_);
        return false;
    }

    Zone& z = zones_[zoneId];
    if (z.def.runtimeSec == seconds) return true;
    z.def.runtimeSec = seconds;
    postConfig_(zoneId, ZoneConfigField::Runtime);
    return true;
}

bool ZoneController::snapshot(uint8_t zoneId, ZoneSnapshot& out) const
{
    if (zoneId >= MAX_ZONES) return false;
    const Zone& z = zones_[zoneId];

    out = ZoneSnapshot{};
    out.id = zoneId;
    out.defined = z.defined;
    if (!z.defined) return true;

    out.enabled = z.def.enabled;
    out.active = z.active;
    out.revertPending = z.revertPending;
    strncpy(out.name, z.def.name, sizeof(out.name) - 1);
    out.runtimeSec = z.def.runtimeSec;
    out.remainingSec = remainingSec_(z, lastNowMs_);
    out.valveCount = z.valveCount;
    out.openValve = (z.active && z.valves[z.current].isOpen()) ? z.current : 0xFF;
    out.sessionWaterL = z.waterL;
    if (z.active && z.valves[z.current].isOpen()) out.sessionWaterL += z.valves[z.current].waterL();
    out.sessionDurationSec = z.durationSec;
    out.generation = z.generation;
    return true;
}

const Valve* ZoneController::valve(uint8_t zoneId, uint8_t idx) const
{
    if (!isDefined(zoneId)) return nullptr;
    if (idx >= zones_[zoneId].valveCount) return nullptr;
    return &zones_[zoneId].valves[idx];
}

uint8_t ZoneController::openValveCount(uint8_t zoneId) const
{
    if (!isDefined(zoneId)) return 0;
    uint8_t n = 0;
    const Zone& z = zones_[zoneId];
    for (uint8_t i = 0; i < z.valveCount; ++i) if (z.valves[i].isOpen()) n++;
    return n;
}

void ZoneController::postState_(uint8_t zoneId, bool active, ZoneChangeReason reason, uint32_t remainingSec)
{
    if (!bus_) return;
    ZoneStatePayload p{};
    p.zoneId = zoneId;
    p.active = active;
    p.reason = reason;
    p.remainingSec = remainingSec;
    bus_->post(EventId::ZoneStateChanged, &p, sizeof(p));
}

void ZoneController::postConfig_(uint8_t zoneId, ZoneConfigField field)
{
    if (!bus_) return;
    ZoneConfigPayload p{};
    p.zoneId = zoneId;
    p.field = field;
    bus_->post(EventId::ZoneConfigChanged, &p, sizeof(p));
}
