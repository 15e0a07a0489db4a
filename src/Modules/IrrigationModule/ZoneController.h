#pragma once
/**
 * @file ZoneController.h
 * @brief Zone state machine: activation policy, countdown, valve sequencing.
 *
 * A zone owns 1..MaxValvesPerZone valves. One valve is a physical zone;
 * several form a virtual zone whose runtime is split in equal slices run
 * one after the other, so at most one valve of a zone is open at a time.
 *
 * All methods take the caller's clock (millis) and are not thread-safe;
 * IrrigationModule serializes access with its mutex.
 */
#include <stdint.h>
#include <stddef.h>

#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Services/IIO.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"
#include "Valve.h"

/** @brief Static description of a zone, loaded from config. */
struct ZoneDefinition {
    char name[Limits::Irrigation::ZoneNameLen] = {0};
    bool enabled = true;
    uint32_t runtimeSec = IrrigationDefaults::DefaultZoneRuntimeSec;
    uint8_t pinCount = 0;
    uint8_t pins[Limits::Irrigation::MaxValvesPerZone] = {0};
};

/** @brief Read-only zone view for status reporting. */
struct ZoneSnapshot {
    uint8_t id = 0;
    bool defined = false;
    bool enabled = false;
    bool active = false;
    bool revertPending = false;
    char name[Limits::Irrigation::ZoneNameLen] = {0};
    uint32_t runtimeSec = 0;
    uint32_t remainingSec = 0;
    uint8_t valveCount = 0;
    uint8_t openValve = 0xFF;
    float sessionWaterL = 0.0f;
    uint32_t sessionDurationSec = 0;
    uint32_t generation = 0;
};

class ZoneController {
public:
    static constexpr uint8_t MAX_ZONES = Limits::Irrigation::MaxZones;
    static constexpr uint8_t MAX_VALVES = Limits::Irrigation::MaxValvesPerZone;

    ZoneController(EventChannel* bus = nullptr, const IOService* io = nullptr) : bus_(bus), io_(io) {}
    ~ZoneController();

    ZoneController(const ZoneController&) = delete;
    ZoneController& operator=(const ZoneController&) = delete;

    void bind(EventChannel* bus, const IOService* io) { bus_ = bus; io_ = io; }
    void setMaxRuntimeSec(uint32_t sec) { maxRuntimeSec_ = sec ? sec : 1; }
    uint32_t maxRuntimeSec() const { return maxRuntimeSec_; }
    void setMaxActive(uint8_t n) { maxActive_ = n ? n : 1; }
    uint8_t maxActive() const { return maxActive_; }
    void setPowered(bool on) { powered_ = on; }
    bool powered() const { return powered_; }

    /** @brief (Re)define a zone slot; a running zone is stopped first. */
    bool defineZone(uint8_t zoneId, const ZoneDefinition& def, uint32_t nowMs);
    bool isDefined(uint8_t zoneId) const { return zoneId < MAX_ZONES && zones_[zoneId].defined; }
    bool isActive(uint8_t zoneId) const { return isDefined(zoneId) && zones_[zoneId].active; }
    uint8_t definedCount() const;
    uint8_t enabledCount() const;
    uint8_t activeCount() const;

    /**
     * @brief INACTIVE -> ACTIVE.
     * Fails for unknown or disabled zones. While powered off the request is
     * answered by a cosmetic revert and false is returned.
     */
    bool activate(uint8_t zoneId, uint32_t nowMs);
    /** @brief ACTIVE -> INACTIVE. Idempotent for a defined zone. */
    bool deactivate(uint8_t zoneId, uint32_t nowMs, ZoneChangeReason reason = ZoneChangeReason::Request);
    void deactivateAll(uint32_t nowMs, ZoneChangeReason reason);
    /** @brief Synchronous relay release of every valve (shutdown path). */
    void forceCloseAll(uint32_t nowMs);

    /** @brief Report the zone inactive again after RevertDelayMs unless it activated meanwhile. */
    bool scheduleRevert(uint8_t zoneId, uint32_t nowMs);

    /** @brief Drive countdowns, hand-offs and reverts. Call often; work is gated per zone. */
    void tick(uint32_t nowMs);

    bool renameZone(uint8_t zoneId, const char* name);
    bool setZoneEnabled(uint8_t zoneId, bool enabled, uint32_t nowMs);
    bool setZoneRuntime(uint8_t zoneId, uint32_t seconds);

    bool snapshot(uint8_t zoneId, ZoneSnapshot& out) const;
    const Valve* valve(uint8_t zoneId, uint8_t idx) const;
    /** @brief Number of open valves in a zone. */
    uint8_t openValveCount(uint8_t zoneId) const;

    /** @brief Parse "17,27,22" into pins; returns count, 0 on syntax error. */
    static uint8_t parsePins(const char* csv, uint8_t* out, uint8_t max);

private:
    struct Zone {
        bool defined = false;
        ZoneDefinition def{};
        Valve valves[MAX_VALVES];
        uint8_t valveCount = 0;

        bool active = false;
        uint32_t generation = 0;     // countdown handle, bumped on every start/stop
        uint16_t session = 0;        // tags valve usage records
        uint32_t startMs = 0;
        uint32_t endMs = 0;
        uint32_t runtimeMs = 0;      // captured at start
        uint32_t nextTickMs = 0;
        uint8_t current = 0;         // slice index

        float waterL = 0.0f;         // closed slices of the running session
        uint32_t durationSec = 0;

        bool revertPending = false;
        uint32_t revertAtMs = 0;
        uint32_t revertGen = 0;
    };

    static bool reached_(uint32_t nowMs, uint32_t atMs) { return (int32_t)(nowMs - atMs) >= 0; }

    void start_(uint8_t zoneId, uint32_t nowMs);
    void stop_(uint8_t zoneId, uint32_t nowMs, ZoneChangeReason reason);
    void tickZone_(uint8_t zoneId, uint32_t nowMs);
    void closeValve_(Zone& z, uint8_t idx, uint32_t nowMs);
    uint32_t valveEndMs_(const Zone& z, uint8_t idx) const;
    uint32_t remainingSec_(const Zone& z, uint32_t nowMs) const;
    void emitSummary_(uint8_t zoneId);
    void postState_(uint8_t zoneId, bool active, ZoneChangeReason reason, uint32_t remainingSec);
    void postConfig_(uint8_t zoneId, ZoneConfigField field);

    EventChannel* bus_ = nullptr;
    const IOService* io_ = nullptr;
    Zone zones_[MAX_ZONES];
    bool powered_ = true;
    uint8_t maxActive_ = IrrigationDefaults::MaxActiveZones;
    uint32_t maxRuntimeSec_ = IrrigationDefaults::MaxRuntimeSec;
    uint32_t lastNowMs_ = 0;
};
