/**
 * @file IrrigationModule.cpp
 * @brief Implementation file.
 */

#include "IrrigationModule.h"
#include "Modules/IrrigationModule/IrrigationStatus.h"
#define LOG_TAG "Irrigatn"
#include "Core/ModuleLog.h"
#include <ArduinoJson.h>
#include <Arduino.h>
#include <esp_system.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

IrrigationModule* IrrigationModule::shutdownInstance_ = nullptr;

static bool parseCmdArgsObject_(const CommandRequest& req, JsonObjectConst& outObj)
{
    static StaticJsonDocument<Limits::JsonCmdBuf> doc;

    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        outObj = doc.as<JsonObjectConst>();
        return true;
    }

    if (req.json && req.json[0] != '\0' && req.args != req.json) {
        doc.clear();
        const DeserializationError rootErr = deserializeJson(doc, req.json);
        if (rootErr || !doc.is<JsonObjectConst>()) return false;
        JsonVariantConst argsVar = doc["args"];
        if (argsVar.is<JsonObjectConst>()) {
            outObj = argsVar.as<JsonObjectConst>();
            return true;
        }
    }

    return false;
}

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static void writeCmdErrorZone_(char* reply, size_t replyLen, const char* where, ErrorCode code, uint8_t zone)
{
    if (!writeErrorJsonWithZone(reply, replyLen, code, where, zone)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

static bool readZoneArg_(JsonObjectConst args, uint8_t& zone, ErrorCode& err)
{
    if (!args.containsKey("zone")) {
        err = ErrorCode::MissingArgs;
        return false;
    }
    if (!args["zone"].is<uint8_t>() || args["zone"].as<uint8_t>() >= Limits::Irrigation::MaxZones) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    zone = args["zone"].as<uint8_t>();
    return true;
}

static bool readBoolArg_(JsonObjectConst args, const char* key, bool& out, ErrorCode& err)
{
    if (!args.containsKey(key)) {
        err = ErrorCode::MissingValue;
        return false;
    }
    JsonVariantConst v = args[key];
    if (v.is<bool>()) {
        out = v.as<bool>();
        return true;
    }
    if (v.is<int32_t>()) {
        const int32_t n = v.as<int32_t>();
        if (n == 0 || n == 1) {
            out = (n == 1);
            return true;
        }
    } else if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (s && strcmp(s, "true") == 0) { out = true; return true; }
        if (s && strcmp(s, "false") == 0) { out = false; return true; }
    }
    err = ErrorCode::InvalidBool;
    return false;
}

static void IRAM_ATTR flowPulseIsr_(void* ctx)
{
    static_cast<FlowSampler*>(ctx)->onPulse();
}

uint32_t IrrigationModule::nowEpoch_()
{
    const time_t t = time(nullptr);
    return (t > 0) ? (uint32_t)t : 0U;
}

// -------------------------
// Setup
// -------------------------

void IrrigationModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    cmdSvc_ = services.get<CommandService>("cmd");
    ioSvc_ = services.get<IOService>("io");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    // Board rev 1 ships four wired zones; the other slots start disabled.
    const uint8_t boardRelays[] = {
        Board::Relay::Zone1, Board::Relay::Zone2, Board::Relay::Zone3, Board::Relay::Zone4
    };
    for (uint8_t i = 0; i < sizeof(boardRelays) && i < MAX_ZONES; ++i) {
        zoneCfg_[i].enabled = true;
        snprintf(zoneCfg_[i].pins, sizeof(zoneCfg_[i].pins), "%u", (unsigned)boardRelays[i]);
    }

    cfg.registerVar(powerVar_);
    cfg.registerVar(pauseUntilVar_);
    cfg.registerVar(maxRuntimeVar_);
    cfg.registerVar(maxActiveVar_);
    cfg.registerVar(flowPinVar_);
    cfg.registerVar(flowFactorVar_);
    cfg.registerVar(leakEnabledVar_);
    cfg.registerVar(utcOffsetVar_);
    registerZoneVars_(cfg);

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        LOGE("mutex allocation failed");
        return;
    }
    if (!eventBus_) {
        LOGE("event bus unavailable");
        return;
    }

    guarded_.bind(eventBus_, mutex_);
    zones_.bind(&guarded_, ioSvc_);
    flow_.setBus(&guarded_);
    leak_.setBus(&guarded_);
    power_.setBus(&guarded_);

    if (!services.add("irrigation", &irrigationSvc_)) {
        LOGE("service registration failed: irrigation");
    }
    registerCommands_();

    shutdownInstance_ = this;
    if (esp_register_shutdown_handler(&IrrigationModule::shutdownHandler_) != ESP_OK) {
        LOGW("shutdown handler registration failed, valves may stay open across restarts");
    }
}

void IrrigationModule::registerZoneVars_(ConfigStore& cfg)
{
    for (uint8_t i = 0; i < MAX_ZONES; ++i) {
        ZoneConfig& z = zoneCfg_[i];

        snprintf(cfgZoneModuleName_[i], sizeof(cfgZoneModuleName_[i]), "irr/z%u", (unsigned)i);
        snprintf(nvsZoneNameKey_[i], sizeof(nvsZoneNameKey_[i]), NvsKeys::Irrigation::ZoneNameFmt, (unsigned)i);
        snprintf(nvsZoneEnabledKey_[i], sizeof(nvsZoneEnabledKey_[i]), NvsKeys::Irrigation::ZoneEnabledFmt, (unsigned)i);
        snprintf(nvsZoneRuntimeKey_[i], sizeof(nvsZoneRuntimeKey_[i]), NvsKeys::Irrigation::ZoneRuntimeFmt, (unsigned)i);
        snprintf(nvsZonePinsKey_[i], sizeof(nvsZonePinsKey_[i]), NvsKeys::Irrigation::ZonePinsFmt, (unsigned)i);

        zoneNameVar_[i].nvsKey = nvsZoneNameKey_[i];
        zoneNameVar_[i].jsonName = "name";
        zoneNameVar_[i].moduleName = cfgZoneModuleName_[i];
        zoneNameVar_[i].type = ConfigType::CharArray;
        zoneNameVar_[i].value = z.name;
        zoneNameVar_[i].persistence = ConfigPersistence::Persistent;
        zoneNameVar_[i].size = sizeof(z.name);
        cfg.registerVar(zoneNameVar_[i]);

        zoneEnabledVar_[i].nvsKey = nvsZoneEnabledKey_[i];
        zoneEnabledVar_[i].jsonName = "enabled";
        zoneEnabledVar_[i].moduleName = cfgZoneModuleName_[i];
        zoneEnabledVar_[i].type = ConfigType::Bool;
        zoneEnabledVar_[i].value = &z.enabled;
        zoneEnabledVar_[i].persistence = ConfigPersistence::Persistent;
        zoneEnabledVar_[i].size = 0;
        cfg.registerVar(zoneEnabledVar_[i]);

        zoneRuntimeVar_[i].nvsKey = nvsZoneRuntimeKey_[i];
        zoneRuntimeVar_[i].jsonName = "runtime_s";
        zoneRuntimeVar_[i].moduleName = cfgZoneModuleName_[i];
        zoneRuntimeVar_[i].type = ConfigType::Int32;
        zoneRuntimeVar_[i].value = &z.runtimeSec;
        zoneRuntimeVar_[i].persistence = ConfigPersistence::Persistent;
        zoneRuntimeVar_[i].size = 0;
        cfg.registerVar(zoneRuntimeVar_[i]);

        zonePinsVar_[i].nvsKey = nvsZonePinsKey_[i];
        zonePinsVar_[i].jsonName = "relay_pins";
        zonePinsVar_[i].moduleName = cfgZoneModuleName_[i];
        zonePinsVar_[i].type = ConfigType::CharArray;
        zonePinsVar_[i].value = z.pins;
        zonePinsVar_[i].persistence = ConfigPersistence::Persistent;
        zonePinsVar_[i].size = sizeof(z.pins);
        cfg.registerVar(zonePinsVar_[i]);
    }
}

void IrrigationModule::registerCommands_()
{
    if (!cmdSvc_ || !cmdSvc_->registerHandler) {
        LOGW("command service unavailable, irrigation commands not registered");
        return;
    }
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.activate", cmdZoneActivate_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.deactivate", cmdZoneDeactivate_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.request", cmdZoneRequest_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.system.request", cmdSystemRequest_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.power.set", cmdPowerSet_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.pause.set", cmdPauseSet_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.rename", cmdZoneRename_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.enable", cmdZoneEnable_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.zone.runtime", cmdZoneRuntime_, this);
    cmdSvc_->registerHandler(cmdSvc_->ctx, "irrigation.status", cmdStatus_, this);
}

bool IrrigationModule::buildZoneDefinition_(uint8_t zoneId, ZoneDefinition& out) const
{
    const ZoneConfig& c = zoneCfg_[zoneId];
    out = ZoneDefinition{};
    strncpy(out.name, c.name, sizeof(out.name) - 1);
    out.enabled = c.enabled;
    out.runtimeSec = (c.runtimeSec > 0) ? (uint32_t)c.runtimeSec : 0U;

    out.pinCount = ZoneController::parsePins(c.pins, out.pins, Limits::Irrigation::MaxValvesPerZone);
    if (out.pinCount == 0 && c.pins[0] != '\0') {
        LOGW("Zone %u relay pin list '%s' invalid, zone has no relay", (unsigned)zoneId, c.pins);
        return false;
    }
    for (uint8_t p = 0; p < out.pinCount; ++p) {
        if (out.pins[p] > Board::MaxGpio) {
            LOGW("Zone %u relay pin %u out of range, zone has no relay", (unsigned)zoneId, (unsigned)out.pins[p]);
            out.pinCount = 0;
            return false;
        }
    }
    return true;
}

void IrrigationModule::defineZones_(uint32_t nowMs)
{
    for (uint8_t i = 0; i < MAX_ZONES; ++i) {
        ZoneDefinition def;
        buildZoneDefinition_(i, def);
        if (!zones_.defineZone(i, def, nowMs)) {
            LOGE("Zone %u definition rejected", (unsigned)i);
        }
    }
}

void IrrigationModule::startFlowMetering_(uint32_t nowMs)
{
    if (cfgData_.flowPin == IO_PIN_NONE || cfgData_.flowPin > Board::MaxGpio) {
        LOGW("No flow sensor pin, flow metering and leak detection disabled");
        return;
    }
    if (!ioSvc_ || !ioSvc_->pollDigitalInput) {
        LOGW("IO service unavailable, flow metering disabled");
        return;
    }
    if (!ioSvc_->pollDigitalInput(ioSvc_->ctx, cfgData_.flowPin, flowPulseIsr_, &flow_)) {
        LOGW("Flow sensor attach failed on GPIO%u", (unsigned)cfgData_.flowPin);
        return;
    }

    flow_.setCalibration(cfgData_.flowFactor);
    flow_.begin(nowMs);
    flowActive_ = true;
    if (cfgData_.flowFactor <= 0.0f) {
        LOGW("Flow factor not set, flow rate reads 0 L/min");
    }

    if (!cfgData_.leakEnabled) {
        LOGI("Leak detection disabled by config");
        return;
    }
    if (!leak_.attach()) {
        LOGE("Leak detector subscribe failed");
        return;
    }
    leakActive_ = true;
}

void IrrigationModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!mutex_ || !eventBus_) return;
    if (!ioSvc_) {
        LOGW("IO service unavailable, valves will not switch");
    }

    Lock lock(mutex_);
    const uint32_t now = millis();

    zones_.setMaxRuntimeSec((cfgData_.maxRuntimeSec > 0) ? (uint32_t)cfgData_.maxRuntimeSec
                                                         : (uint32_t)IrrigationDefaults::MaxRuntimeSec);
    zones_.setMaxActive(cfgData_.maxActive);
    defineZones_(now);

    power_.begin(cfgData_.power, (cfgData_.pauseUntil > 0) ? (uint32_t)cfgData_.pauseUntil : 0U);
    startFlowMetering_(now);

    bool ok = guarded_.subscribe(EventId::ZoneConfigChanged, &IrrigationModule::onEventStatic_, this);
    ok = guarded_.subscribe(EventId::PowerChanged, &IrrigationModule::onEventStatic_, this) && ok;
    ok = guarded_.subscribe(EventId::ConfigChanged, &IrrigationModule::onEventStatic_, this) && ok;
    if (!ok) {
        LOGW("persistence subscriptions incomplete, runtime edits may not be saved");
    }

    lastPauseCheckMs_ = now;
    ready_ = true;

    LOGI("Irrigation ready (zones=%u enabled=%u flow=%s leak=%s)",
         (unsigned)zones_.definedCount(), (unsigned)zones_.enabledCount(),
         flowActive_ ? "on" : "off", leakActive_ ? "on" : "off");
}

void IrrigationModule::loop()
{
    if (!ready_) return;

    Lock lock(mutex_);
    const uint32_t now = millis();

    if (flowActive_) flow_.sample(now, IrrigationDefaults::FlowSampleMs);
    zones_.tick(now);
    debouncer_.tick(now);

    if ((uint32_t)(now - lastPauseCheckMs_) >= IrrigationDefaults::PauseCheckMs) {
        lastPauseCheckMs_ = now;
        power_.tick(nowEpoch_(), now);
    }
}

// -------------------------
// Persistence and config sync
// -------------------------

void IrrigationModule::onEventStatic_(const Event& e, void* user)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(user);
    if (!self) return;

    switch (e.id) {
        case EventId::ZoneConfigChanged: {
            const ZoneConfigPayload* p = eventPayload<ZoneConfigPayload>(e);
            if (p) self->onZoneConfigChanged_(*p);
            break;
        }
        case EventId::PowerChanged:
            self->onPowerChanged_();
            break;
        case EventId::ConfigChanged: {
            const ConfigChangedPayload* p = eventPayload<ConfigChangedPayload>(e);
            if (p) self->onConfigChanged_(p->nvsKey);
            break;
        }
        default:
            break;
    }
}

void IrrigationModule::onZoneConfigChanged_(const ZoneConfigPayload& p)
{
    if (!cfgStore_ || p.zoneId >= MAX_ZONES) return;
    ZoneSnapshot s;
    if (!zones_.snapshot(p.zoneId, s) || !s.defined) return;

    switch (p.field) {
        case ZoneConfigField::Name:
            cfgStore_->set(zoneNameVar_[p.zoneId], s.name);
            break;
        case ZoneConfigField::Enabled:
            cfgStore_->set(zoneEnabledVar_[p.zoneId], s.enabled);
            break;
        case ZoneConfigField::Runtime:
            cfgStore_->set(zoneRuntimeVar_[p.zoneId], (int32_t)s.runtimeSec);
            break;
    }
}

void IrrigationModule::onPowerChanged_()
{
    if (!cfgStore_) return;
    // Current state rather than the payload: a newer change may already be applied.
    cfgStore_->set(powerVar_, power_.powered());
    cfgStore_->set(pauseUntilVar_, (int32_t)power_.pauseUntil());
}

void IrrigationModule::onConfigChanged_(const char* nvsKey)
{
    if (!nvsKey) return;

    if (strncmp(nvsKey, "zn", 2) == 0) {
        for (uint8_t i = 0; i < MAX_ZONES; ++i) {
            if (strcmp(nvsKey, nvsZonePinsKey_[i]) == 0) {
                LOGI("Zone %u relay pins saved, applied after reboot", (unsigned)i);
                return;
            }
            if (strcmp(nvsKey, nvsZoneNameKey_[i]) == 0 ||
                strcmp(nvsKey, nvsZoneEnabledKey_[i]) == 0 ||
                strcmp(nvsKey, nvsZoneRuntimeKey_[i]) == 0) {
                resyncZone_(i);
                return;
            }
        }
        return;
    }

    if (strncmp(nvsKey, "ir_", 3) == 0) resyncSystem_(nvsKey);
}

void IrrigationModule::resyncZone_(uint8_t zoneId)
{
    ZoneSnapshot s;
    if (!zones_.snapshot(zoneId, s) || !s.defined) return;
    const ZoneConfig& c = zoneCfg_[zoneId];

    if (c.name[0] != '\0' && strcmp(c.name, s.name) != 0) {
        zones_.renameZone(zoneId, c.name);
    }
    if (c.enabled != s.enabled) {
        zones_.setZoneEnabled(zoneId, c.enabled, millis());
    }
    if (c.runtimeSec != (int32_t)s.runtimeSec) {
        if (c.runtimeSec <= 0 || !zones_.setZoneRuntime(zoneId, (uint32_t)c.runtimeSec)) {
            LOGW("Zone %u runtime %ld rejected (max %lus)", (unsigned)zoneId,
                 (long)c.runtimeSec, (unsigned long)zones_.maxRuntimeSec());
            cfgStore_->set(zoneRuntimeVar_[zoneId], (int32_t)s.runtimeSec);
        }
    }
}

void IrrigationModule::resyncSystem_(const char* nvsKey)
{
    const uint32_t now = millis();

    if (strcmp(nvsKey, NvsKeys::Irrigation::Power) == 0) {
        if (cfgData_.power != power_.powered()) power_.setPower(cfgData_.power, now);
    } else if (strcmp(nvsKey, NvsKeys::Irrigation::PauseUntil) == 0) {
        const uint32_t until = (cfgData_.pauseUntil > 0) ? (uint32_t)cfgData_.pauseUntil : 0U;
        if (until != power_.pauseUntil()) {
            ErrorCode err = ErrorCode::Failed;
            if (!setPauseLocked_(until, now, err)) {
                cfgStore_->set(pauseUntilVar_, (int32_t)power_.pauseUntil());
            }
        }
    } else if (strcmp(nvsKey, NvsKeys::Irrigation::MaxRuntime) == 0) {
        if (cfgData_.maxRuntimeSec <= 0) {
            LOGW("max_runtime_s must be positive");
            cfgStore_->set(maxRuntimeVar_, (int32_t)zones_.maxRuntimeSec());
        } else {
            zones_.setMaxRuntimeSec((uint32_t)cfgData_.maxRuntimeSec);
        }
    } else if (strcmp(nvsKey, NvsKeys::Irrigation::MaxActive) == 0) {
        if (cfgData_.maxActive == 0 || cfgData_.maxActive > MAX_ZONES) {
            LOGW("max_active must be 1..%u", (unsigned)MAX_ZONES);
            cfgStore_->set(maxActiveVar_, zones_.maxActive());
        } else {
            zones_.setMaxActive(cfgData_.maxActive);
        }
    } else if (strcmp(nvsKey, NvsKeys::Irrigation::FlowFactor) == 0) {
        flow_.setCalibration(cfgData_.flowFactor);
    } else if (strcmp(nvsKey, NvsKeys::Irrigation::FlowPin) == 0 ||
               strcmp(nvsKey, NvsKeys::Irrigation::LeakEnabled) == 0) {
        LOGI("%s saved, applied after reboot", nvsKey);
    }
}

// -------------------------
// Shutdown
// -------------------------

void IrrigationModule::shutdownHandler_()
{
    if (shutdownInstance_) shutdownInstance_->shutdown_();
}

void IrrigationModule::shutdown_()
{
    if (!mutex_) return;
    const bool locked = xSemaphoreTake(mutex_, pdMS_TO_TICKS(IrrigationDefaults::ShutdownGraceMs)) == pdTRUE;
    if (!locked) {
        LOGW("core busy at shutdown, forcing valves closed");
    }
    ready_ = false;
    zones_.forceCloseAll(millis());
    if (locked) xSemaphoreGive(mutex_);
}

// -------------------------
// Core operations (mutex held)
// -------------------------

bool IrrigationModule::activateLocked_(uint8_t zoneId, uint32_t nowMs, ErrorCode& err)
{
    ZoneSnapshot s;
    if (!zones_.snapshot(zoneId, s) || !s.defined) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    if (!s.enabled) {
        err = ErrorCode::Disabled;
        return false;
    }
    if (!zones_.powered()) {
        // Arms the cosmetic revert so presentation layers fall back to off.
        zones_.activate(zoneId, nowMs);
        err = ErrorCode::PoweredOff;
        return false;
    }
    if (!zones_.activate(zoneId, nowMs)) {
        err = ErrorCode::Failed;
        return false;
    }
    return true;
}

bool IrrigationModule::deactivateLocked_(uint8_t zoneId, uint32_t nowMs, ErrorCode& err)
{
    if (!zones_.isDefined(zoneId)) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    if (!zones_.deactivate(zoneId, nowMs)) {
        err = ErrorCode::Failed;
        return false;
    }
    return true;
}

bool IrrigationModule::setPauseLocked_(uint32_t untilEpochSec, uint32_t nowMs, ErrorCode& err)
{
    if (untilEpochSec == 0) return power_.setPause(0, nowEpoch_(), nowMs);

    const uint32_t epoch = nowEpoch_();
    if (!PowerScheduler::clockValid(epoch)) {
        err = ErrorCode::NotReady;
        return false;
    }
    if (!power_.setPause(untilEpochSec, epoch, nowMs)) {
        err = ErrorCode::InvalidPause;
        return false;
    }
    return true;
}

bool IrrigationModule::renameLocked_(uint8_t zoneId, const char* name, ErrorCode& err)
{
    if (!zones_.isDefined(zoneId)) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    if (!name || name[0] == '\0' || strlen(name) >= Limits::Irrigation::ZoneNameLen) {
        err = ErrorCode::InvalidName;
        return false;
    }
    if (!zones_.renameZone(zoneId, name)) {
        err = ErrorCode::InvalidName;
        return false;
    }
    return true;
}

bool IrrigationModule::setEnabledLocked_(uint8_t zoneId, bool enabled, uint32_t nowMs, ErrorCode& err)
{
    if (!zones_.isDefined(zoneId)) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    if (!zones_.setZoneEnabled(zoneId, enabled, nowMs)) {
        err = ErrorCode::Failed;
        return false;
    }
    return true;
}

bool IrrigationModule::setRuntimeLocked_(uint8_t zoneId, uint32_t seconds, ErrorCode& err)
{
    if (!zones_.isDefined(zoneId)) {
        err = ErrorCode::UnknownZone;
        return false;
    }
    if (seconds == 0 || seconds > zones_.maxRuntimeSec() || !zones_.setZoneRuntime(zoneId, seconds)) {
        err = ErrorCode::InvalidRuntime;
        return false;
    }
    return true;
}

// -------------------------
// IrrigationService
// -------------------------

bool IrrigationModule::svcRequestZone_(void* ctx, uint8_t zoneId, bool on)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    if (!self->zones_.isDefined(zoneId)) return false;

    ActivationRequest r;
    r.source = RequestSource::Zone;
    r.zoneId = zoneId;
    r.on = on;
    return self->debouncer_.submit(r, millis());
}

bool IrrigationModule::svcRequestSystem_(void* ctx, bool on, bool fromSwitch)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);

    ActivationRequest r;
    r.source = fromSwitch ? RequestSource::Switch : RequestSource::System;
    r.on = on;
    return self->debouncer_.submit(r, millis());
}

bool IrrigationModule::svcActivateZone_(void* ctx, uint8_t zoneId)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->activateLocked_(zoneId, millis(), err);
}

bool IrrigationModule::svcDeactivateZone_(void* ctx, uint8_t zoneId)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->deactivateLocked_(zoneId, millis(), err);
}

bool IrrigationModule::svcSetPower_(void* ctx, bool on)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    return self->power_.setPower(on, millis());
}

bool IrrigationModule::svcSetPause_(void* ctx, uint32_t untilEpochSec)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->setPauseLocked_(untilEpochSec, millis(), err);
}

bool IrrigationModule::svcRenameZone_(void* ctx, uint8_t zoneId, const char* name)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->renameLocked_(zoneId, name, err);
}

bool IrrigationModule::svcSetZoneEnabled_(void* ctx, uint8_t zoneId, bool enabled)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->setEnabledLocked_(zoneId, enabled, millis(), err);
}

bool IrrigationModule::svcSetZoneRuntime_(void* ctx, uint8_t zoneId, uint32_t seconds)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    ErrorCode err = ErrorCode::Failed;
    return self->setRuntimeLocked_(zoneId, seconds, err);
}

bool IrrigationModule::svcBuildSnapshot_(void* ctx, char* out, size_t outLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->ready_) return false;
    Lock lock(self->mutex_);
    return buildIrrigationStatusJson(self->zones_, self->power_,
                                     self->leakActive_ ? &self->leak_ : nullptr,
                                     self->flowActive_ ? &self->flow_ : nullptr,
                                     out, outLen);
}

// -------------------------
// Commands
// -------------------------

bool IrrigationModule::cmdZoneActivate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneActivate_(req, reply, replyLen);
}

bool IrrigationModule::cmdZoneDeactivate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneDeactivate_(req, reply, replyLen);
}

bool IrrigationModule::cmdZoneRequest_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneRequest_(req, reply, replyLen);
}

bool IrrigationModule::cmdSystemRequest_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleSystemRequest_(req, reply, replyLen);
}

bool IrrigationModule::cmdPowerSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handlePowerSet_(req, reply, replyLen);
}

bool IrrigationModule::cmdPauseSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handlePauseSet_(req, reply, replyLen);
}

bool IrrigationModule::cmdZoneRename_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneRename_(req, reply, replyLen);
}

bool IrrigationModule::cmdZoneEnable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneEnable_(req, reply, replyLen);
}

bool IrrigationModule::cmdZoneRuntime_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleZoneRuntime_(req, reply, replyLen);
}

bool IrrigationModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self) return false;
    return self->handleStatus_(reply, replyLen);
}

bool IrrigationModule::handleZoneActivate_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.activate";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    bool ok = false;
    {
        Lock lock(mutex_);
        ok = activateLocked_(zone, millis(), err);
    }
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, kWhere, err, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"active\":true}", (unsigned)zone);
    return true;
}

bool IrrigationModule::handleZoneDeactivate_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.deactivate";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    bool ok = false;
    {
        Lock lock(mutex_);
        ok = deactivateLocked_(zone, millis(), err);
    }
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, kWhere, err, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"active\":false}", (unsigned)zone);
    return true;
}

bool IrrigationModule::handleZoneRequest_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.request";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    bool on = false;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err) || !readBoolArg_(args, "on", on, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    if (!svcRequestZone_(this, zone, on)) {
        writeCmdErrorZone_(reply, replyLen, kWhere,
                           zones_.isDefined(zone) ? ErrorCode::Busy : ErrorCode::UnknownZone, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"queued\":true}", (unsigned)zone);
    return true;
}

bool IrrigationModule::handleSystemRequest_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.system.request";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    bool on = false;
    ErrorCode err = ErrorCode::Failed;
    if (!readBoolArg_(args, "on", on, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    bool fromSwitch = false;
    if (args.containsKey("source")) {
        const char* src = args["source"].as<const char*>();
        if (src && strcmp(src, "switch") == 0) fromSwitch = true;
        else if (!src || strcmp(src, "system") != 0) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingValue);
            return false;
        }
    }

    if (!svcRequestSystem_(this, on, fromSwitch)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::Busy);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"queued\":true}");
    return true;
}

bool IrrigationModule::handlePowerSet_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.power.set";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    bool on = false;
    ErrorCode err = ErrorCode::Failed;
    if (!readBoolArg_(args, "on", on, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    bool power = false;
    {
        Lock lock(mutex_);
        power_.setPower(on, millis());
        power = power_.powered();
    }
    LOGI("Power %s by command", power ? "on" : "off");
    snprintf(reply, replyLen, "{\"ok\":true,\"power\":%s}", power ? "true" : "false");
    return true;
}

bool IrrigationModule::handlePauseSet_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.pause.set";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }

    uint32_t until = 0;
    if (args.containsKey("days")) {
        if (!args["days"].is<uint8_t>()) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::InvalidPause);
            return false;
        }
        const uint8_t days = args["days"].as<uint8_t>();
        const uint32_t epoch = nowEpoch_();
        if (!PowerScheduler::clockValid(epoch)) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
            return false;
        }
        until = PowerScheduler::computePauseUntil(epoch, days, cfgData_.utcOffsetSec);
        if (until == 0) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::InvalidPause);
            return false;
        }
    } else if (args.containsKey("until")) {
        if (!args["until"].is<uint32_t>()) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::InvalidPause);
            return false;
        }
        until = args["until"].as<uint32_t>();
    } else {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingValue);
        return false;
    }

    bool ok = false;
    bool power = false;
    uint32_t pauseUntil = 0;
    ErrorCode err = ErrorCode::Failed;
    {
        Lock lock(mutex_);
        ok = setPauseLocked_(until, millis(), err);
        power = power_.powered();
        pauseUntil = power_.pauseUntil();
    }
    if (!ok) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"power\":%s,\"pause_until\":%lu}",
             power ? "true" : "false", (unsigned long)pauseUntil);
    return true;
}

bool IrrigationModule::handleZoneRename_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.rename";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }
    if (!args["name"].is<const char*>()) {
        writeCmdErrorZone_(reply, replyLen, kWhere, ErrorCode::InvalidName, zone);
        return false;
    }

    bool ok = false;
    {
        Lock lock(mutex_);
        ok = renameLocked_(zone, args["name"].as<const char*>(), err);
    }
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, kWhere, err, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u}", (unsigned)zone);
    return true;
}

bool IrrigationModule::handleZoneEnable_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.enable";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    bool enabled = false;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err) || !readBoolArg_(args, "enabled", enabled, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }

    bool ok = false;
    {
        Lock lock(mutex_);
        ok = setEnabledLocked_(zone, enabled, millis(), err);
    }
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, kWhere, err, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"enabled\":%s}",
             (unsigned)zone, enabled ? "true" : "false");
    return true;
}

bool IrrigationModule::handleZoneRuntime_(const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.zone.runtime";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    uint8_t zone = 0;
    ErrorCode err = ErrorCode::Failed;
    if (!readZoneArg_(args, zone, err)) {
        writeCmdError_(reply, replyLen, kWhere, err);
        return false;
    }
    if (!args.containsKey("seconds")) {
        writeCmdErrorZone_(reply, replyLen, kWhere, ErrorCode::MissingValue, zone);
        return false;
    }
    if (!args["seconds"].is<uint32_t>()) {
        writeCmdErrorZone_(reply, replyLen, kWhere, ErrorCode::InvalidRuntime, zone);
        return false;
    }
    const uint32_t seconds = args["seconds"].as<uint32_t>();

    bool ok = false;
    {
        Lock lock(mutex_);
        ok = setRuntimeLocked_(zone, seconds, err);
    }
    if (!ok) {
        writeCmdErrorZone_(reply, replyLen, kWhere, err, zone);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true,\"zone\":%u,\"runtime_s\":%lu}",
             (unsigned)zone, (unsigned long)seconds);
    return true;
}

bool IrrigationModule::handleStatus_(char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "irrigation.status";
    if (!ready_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::NotReady);
        return false;
    }
    if (!svcBuildSnapshot_(this, reply, replyLen)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::Failed);
        return false;
    }
    return true;
}
