/**
 * @file TankLevelModule.cpp
 * @brief Implementation file.
 */

#include "TankLevelModule.h"
#include "Board/BoardPinMap.h"
#include "Core/ErrorCodes.h"
#include "Core/NvsKeys.h"
#include "Domain/IrrigationDefaults.h"
#define LOG_TAG "TankLvlM"
#include "Core/ModuleLog.h"
#include <ArduinoJson.h>
#include <Arduino.h>
#include <string.h>

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

void TankLevelModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cmdSvc_ = services.get<CommandService>("cmd");
    ioSvc_ = services.get<IOService>("io");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;

    for (uint8_t i = 0; i < MAX_TANKS; ++i) releaseMeasurement_(i);

    // Board rev 1 carries two ranger headers.
    cfg_[0].trigPin = Board::Usonic::Trig1;
    cfg_[0].echoPin = Board::Usonic::Echo1;
    cfg_[1].trigPin = Board::Usonic::Trig2;
    cfg_[1].echoPin = Board::Usonic::Echo2;

    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        TankConfig& t = cfg_[i];

        snprintf(cfgModuleName_[i], sizeof(cfgModuleName_[i]), "tank/t%u", (unsigned)i);
        snprintf(nvsEnabledKey_[i], sizeof(nvsEnabledKey_[i]), NvsKeys::Tank::EnabledFmt, (unsigned)i);
        snprintf(nvsHeightKey_[i], sizeof(nvsHeightKey_[i]), NvsKeys::Tank::HeightFmt, (unsigned)i);
        snprintf(nvsMinLevelKey_[i], sizeof(nvsMinLevelKey_[i]), NvsKeys::Tank::MinLevelFmt, (unsigned)i);
        snprintf(nvsTrigKey_[i], sizeof(nvsTrigKey_[i]), NvsKeys::Tank::TrigFmt, (unsigned)i);
        snprintf(nvsEchoKey_[i], sizeof(nvsEchoKey_[i]), NvsKeys::Tank::EchoFmt, (unsigned)i);
        snprintf(nvsCapacityKey_[i], sizeof(nvsCapacityKey_[i]), NvsKeys::Tank::CapacityFmt, (unsigned)i);

        cfgEnabledVar_[i].nvsKey = nvsEnabledKey_[i];
        cfgEnabledVar_[i].jsonName = "enabled";
        cfgEnabledVar_[i].moduleName = cfgModuleName_[i];
        cfgEnabledVar_[i].type = ConfigType::Bool;
        cfgEnabledVar_[i].value = &t.enabled;
        cfgEnabledVar_[i].persistence = ConfigPersistence::Persistent;
        cfgEnabledVar_[i].size = 0;
        cfg.registerVar(cfgEnabledVar_[i]);

        cfgHeightVar_[i].nvsKey = nvsHeightKey_[i];
        cfgHeightVar_[i].jsonName = "sensor_height_mm";
        cfgHeightVar_[i].moduleName = cfgModuleName_[i];
        cfgHeightVar_[i].type = ConfigType::Int32;
        cfgHeightVar_[i].value = &t.sensorHeightMm;
        cfgHeightVar_[i].persistence = ConfigPersistence::Persistent;
        cfgHeightVar_[i].size = 0;
        cfg.registerVar(cfgHeightVar_[i]);

        cfgMinLevelVar_[i].nvsKey = nvsMinLevelKey_[i];
        cfgMinLevelVar_[i].jsonName = "minimum_level_mm";
        cfgMinLevelVar_[i].moduleName = cfgModuleName_[i];
        cfgMinLevelVar_[i].type = ConfigType::Int32;
        cfgMinLevelVar_[i].value = &t.minimumLevelMm;
        cfgMinLevelVar_[i].persistence = ConfigPersistence::Persistent;
        cfgMinLevelVar_[i].size = 0;
        cfg.registerVar(cfgMinLevelVar_[i]);

        cfgTrigVar_[i].nvsKey = nvsTrigKey_[i];
        cfgTrigVar_[i].jsonName = "trig_pin";
        cfgTrigVar_[i].moduleName = cfgModuleName_[i];
        cfgTrigVar_[i].type = ConfigType::UInt8;
        cfgTrigVar_[i].value = &t.trigPin;
        cfgTrigVar_[i].persistence = ConfigPersistence::Persistent;
        cfgTrigVar_[i].size = 0;
        cfg.registerVar(cfgTrigVar_[i]);

        cfgEchoVar_[i].nvsKey = nvsEchoKey_[i];
        cfgEchoVar_[i].jsonName = "echo_pin";
        cfgEchoVar_[i].moduleName = cfgModuleName_[i];
        cfgEchoVar_[i].type = ConfigType::UInt8;
        cfgEchoVar_[i].value = &t.echoPin;
        cfgEchoVar_[i].persistence = ConfigPersistence::Persistent;
        cfgEchoVar_[i].size = 0;
        cfg.registerVar(cfgEchoVar_[i]);

        cfgCapacityVar_[i].nvsKey = nvsCapacityKey_[i];
        cfgCapacityVar_[i].jsonName = "capacity_l";
        cfgCapacityVar_[i].moduleName = cfgModuleName_[i];
        cfgCapacityVar_[i].type = ConfigType::Int32;
        cfgCapacityVar_[i].value = &t.capacityL;
        cfgCapacityVar_[i].persistence = ConfigPersistence::Persistent;
        cfgCapacityVar_[i].size = 0;
        cfg.registerVar(cfgCapacityVar_[i]);
    }

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        LOGE("mutex allocation failed");
        return;
    }
    guarded_.bind(eventBus_, mutex_);
    aggregator_.setBus(&guarded_);

    if (cmdSvc_ && cmdSvc_->registerHandler) {
        cmdSvc_->registerHandler(cmdSvc_->ctx, "tanklevel.status", cmdStatus_, this);
    }
}

void TankLevelModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (!mutex_) return;
    if (!ioSvc_ || !ioSvc_->measureDistance) {
        LOGW("IO service unavailable, tank sampling disabled");
        return;
    }
    if (!eventBus_) {
        LOGW("event bus unavailable, tank sampling disabled");
        return;
    }

    syncGeometry_();
    if (!aggregator_.attach()) {
        LOGE("subscribe failed (TankDistanceMeasured)");
        return;
    }
    if (!eventBus_->subscribe(EventId::ConfigChanged, &TankLevelModule::onEventStatic_, this)) {
        LOGW("subscribe failed (ConfigChanged), geometry changes need a reboot");
    }
    ready_ = true;

    uint8_t n = 0;
    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        if (aggregator_.measurable(i)) n++;
    }
    LOGI("Tank sampling ready (%u tank(s), period=%lus)", (unsigned)n,
         (unsigned long)(IrrigationDefaults::TankSampleMs / 1000U));
}

void TankLevelModule::syncGeometry_()
{
    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        const TankConfig& c = cfg_[i];
        TankGeometry g{};
        g.enabled = c.enabled;
        g.sensorHeightMm = (c.sensorHeightMm > 0) ? (uint32_t)c.sensorHeightMm : 0U;
        g.minimumLevelMm = (c.minimumLevelMm > 0) ? (uint32_t)c.minimumLevelMm : 0U;
        g.trigPin = c.trigPin;
        g.echoPin = c.echoPin;
        g.capacityL = (c.capacityL > 0) ? (uint32_t)c.capacityL : 0U;
        aggregator_.defineTank(i, g);
    }
}

void TankLevelModule::onEventStatic_(const Event& e, void* user)
{
    TankLevelModule* self = static_cast<TankLevelModule*>(user);
    if (!self || e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = eventPayload<ConfigChangedPayload>(e);
    if (p) self->onConfigChanged_(p->nvsKey);
}

void TankLevelModule::onConfigChanged_(const char* nvsKey)
{
    if (!nvsKey || strncmp(nvsKey, "tk", 2) != 0) return;
    xSemaphoreTake(mutex_, portMAX_DELAY);
    syncGeometry_();
    xSemaphoreGive(mutex_);
    LOGI("Tank geometry reloaded (%s)", nvsKey);
}

void TankLevelModule::loop()
{
    if (!ready_) return;

    const uint32_t now = millis();
    if (sampledOnce_ && (uint32_t)(now - lastSampleMs_) < IrrigationDefaults::TankSampleMs) return;
    sampledOnce_ = true;
    lastSampleMs_ = now;
    startMeasurements_(now);
}

void TankLevelModule::startMeasurements_(uint32_t nowMs)
{
    xSemaphoreTake(mutex_, portMAX_DELAY);
    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        if (!aggregator_.measurable(i)) continue;

        if (!claimMeasurement_(i)) {
            LOGW("Tank %u previous measurement still running, skipped", (unsigned)i);
            continue;
        }

        const TankGeometry* g = aggregator_.geometry(i);
        MeasureJob& job = jobs_[i];
        job.self = this;
        job.tankId = i;
        job.trigPin = g->trigPin;
        job.echoPin = g->echoPin;

        char name[12];
        snprintf(name, sizeof(name), "tankm%u", (unsigned)i);
        if (xTaskCreate(measureTask_, name, Limits::Tank::MeasureStackSize, &job, 1, nullptr) != pdPASS) {
            releaseMeasurement_(i);
            LOGE("Tank %u measurement task creation failed", (unsigned)i);
        }
    }
    xSemaphoreGive(mutex_);
    (void)nowMs;
}

bool TankLevelModule::claimMeasurement_(uint8_t tankId)
{
    bool claimed = false;
    portENTER_CRITICAL(&inFlightMux_);
    if (!inFlight_[tankId]) {
        inFlight_[tankId] = true;
        claimed = true;
    }
    portEXIT_CRITICAL(&inFlightMux_);
    return claimed;
}

void TankLevelModule::releaseMeasurement_(uint8_t tankId)
{
    portENTER_CRITICAL(&inFlightMux_);
    inFlight_[tankId] = false;
    portEXIT_CRITICAL(&inFlightMux_);
}

TankReadingStatus TankLevelModule::measure_(uint8_t trigPin, uint8_t echoPin, float& outMm) const
{
    float sum = 0.0f;
    for (uint8_t r = 0; r < IrrigationDefaults::UsonicReadings; ++r) {
        float mm = 0.0f;
        const IoDistanceStatus st = ioSvc_->measureDistance(ioSvc_->ctx, trigPin, echoPin, &mm);
        if (st == IO_DIST_OUT_OF_RANGE) return TankReadingStatus::OutOfRange;
        if (st != IO_DIST_OK) return TankReadingStatus::NoReading;
        sum += mm;
        if (r + 1 < IrrigationDefaults::UsonicReadings) vTaskDelay(pdMS_TO_TICKS(60));
    }
    outMm = sum / (float)IrrigationDefaults::UsonicReadings;
    return TankReadingStatus::Ok;
}

void TankLevelModule::measureTask_(void* arg)
{
    MeasureJob* job = static_cast<MeasureJob*>(arg);
    TankLevelModule* self = job ? job->self : nullptr;
    if (self) {
        TankDistancePayload p{};
        p.tankId = job->tankId;
        p.distanceMm = 0.0f;
        p.status = self->measure_(job->trigPin, job->echoPin, p.distanceMm);
        p.tsMs = millis();

        if (p.status != TankReadingStatus::Ok) {
            LOGW("Tank %u: %s", (unsigned)p.tankId,
                 p.status == TankReadingStatus::OutOfRange ? "distance out of range" : "no echo");
        }
        if (!self->eventBus_->post(EventId::TankDistanceMeasured, &p, sizeof(p))) {
            LOGW("Tank %u reading dropped (event queue full)", (unsigned)p.tankId);
        }
        self->releaseMeasurement_(job->tankId);
    }
    vTaskDelete(nullptr);
}

bool TankLevelModule::cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    TankLevelModule* self = static_cast<TankLevelModule*>(userCtx);
    if (!self) return false;
    return self->handleStatus_(req, reply, replyLen);
}

bool TankLevelModule::handleStatus_(const CommandRequest& req, char* reply, size_t replyLen)
{
    if (!mutex_) {
        writeCmdError_(reply, replyLen, "tanklevel.status", ErrorCode::NotReady);
        return false;
    }

    int16_t onlyTank = -1;
    JsonObjectConst args;
    if (parseCmdArgsObject_(req, args) && args.containsKey("tank")) {
        if (!args["tank"].is<uint8_t>() || args["tank"].as<uint8_t>() >= MAX_TANKS) {
            writeCmdError_(reply, replyLen, "tanklevel.status", ErrorCode::UnknownTank);
            return false;
        }
        onlyTank = args["tank"].as<uint8_t>();
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);
    const bool ok = buildStatus_(onlyTank, reply, replyLen);
    xSemaphoreGive(mutex_);

    if (!ok) {
        writeCmdError_(reply, replyLen, "tanklevel.status", ErrorCode::Failed);
        return false;
    }
    return true;
}

bool TankLevelModule::buildStatus_(int16_t onlyTank, char* out, size_t outLen)
{
    StaticJsonDocument<768> doc;
    doc["ok"] = true;

    float aggregate = 0.0f;
    uint8_t reporting = 0;
    if (aggregator_.aggregatePercent(aggregate, &reporting)) {
        doc["percent"] = aggregate;
    } else {
        doc["percent"] = nullptr;
    }
    doc["reporting"] = reporting;

    JsonArray tanks = doc.createNestedArray("tanks");
    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        if (onlyTank >= 0 && i != (uint8_t)onlyTank) continue;
        TankSnapshot s;
        if (!aggregator_.snapshot(i, s)) continue;
        if (onlyTank < 0 && !s.enabled) continue;

        JsonObject t = tanks.createNestedObject();
        t["id"] = s.id;
        t["enabled"] = s.enabled;
        t["valid"] = s.valid;
        if (s.hasReading) {
            t["level_mm"] = (int32_t)(s.levelMm + 0.5f);
            t["percent"] = s.percent;
            t["age_s"] = (uint32_t)((millis() - s.lastReadingMs) / 1000U);
        } else {
            t["level_mm"] = nullptr;
            t["percent"] = nullptr;
        }
        t["failed"] = s.failedReadings;
        t["capacity_l"] = cfg_[i].capacityL;
    }

    if (doc.overflowed()) return false;
    if (measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}
