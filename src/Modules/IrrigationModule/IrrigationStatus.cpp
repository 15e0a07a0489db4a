/**
 * @file IrrigationStatus.cpp
 * @brief Implementation file.
 */
#include "IrrigationStatus.h"
#include "FlowSampler.h"
#include "LeakDetector.h"
#include "PowerScheduler.h"
#include "ZoneController.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>

bool buildIrrigationStatusJson(const ZoneController& zones, const PowerScheduler& power,
                               const LeakDetector* leak, const FlowSampler* flow,
                               char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    static StaticJsonDocument<Limits::Irrigation::StatusJsonBuf> doc;
    doc.clear();

    doc["ok"] = true;
    doc["power"] = power.powered();
    doc["pause_until"] = power.pauseUntil();
    doc["max_active"] = zones.maxActive();
    doc["max_runtime_s"] = zones.maxRuntimeSec();
    doc["active"] = zones.activeCount();

    if (leak) doc["leak"] = leak->leak();
    else doc["leak"] = nullptr;

    if (flow && flow->started()) {
        doc["flow_lpm"] = flow->lastRateLpm();
        doc["water_total_l"] = flow->totalVolumeL();
    } else {
        doc["flow_lpm"] = nullptr;
        doc["water_total_l"] = nullptr;
    }

    JsonArray arr = doc.createNestedArray("zones");
    for (uint8_t i = 0; i < ZoneController::MAX_ZONES; ++i) {
        ZoneSnapshot s;
        if (!zones.snapshot(i, s) || !s.defined) continue;

        JsonObject z = arr.createNestedObject();
        z["id"] = s.id;
        z["name"] = s.name;  // char* is copied into the document
        z["enabled"] = s.enabled;
        z["active"] = s.active;
        z["runtime_s"] = s.runtimeSec;
        z["valves"] = s.valveCount;
        if (s.active) {
            z["remaining_s"] = s.remainingSec;
            z["open_valve"] = s.openValve;
            z["water_l"] = s.sessionWaterL;
        }
    }

    if (doc.overflowed()) return false;
    if (measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}
