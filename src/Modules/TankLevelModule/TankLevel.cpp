/**
 * @file TankLevel.cpp
 * @brief Implementation file.
 */
#include "TankLevel.h"
#include "Domain/IrrigationDefaults.h"
#define LOG_TAG "TankLvl"
#include "Core/ModuleLog.h"
#include <math.h>

using IrrigationDefaults::UsonicMaxRangeMm;
using IrrigationDefaults::UsonicMinRangeMm;

static float clampf_(float v, float lo, float hi)
{
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

static float scale_(float v, float srcMin, float srcMax, float dstMin, float dstMax)
{
    v = clampf_(v, srcMin, srcMax);
    return (v - srcMin) * (dstMax - dstMin) / (srcMax - srcMin) + dstMin;
}

static bool sameGeometry_(const TankGeometry& a, const TankGeometry& b)
{
    return a.enabled == b.enabled && a.sensorHeightMm == b.sensorHeightMm &&
           a.minimumLevelMm == b.minimumLevelMm && a.trigPin == b.trigPin &&
           a.echoPin == b.echoPin;
}

bool tankGeometryValid(const TankGeometry& g)
{
    if (!g.enabled) return false;
    if (g.trigPin == IO_PIN_NONE || g.echoPin == IO_PIN_NONE) return false;
    if (g.sensorHeightMm == 0 || g.minimumLevelMm >= g.sensorHeightMm) return false;
    const float usable = (float)(g.sensorHeightMm - g.minimumLevelMm);
    return usable > UsonicMinRangeMm;
}

bool computeTankLevel(const TankGeometry& g, float distanceMm, TankLevelResult& out)
{
    if (!tankGeometryValid(g)) return false;
    if (isnan(distanceMm)) return false;

    float d = clampf_(distanceMm, UsonicMinRangeMm, UsonicMaxRangeMm);
    if (d > (float)g.sensorHeightMm) d = (float)g.sensorHeightMm;

    const float usable = (float)(g.sensorHeightMm - g.minimumLevelMm);
    out.levelMm = usable - scale_(d, UsonicMinRangeMm, usable, 0.0f, usable);
    out.percent = clampf_(out.levelMm / usable * 100.0f, 0.0f, 100.0f);
    return true;
}

bool TankLevelAggregator::attach()
{
    if (!bus_) return false;
    return bus_->subscribe(EventId::TankDistanceMeasured, &TankLevelAggregator::onEventStatic_, this);
}

bool TankLevelAggregator::defineTank(uint8_t tankId, const TankGeometry& g)
{
    if (tankId >= MAX_TANKS) return false;
    Tank& t = tanks_[tankId];
    if (!sameGeometry_(t.geo, g)) {
        t.hasReading = false;
        t.last = TankLevelResult{};
        t.failed = 0;
    }
    t.geo = g;

    if (g.enabled && !tankGeometryValid(g)) {
        LOGW("Tank %u geometry incomplete (h=%lu min=%lu trig=%u echo=%u), not measured",
             (unsigned)tankId, (unsigned long)g.sensorHeightMm, (unsigned long)g.minimumLevelMm,
             (unsigned)g.trigPin, (unsigned)g.echoPin);
    }
    return true;
}

const TankGeometry* TankLevelAggregator::geometry(uint8_t tankId) const
{
    if (tankId >= MAX_TANKS) return nullptr;
    return &tanks_[tankId].geo;
}

bool TankLevelAggregator::measurable(uint8_t tankId) const
{
    return tankId < MAX_TANKS && tankGeometryValid(tanks_[tankId].geo);
}

bool TankLevelAggregator::onDistance(const TankDistancePayload& p)
{
    if (p.tankId >= MAX_TANKS) return false;
    Tank& t = tanks_[p.tankId];
    if (!tankGeometryValid(t.geo)) return false;

    if (p.status != TankReadingStatus::Ok) {
        t.failed++;
        LOGD("Tank %u reading skipped (%s)", (unsigned)p.tankId,
             p.status == TankReadingStatus::OutOfRange ? "out of range" : "no reading");
        return false;
    }

    TankLevelResult r;
    if (!computeTankLevel(t.geo, p.distanceMm, r)) return false;

    t.last = r;
    t.hasReading = true;
    t.lastReadingMs = p.tsMs;

    if (bus_) {
        TankLevelPayload lp{};
        lp.tankId = p.tankId;
        lp.levelMm = r.levelMm;
        lp.percent = r.percent;
        bus_->post(EventId::TankLevelChanged, &lp, sizeof(lp));

        TankAggregatePayload ap{};
        if (aggregatePercent(ap.percent, &ap.tanksReporting)) {
            bus_->post(EventId::TankAggregateChanged, &ap, sizeof(ap));
        }
    }
    return true;
}

bool TankLevelAggregator::aggregatePercent(float& out, uint8_t* reporting) const
{
    float sum = 0.0f;
    uint8_t n = 0;
    for (uint8_t i = 0; i < MAX_TANKS; ++i) {
        const Tank& t = tanks_[i];
        if (!t.hasReading || !tankGeometryValid(t.geo)) continue;
        sum += t.last.percent;
        n++;
    }
    if (reporting) *reporting = n;
    if (n == 0) return false;
    out = clampf_(sum, 0.0f, 100.0f);
    return true;
}

bool TankLevelAggregator::snapshot(uint8_t tankId, TankSnapshot& out) const
{
    if (tankId >= MAX_TANKS) return false;
    const Tank& t = tanks_[tankId];
    out = TankSnapshot{};
    out.id = tankId;
    out.enabled = t.geo.enabled;
    out.valid = tankGeometryValid(t.geo);
    out.hasReading = t.hasReading;
    out.levelMm = t.last.levelMm;
    out.percent = t.last.percent;
    out.lastReadingMs = t.lastReadingMs;
    out.failedReadings = t.failed;
    return true;
}

void TankLevelAggregator::onEventStatic_(const Event& e, void* user)
{
    TankLevelAggregator* self = static_cast<TankLevelAggregator*>(user);
    if (!self || e.id != EventId::TankDistanceMeasured) return;
    const TankDistancePayload* p = eventPayload<TankDistancePayload>(e);
    if (p) self->onDistance(*p);
}
