/**
 * @file IOModule.cpp
 * @brief Implementation file.
 */

#include "IOModule.h"
#include "Domain/IrrigationDefaults.h"
#define LOG_TAG "IOModule"
#include "Core/ModuleLog.h"
#include <Arduino.h>

namespace {

class MutexGuard {
public:
    explicit MutexGuard(SemaphoreHandle_t m) : m_(m) { if (m_) xSemaphoreTake(m_, portMAX_DELAY); }
    ~MutexGuard() { if (m_) xSemaphoreGive(m_); }
    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;
private:
    SemaphoreHandle_t m_;
};

}  // namespace

bool IOModule::svcOpenRelay_(void* ctx, uint8_t pin)
{
    IOModule* self = static_cast<IOModule*>(ctx);
    return self ? self->writeRelay_(pin, true) : false;
}

bool IOModule::svcCloseRelay_(void* ctx, uint8_t pin)
{
    IOModule* self = static_cast<IOModule*>(ctx);
    return self ? self->writeRelay_(pin, false) : false;
}

bool IOModule::svcPollDigitalInput_(void* ctx, uint8_t pin, IoEdgeCallback onEdge, void* edgeCtx)
{
    IOModule* self = static_cast<IOModule*>(ctx);
    if (!self || !onEdge || !pinValid_(pin)) return false;

    MutexGuard lock(self->mutex_);
    if (self->relays_[pin]) {
        LOGW("Pin %u already drives a relay, cannot poll it", (unsigned)pin);
        return false;
    }
    if (!self->inputs_[pin]) {
        GpioDriver* drv = new GpioDriver("pulse_in", pin, false, true, GpioDriver::PullUp);
        drv->begin();
        self->inputs_[pin] = drv;
    }
    attachInterruptArg(digitalPinToInterrupt(pin), onEdge, edgeCtx, FALLING);
    LOGI("Pulse input attached on GPIO%u", (unsigned)pin);
    return true;
}

IoDistanceStatus IOModule::svcMeasureDistance_(void* ctx, uint8_t trigPin, uint8_t echoPin, float* outMm)
{
    IOModule* self = static_cast<IOModule*>(ctx);
    if (!self || !outMm) return IO_DIST_BAD_PIN;
    if (!pinValid_(trigPin) || !pinValid_(echoPin) || trigPin == echoPin) return IO_DIST_BAD_PIN;

    UltrasonicDriver* drv = self->rangerDriver_(trigPin, echoPin);
    if (!drv) return IO_DIST_BAD_PIN;

    // Each ranger is owned by one tank task; the measurement itself runs unlocked.
    float mm = 0.0f;
    IODistanceResult r = drv->measure(mm);
    if (r == IODistanceResult::NoEcho) return IO_DIST_NO_ECHO;
    *outMm = mm;
    return (r == IODistanceResult::Ok) ? IO_DIST_OK : IO_DIST_OUT_OF_RANGE;
}

bool IOModule::writeRelay_(uint8_t pin, bool on)
{
    if (!pinValid_(pin)) return false;
    MutexGuard lock(mutex_);
    GpioDriver* drv = relayDriver_(pin);
    if (!drv) return false;
    if (!drv->write(on)) {
        LOGE("Relay write failed on GPIO%u", (unsigned)pin);
        return false;
    }
    LOGD("Relay GPIO%u %s", (unsigned)pin, on ? "on" : "off");
    return true;
}

GpioDriver* IOModule::relayDriver_(uint8_t pin)
{
    if (relays_[pin]) return relays_[pin];
    if (inputs_[pin]) {
        LOGW("Pin %u is a pulse input, cannot drive a relay", (unsigned)pin);
        return nullptr;
    }
    GpioDriver* drv = new GpioDriver("relay", pin, true, cfgData_.relayActiveHigh);
    drv->begin();
    relays_[pin] = drv;
    return drv;
}

UltrasonicDriver* IOModule::rangerDriver_(uint8_t trigPin, uint8_t echoPin)
{
    MutexGuard lock(mutex_);
    for (uint8_t i = 0; i < MAX_RANGERS; ++i) {
        UltrasonicDriver* r = rangers_[i];
        if (r && r->trigPin() == trigPin && r->echoPin() == echoPin) return r;
    }
    for (uint8_t i = 0; i < MAX_RANGERS; ++i) {
        if (rangers_[i]) continue;
        UltrasonicDriverConfig c{};
        c.trigPin = trigPin;
        c.echoPin = echoPin;
        c.echoTimeoutUs = (cfgData_.echoTimeoutUs < 1000) ? 1000 : (uint32_t)cfgData_.echoTimeoutUs;
        c.minRangeMm = IrrigationDefaults::UsonicMinRangeMm;
        c.maxRangeMm = IrrigationDefaults::UsonicMaxRangeMm;
        rangers_[i] = new UltrasonicDriver("usonic", c);
        rangers_[i]->begin();
        LOGI("Ultrasonic ranger trig=GPIO%u echo=GPIO%u", (unsigned)trigPin, (unsigned)echoPin);
        return rangers_[i];
    }
    LOGW("No free ranger slot for trig=GPIO%u", (unsigned)trigPin);
    return nullptr;
}

void IOModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgData_.echoTimeoutUs = (int32_t)IrrigationDefaults::UsonicEchoTimeoutUs;

    cfg.registerVar(relayActiveHighVar_);
    cfg.registerVar(echoTimeoutVar_);

    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        LOGE("I/O mutex allocation failed");
        return;
    }
    if (!services.add("io", &ioSvc_)) {
        LOGE("service registration failed: io");
        return;
    }
    LOGI("I/O service registered");
}
