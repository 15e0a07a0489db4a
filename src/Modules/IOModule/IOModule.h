#pragma once
/**
 * @file IOModule.h
 * @brief Hardware access module: relay outputs, pulse inputs, ultrasonic rangers.
 *
 * Drivers are created lazily per pin on first use and kept for the lifetime
 * of the firmware. The driver table is guarded by a mutex because tank
 * measurement tasks and the irrigation task call in concurrently.
 */

#include "Core/ModulePassive.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Board/BoardPinMap.h"
#include "Modules/IOModule/IODrivers/GpioDriver.h"
#include "Modules/IOModule/IODrivers/UltrasonicDriver.h"

#include "freertos/semphr.h"

struct IOModuleConfig {
    bool relayActiveHigh = Board::Relay::ActiveHigh;
    int32_t echoTimeoutUs = 30000;
};

class IOModule : public ModulePassive {
public:
    const char* moduleId() const override { return "io"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static bool svcOpenRelay_(void* ctx, uint8_t pin);
    static bool svcCloseRelay_(void* ctx, uint8_t pin);
    static bool svcPollDigitalInput_(void* ctx, uint8_t pin, IoEdgeCallback onEdge, void* edgeCtx);
    static IoDistanceStatus svcMeasureDistance_(void* ctx, uint8_t trigPin, uint8_t echoPin, float* outMm);

    bool writeRelay_(uint8_t pin, bool on);
    GpioDriver* relayDriver_(uint8_t pin);
    UltrasonicDriver* rangerDriver_(uint8_t trigPin, uint8_t echoPin);
    static bool pinValid_(uint8_t pin) { return pin != IO_PIN_NONE && pin <= Board::MaxGpio; }

    static constexpr uint8_t MAX_RANGERS = Limits::Tank::MaxTanks;

    IOModuleConfig cfgData_{};
    SemaphoreHandle_t mutex_ = nullptr;

    GpioDriver* relays_[Board::MaxGpio + 1] = {nullptr};
    GpioDriver* inputs_[Board::MaxGpio + 1] = {nullptr};
    UltrasonicDriver* rangers_[MAX_RANGERS] = {nullptr};

    IOService ioSvc_{ svcOpenRelay_, svcCloseRelay_, svcPollDigitalInput_, svcMeasureDistance_, this };

    ConfigVariable<bool> relayActiveHighVar_ {
        NVS_KEY(NvsKeys::Io::RelayActiveHigh),"relay_active_high","io",ConfigType::Bool,
        &cfgData_.relayActiveHigh,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> echoTimeoutVar_ {
        NVS_KEY(NvsKeys::Io::EchoTimeoutUs),"echo_timeout_us","io",ConfigType::Int32,
        &cfgData_.echoTimeoutUs,ConfigPersistence::Persistent,0
    };
};
