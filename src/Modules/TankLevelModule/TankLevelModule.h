#pragma once
/**
 * @file TankLevelModule.h
 * @brief Periodic ultrasonic sampling of the water tanks.
 *
 * Every TankSampleMs the module spawns one short-lived measurement task per
 * configured tank. Raw distances come back through the event bus and are
 * turned into levels by TankLevelAggregator under the module mutex.
 */

#include "Core/Module.h"
#include "Core/ConfigTypes.h"
#include "Core/CommandRegistry.h"
#include "Core/EventBus/GuardedEventChannel.h"
#include "Core/Services/Services.h"
#include "Modules/TankLevelModule/TankLevel.h"

#include "freertos/semphr.h"

/** @brief Persisted tank settings (config layer view of TankGeometry). */
struct TankConfig {
    bool enabled = false;
    int32_t sensorHeightMm = 0;
    int32_t minimumLevelMm = 0;
    uint8_t trigPin = IO_PIN_NONE;
    uint8_t echoPin = IO_PIN_NONE;
    int32_t capacityL = 0;
};

class TankLevelModule : public Module {
public:
    const char* moduleId() const override { return "tanklevel"; }
    const char* taskName() const override { return "tanklevel"; }
    BaseType_t taskCore() const override { return 0; }
    uint32_t loopDelayMs() const override { return 1000; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "cmd";
        if (i == 3) return "io";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    static constexpr uint8_t MAX_TANKS = Limits::Tank::MaxTanks;

    struct MeasureJob {
        TankLevelModule* self = nullptr;
        uint8_t tankId = 0;
        uint8_t trigPin = IO_PIN_NONE;
        uint8_t echoPin = IO_PIN_NONE;
    };

    static void measureTask_(void* arg);
    bool claimMeasurement_(uint8_t tankId);
    void releaseMeasurement_(uint8_t tankId);
    static void onEventStatic_(const Event& e, void* user);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    void onConfigChanged_(const char* nvsKey);
    void syncGeometry_();
    void startMeasurements_(uint32_t nowMs);
    TankReadingStatus measure_(uint8_t trigPin, uint8_t echoPin, float& outMm) const;
    bool handleStatus_(const CommandRequest& req, char* reply, size_t replyLen);
    bool buildStatus_(int16_t onlyTank, char* out, size_t outLen);

    const CommandService* cmdSvc_ = nullptr;
    const IOService* ioSvc_ = nullptr;
    EventChannel* eventBus_ = nullptr;

    SemaphoreHandle_t mutex_ = nullptr;
    GuardedEventChannel guarded_{};
    TankLevelAggregator aggregator_{};

    TankConfig cfg_[MAX_TANKS]{};
    MeasureJob jobs_[MAX_TANKS]{};
    bool inFlight_[MAX_TANKS]{};
    portMUX_TYPE inFlightMux_ = portMUX_INITIALIZER_UNLOCKED;
    uint32_t lastSampleMs_ = 0;
    bool sampledOnce_ = false;
    bool ready_ = false;

    char nvsEnabledKey_[MAX_TANKS][16]{};
    char nvsHeightKey_[MAX_TANKS][16]{};
    char nvsMinLevelKey_[MAX_TANKS][16]{};
    char nvsTrigKey_[MAX_TANKS][16]{};
    char nvsEchoKey_[MAX_TANKS][16]{};
    char nvsCapacityKey_[MAX_TANKS][16]{};
    char cfgModuleName_[MAX_TANKS][16]{};

    ConfigVariable<bool> cfgEnabledVar_[MAX_TANKS]{};
    ConfigVariable<int32_t> cfgHeightVar_[MAX_TANKS]{};
    ConfigVariable<int32_t> cfgMinLevelVar_[MAX_TANKS]{};
    ConfigVariable<uint8_t> cfgTrigVar_[MAX_TANKS]{};
    ConfigVariable<uint8_t> cfgEchoVar_[MAX_TANKS]{};
    ConfigVariable<int32_t> cfgCapacityVar_[MAX_TANKS]{};
};
