#pragma once
/**
 * @file IrrigationModule.h
 * @brief Zone scheduling, flow metering and leak detection module.
 *
 * Owns the irrigation core (zone controller, valves, flow sampler, leak
 * detector, power scheduler, request debouncer) and serializes every entry
 * into it with one mutex: the module task, event callbacks (through
 * GuardedEventChannel), command handlers and IrrigationService calls.
 */

#include "Core/Module.h"
#include "Core/ConfigTypes.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/GuardedEventChannel.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Board/BoardPinMap.h"
#include "Domain/IrrigationDefaults.h"
#include "Modules/IrrigationModule/FlowSampler.h"
#include "Modules/IrrigationModule/LeakDetector.h"
#include "Modules/IrrigationModule/PowerScheduler.h"
#include "Modules/IrrigationModule/RequestDebouncer.h"
#include "Modules/IrrigationModule/ZoneController.h"

#include "freertos/semphr.h"

/** @brief System-wide irrigation settings. */
struct IrrigationConfig {
    bool power = true;
    int32_t pauseUntil = 0;            // epoch seconds, 0 = no pause
    int32_t maxRuntimeSec = IrrigationDefaults::MaxRuntimeSec;
    uint8_t maxActive = IrrigationDefaults::MaxActiveZones;
    uint8_t flowPin = Board::DI::FlowPulse;
    float flowFactor = IrrigationDefaults::DefaultFlowFactor;
    bool leakEnabled = true;
    int32_t utcOffsetSec = 0;
};

/** @brief Persisted zone settings. */
struct ZoneConfig {
    char name[Limits::Irrigation::ZoneNameLen] = {0};
    bool enabled = false;
    int32_t runtimeSec = IrrigationDefaults::DefaultZoneRuntimeSec;
    char pins[Limits::Irrigation::ZonePinsLen] = {0};
};

class IrrigationModule : public Module {
public:
    const char* moduleId() const override { return "irrigation"; }
    const char* taskName() const override { return "irrigation"; }
    BaseType_t taskCore() const override { return 1; }
    uint16_t taskStackSize() const override { return Limits::Irrigation::TaskStackSize; }
    uint32_t loopDelayMs() const override { return 50; }

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
    static constexpr uint8_t MAX_ZONES = Limits::Irrigation::MaxZones;

    class Lock {
    public:
        explicit Lock(SemaphoreHandle_t m) : m_(m) { xSemaphoreTake(m_, portMAX_DELAY); }
        ~Lock() { xSemaphoreGive(m_); }
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
    private:
        SemaphoreHandle_t m_;
    };

    // Setup
    void registerZoneVars_(ConfigStore& cfg);
    void defineZones_(uint32_t nowMs);
    bool buildZoneDefinition_(uint8_t zoneId, ZoneDefinition& out) const;
    void startFlowMetering_(uint32_t nowMs);
    void registerCommands_();

    // Event side
    static void onEventStatic_(const Event& e, void* user);
    void onZoneConfigChanged_(const ZoneConfigPayload& p);
    void onPowerChanged_();
    void onConfigChanged_(const char* nvsKey);
    void resyncZone_(uint8_t zoneId);
    void resyncSystem_(const char* nvsKey);

    // Shutdown
    static void shutdownHandler_();
    void shutdown_();

    // Service entry points
    static bool svcRequestZone_(void* ctx, uint8_t zoneId, bool on);
    static bool svcRequestSystem_(void* ctx, bool on, bool fromSwitch);
    static bool svcActivateZone_(void* ctx, uint8_t zoneId);
    static bool svcDeactivateZone_(void* ctx, uint8_t zoneId);
    static bool svcSetPower_(void* ctx, bool on);
    static bool svcSetPause_(void* ctx, uint32_t untilEpochSec);
    static bool svcRenameZone_(void* ctx, uint8_t zoneId, const char* name);
    static bool svcSetZoneEnabled_(void* ctx, uint8_t zoneId, bool enabled);
    static bool svcSetZoneRuntime_(void* ctx, uint8_t zoneId, uint32_t seconds);
    static bool svcBuildSnapshot_(void* ctx, char* out, size_t outLen);

    // Commands
    static bool cmdZoneActivate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdZoneDeactivate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdZoneRequest_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSystemRequest_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdPowerSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdPauseSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdZoneRename_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdZoneEnable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdZoneRuntime_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    bool handleZoneActivate_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleZoneDeactivate_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleZoneRequest_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleSystemRequest_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handlePowerSet_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handlePauseSet_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleZoneRename_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleZoneEnable_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleZoneRuntime_(const CommandRequest& req, char* reply, size_t replyLen);
    bool handleStatus_(char* reply, size_t replyLen);

    // Core operations, mutex held by the caller
    bool activateLocked_(uint8_t zoneId, uint32_t nowMs, ErrorCode& err);
    bool deactivateLocked_(uint8_t zoneId, uint32_t nowMs, ErrorCode& err);
    bool setPauseLocked_(uint32_t untilEpochSec, uint32_t nowMs, ErrorCode& err);
    bool renameLocked_(uint8_t zoneId, const char* name, ErrorCode& err);
    bool setEnabledLocked_(uint8_t zoneId, bool enabled, uint32_t nowMs, ErrorCode& err);
    bool setRuntimeLocked_(uint8_t zoneId, uint32_t seconds, ErrorCode& err);

    static uint32_t nowEpoch_();

    static IrrigationModule* shutdownInstance_;

    ConfigStore* cfgStore_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const IOService* ioSvc_ = nullptr;
    EventChannel* eventBus_ = nullptr;

    SemaphoreHandle_t mutex_ = nullptr;
    GuardedEventChannel guarded_{};

    ZoneController zones_{};
    FlowSampler flow_{};
    LeakDetector leak_{};
    PowerScheduler power_{zones_};
    RequestDebouncer debouncer_{zones_, power_};

    bool ready_ = false;
    bool flowActive_ = false;
    bool leakActive_ = false;
    uint32_t lastPauseCheckMs_ = 0;

    IrrigationConfig cfgData_{};
    ZoneConfig zoneCfg_[MAX_ZONES]{};

    IrrigationService irrigationSvc_{
        svcRequestZone_, svcRequestSystem_, svcActivateZone_, svcDeactivateZone_,
        svcSetPower_, svcSetPause_, svcRenameZone_, svcSetZoneEnabled_,
        svcSetZoneRuntime_, svcBuildSnapshot_, this
    };

    ConfigVariable<bool> powerVar_ {
        NVS_KEY(NvsKeys::Irrigation::Power),"power","irrigation",ConfigType::Bool,
        &cfgData_.power,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> pauseUntilVar_ {
        NVS_KEY(NvsKeys::Irrigation::PauseUntil),"pause_until","irrigation",ConfigType::Int32,
        &cfgData_.pauseUntil,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> maxRuntimeVar_ {
        NVS_KEY(NvsKeys::Irrigation::MaxRuntime),"max_runtime_s","irrigation",ConfigType::Int32,
        &cfgData_.maxRuntimeSec,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t> maxActiveVar_ {
        NVS_KEY(NvsKeys::Irrigation::MaxActive),"max_active","irrigation",ConfigType::UInt8,
        &cfgData_.maxActive,ConfigPersistence::Persistent,0
    };
    ConfigVariable<uint8_t> flowPinVar_ {
        NVS_KEY(NvsKeys::Irrigation::FlowPin),"flow_pin","irrigation",ConfigType::UInt8,
        &cfgData_.flowPin,ConfigPersistence::Persistent,0
    };
    ConfigVariable<float> flowFactorVar_ {
        NVS_KEY(NvsKeys::Irrigation::FlowFactor),"flow_lpm_per_hz","irrigation",ConfigType::Float,
        &cfgData_.flowFactor,ConfigPersistence::Persistent,0
    };
    ConfigVariable<bool> leakEnabledVar_ {
        NVS_KEY(NvsKeys::Irrigation::LeakEnabled),"leak_enabled","irrigation",ConfigType::Bool,
        &cfgData_.leakEnabled,ConfigPersistence::Persistent,0
    };
    ConfigVariable<int32_t> utcOffsetVar_ {
        NVS_KEY(NvsKeys::Irrigation::UtcOffset),"utc_offset_s","irrigation",ConfigType::Int32,
        &cfgData_.utcOffsetSec,ConfigPersistence::Persistent,0
    };

    char cfgZoneModuleName_[MAX_ZONES][12]{};
    char nvsZoneNameKey_[MAX_ZONES][16]{};
    char nvsZoneEnabledKey_[MAX_ZONES][16]{};
    char nvsZoneRuntimeKey_[MAX_ZONES][16]{};
    char nvsZonePinsKey_[MAX_ZONES][16]{};

    ConfigVariable<char> zoneNameVar_[MAX_ZONES]{};
    ConfigVariable<bool> zoneEnabledVar_[MAX_ZONES]{};
    ConfigVariable<int32_t> zoneRuntimeVar_[MAX_ZONES]{};
    ConfigVariable<char> zonePinsVar_[MAX_ZONES]{};
};
