#pragma once
/**
 * @file SystemModule.h
 * @brief System command module (ping/reboot/factory reset) and log level.
 */
#include "Core/ModulePassive.h"
#include "Core/CommandRegistry.h"
#include "Core/ConfigTypes.h"
#include "Core/EventBus/EventBus.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module that registers system commands.
 */
class SystemModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "system"; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "config";
        if (i == 3) return "eventbus";
        return nullptr;
    }

    /** @brief Register system commands and the log level variable. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    const CommandService* cmdSvc_ = nullptr;
    const ConfigStoreService* cfgSvc_ = nullptr;
    const EventBusService* eventBusSvc_ = nullptr;

    // 0=debug 1=info 2=warn 3=error
    uint8_t logLevel_ = 1;
    ConfigVariable<uint8_t> logLevelVar_ {
        NVS_KEY(NvsKeys::System::LogLevel),"log_level","system",ConfigType::UInt8,
        &logLevel_,ConfigPersistence::Persistent,0
    };

    void applyLogLevel_();
    static void onEventStatic_(const Event& e, void* user);

    static bool cmdPing_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdReboot_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdFactoryReset_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
