#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"

/**
 * @brief Passive module that runs its own task draining the log hub.
 */
class LogDispatcherModule : public ModulePassive {
public:
    const char* moduleId() const override { return "log.dispatcher"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Start dispatcher task and wire sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void taskFn_(void* pv);

    LogHub* hub_ = nullptr;
    const LogSinkRegistryService* sinkReg_ = nullptr;
};
