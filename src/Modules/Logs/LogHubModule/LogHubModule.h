#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 *
 * Must be the first module: every other module logs through it.
 */
class LogHubModule : public ModulePassive {
public:
    const char* moduleId() const override { return "loghub"; }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    LogHub hub_;
    LogHubService hubSvc_{};

    LogSinkRegistry sinks_;
    LogSinkRegistryService sinksSvc_{};
};
