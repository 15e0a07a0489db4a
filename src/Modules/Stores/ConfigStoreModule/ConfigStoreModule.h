#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service and `config.*` commands.
 */
#include "Core/ModulePassive.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring ConfigStore JSON services.
 */
class ConfigStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "config"; }

    /** @brief Config module depends on log hub and command service. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    /** @brief Register config services and commands. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* registry_ = nullptr;
    ConfigStoreService svc_{ svcApplyJson_, svcToJson_, svcToJsonModule_, svcListModules_, svcErase_, nullptr };

    static bool svcApplyJson_(void* ctx, const char* json);
    static bool svcToJson_(void* ctx, char* out, size_t outLen);
    static bool svcToJsonModule_(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    static uint8_t svcListModules_(void* ctx, const char** out, uint8_t max);
    static bool svcErase_(void* ctx);

    static bool cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
