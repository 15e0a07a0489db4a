#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"
#include "Core/SystemLimits.h"

/**
 * @brief Registers modules, resolves dependencies, and starts tasks.
 *
 * Boot order: init() in dependency order, core service wiring, persistent
 * config load, onConfigLoaded() in the same order, then task start.
 */
class ModuleManager {
public:
    bool add(Module* m);
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

    uint8_t getCount() const { return count_; }
    Module* getModule(uint8_t idx) const {
        if (idx >= count_) return nullptr;
        return modules_[idx];
    }

private:
    Module* modules_[Limits::MaxModules] = {};
    uint8_t count_ = 0;

    Module* ordered_[Limits::MaxModules] = {};
    uint8_t orderedCount_ = 0;

    Module* findById_(const char* id);
    bool buildInitOrder_();
    void wireCoreServices_(ServiceRegistry& services, ConfigStore& config);
};
