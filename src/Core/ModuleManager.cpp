/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include <Arduino.h>
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count_ >= Limits::MaxModules) {
        Serial.printf("[MOD][ERR] cannot add module (count=%u)\n", (unsigned)count_);
        return false;
    }
    modules_[count_++] = m;
    return true;
}

Module* ModuleManager::findById_(const char* id) {
    for (uint8_t i = 0; i < count_; ++i)
        if (strcmp(modules_[i]->moduleId(), id) == 0) return modules_[i];
    return nullptr;
}

bool ModuleManager::buildInitOrder_() {
    /// Kahn topo-sort
    bool placed[Limits::MaxModules] = {0};
    orderedCount_ = 0;

    for (uint8_t pass = 0; pass < count_; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count_; ++i) {
            Module* m = modules_[i];
            if (!m || placed[i]) continue;

            bool depsOk = true;
            for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById_(depId);
                if (!dep) {
                    Serial.printf("[MOD][ERR] Missing dependency: module='%s' requires='%s'\n",
                                  m->moduleId(), depId);
                    Serial.flush();
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < count_; ++j) {
                    if (modules_[j] == dep) {
                        depPlaced = placed[j];
                        break;
                    }
                }
                if (!depPlaced) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered_[orderedCount_++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount_ == count_) return true;

        if (!progress) {
            Serial.println("[MOD][ERR] Cyclic deps detected (or unresolved deps)");
            for (uint8_t i = 0; i < count_; ++i) {
                if (modules_[i] && !placed[i]) {
                    Serial.printf("   * %s\n", modules_[i]->moduleId());
                }
            }
            Serial.flush();
            return false;
        }
    }

    return orderedCount_ == count_;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    if (!buildInitOrder_()) return false;

    for (uint8_t i = 0; i < orderedCount_; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered_[i]->moduleId());
        ordered_[i]->init(cfg, services);
    }

    wireCoreServices_(services, cfg);

    /// Load persistent config after all modules registered their variables.
    cfg.loadPersistent();

    for (uint8_t i = 0; i < orderedCount_; ++i) {
        ordered_[i]->onConfigLoaded(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount_; ++i) {
        if (!ordered_[i]->hasTask()) continue;
        if (!ordered_[i]->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", ordered_[i]->moduleId());
            return false;
        }
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered_[i]->moduleId());
    }

    Log::info(LOG_TAG_CORE, "%u modules up", (unsigned)orderedCount_);
    return true;
}

void ModuleManager::wireCoreServices_(ServiceRegistry& services, ConfigStore& config) {
    auto* ebService = services.get<EventBusService>("eventbus");
    if (ebService && ebService->bus) {
        config.setEventBus(ebService->bus);
    }
}
