#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// ConfigStore holds every module's tunables:
// - values live in module-owned storage, the store only keeps metadata
// - Persistent variables mirror to NVS (Preferences) on every change
// - set() and applyJson() post EventId::ConfigChanged
// - JSON layout is {"<module>":{"<name>":value,...},...}
//
// No heap allocation in the runtime path; applyJson parses into a static
// ArduinoJson document and must not be called concurrently.

#include <Preferences.h>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventChannel.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

class ConfigStore {
public:
    ConfigStore() = default;

    /** @brief Inject the event channel for change notifications. */
    void setEventBus(EventChannel* bus) { eventBus_ = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { prefs_ = &prefs; }

    /** @brief Register a config variable definition (call during init). */
    template<typename T>
    bool registerVar(ConfigVariable<T>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T>
    bool set(ConfigVariable<T>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    bool set(ConfigVariable<char>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();
    /** @brief Write every persistent variable to NVS. */
    void savePersistent();
    /** @brief Clear the NVS namespace (values in RAM are kept). */
    bool erasePersistent();

    /** @brief Serialize all registered config to JSON. */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    uint8_t listModules(const char** out, uint8_t max) const;
    /** @brief Apply a JSON patch; unknown modules/keys are ignored. */
    bool applyJson(const char* json);

private:
    Preferences* prefs_ = nullptr;
    EventChannel* eventBus_ = nullptr;
    ConfigMeta meta_[Limits::MaxConfigVars];
    uint16_t metaCount_ = 0;

    void notifyChanged_(const char* nvsKey);
    bool writePersistent_(const ConfigMeta& m);
    ConfigMeta* find_(const char* module, const char* name);
};

// -------------------------
// Template implementation
// -------------------------
template<typename T>
bool ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (metaCount_ >= Limits::MaxConfigVars) {
        Log::error(LOG_TAG_CORE, "config table full (%s)", var.jsonName ? var.jsonName : "?");
        return false;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return false;
    }

    ConfigMeta& m = meta_[metaCount_++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    return true;
}

template<typename T>
bool ConfigStore::set(ConfigVariable<T>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;
    if (*(var.value) == value) return true;

    *(var.value) = value;

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && prefs_) {
        ConfigMeta m{var.moduleName, var.jsonName, var.nvsKey, var.type, var.persistence, (void*)var.value, var.size};
        writePersistent_(m);
    }

    notifyChanged_(var.nvsKey);
    return true;
}

inline bool ConfigStore::set(ConfigVariable<char>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;

    memcpy(var.value, str, len);
    var.value[len] = '\0';

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && prefs_) {
        if (prefs_->putString(var.nvsKey, var.value) == 0) {
            Log::warn(LOG_TAG_CORE, "NVS write failed (%s)", var.nvsKey);
        }
    }

    notifyChanged_(var.nvsKey);
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
