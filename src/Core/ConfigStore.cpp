/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <math.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool isMaskedKey_(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

static void putValue_(JsonObject obj, const ConfigMeta& m) {
    switch (m.type) {
        case ConfigType::Int32:
            obj[m.name] = *(const int32_t*)m.valuePtr;
            break;
        case ConfigType::UInt8:
            obj[m.name] = *(const uint8_t*)m.valuePtr;
            break;
        case ConfigType::Bool:
            obj[m.name] = *(const bool*)m.valuePtr;
            break;
        case ConfigType::Float:
            obj[m.name] = *(const float*)m.valuePtr;
            break;
        case ConfigType::CharArray:
            obj[m.name] = isMaskedKey_(m.name) ? "***" : (const char*)m.valuePtr;
            break;
    }
}

void ConfigStore::notifyChanged_(const char* nvsKey)
{
    if (!eventBus_ || !nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);
    eventBus_->post(EventId::ConfigChanged, &p, sizeof(p));
}

bool ConfigStore::writePersistent_(const ConfigMeta& m)
{
    if (!prefs_) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:     wrote = prefs_->putInt(m.nvsKey, *(int32_t*)m.valuePtr); break;
        case ConfigType::UInt8:     wrote = prefs_->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr); break;
        case ConfigType::Bool:      wrote = prefs_->putBool(m.nvsKey, *(bool*)m.valuePtr); break;
        case ConfigType::Float:     wrote = prefs_->putFloat(m.nvsKey, *(float*)m.valuePtr); break;
        case ConfigType::CharArray: wrote = prefs_->putString(m.nvsKey, (const char*)m.valuePtr); break;
    }
    if (wrote == 0) {
        Log::warn(LOG_TAG_CORE, "NVS write failed (%s)", m.nvsKey);
        return false;
    }
    return true;
}

void ConfigStore::loadPersistent()
{
    if (!prefs_) return;

    uint16_t loaded = 0;
    for (uint16_t i = 0; i < metaCount_; ++i) {
        ConfigMeta& m = meta_[i];
        if (m.persistence != ConfigPersistence::Persistent || !m.nvsKey) continue;
        if (!prefs_->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = prefs_->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = prefs_->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = prefs_->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::Float:
                *(float*)m.valuePtr = prefs_->getFloat(m.nvsKey, *(float*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                prefs_->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
        loaded++;
    }
    Log::info(LOG_TAG_CORE, "loaded %u/%u vars from NVS", (unsigned)loaded, (unsigned)metaCount_);
}

void ConfigStore::savePersistent()
{
    for (uint16_t i = 0; i < metaCount_; ++i) {
        writePersistent_(meta_[i]);
    }
}

bool ConfigStore::erasePersistent()
{
    if (!prefs_) return false;
    return prefs_->clear();
}

ConfigMeta* ConfigStore::find_(const char* module, const char* name)
{
    if (!module || !name) return nullptr;
    for (uint16_t i = 0; i < metaCount_; ++i) {
        ConfigMeta& m = meta_[i];
        if (m.module && m.name && strcmp(m.module, module) == 0 && strcmp(m.name, name) == 0) return &m;
    }
    return nullptr;
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    JsonObject root = doc.to<JsonObject>();

    for (uint16_t i = 0; i < metaCount_; ++i) {
        const ConfigMeta& m = meta_[i];
        if (!m.module || !m.name) continue;
        JsonObject mod = root[m.module];
        if (mod.isNull()) mod = root.createNestedObject(m.module);
        putValue_(mod, m);
    }

    const size_t need = measureJson(doc);
    serializeJson(doc, out, outLen);
    return !doc.overflowed() && need < outLen;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonCmdBuf * 4> doc;
    JsonObject obj = doc.to<JsonObject>();

    bool any = false;
    for (uint16_t i = 0; i < metaCount_; ++i) {
        const ConfigMeta& m = meta_[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;
        putValue_(obj, m);
        any = true;
    }

    const size_t need = measureJson(doc);
    serializeJson(doc, out, outLen);
    if (truncated) *truncated = doc.overflowed() || need >= outLen;
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < metaCount_ && count < max; ++i) {
        const ConfigMeta& m = meta_[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (!exists) out[count++] = m.module;
    }
    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }

    uint16_t changedCount = 0;
    for (JsonPairConst modPair : doc.as<JsonObjectConst>()) {
        JsonObjectConst fields = modPair.value().as<JsonObjectConst>();
        if (fields.isNull()) continue;

        for (JsonPairConst f : fields) {
            ConfigMeta* m = find_(modPair.key().c_str(), f.key().c_str());
            if (!m) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s", modPair.key().c_str(), f.key().c_str());
                continue;
            }

            JsonVariantConst v = f.value();
            bool changed = false;
            switch (m->type) {
            case ConfigType::Int32: {
                if (!v.is<int32_t>()) continue;
                const int32_t nv = v.as<int32_t>();
                if (*(int32_t*)m->valuePtr != nv) { *(int32_t*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::UInt8: {
                if (!v.is<uint8_t>()) continue;
                const uint8_t nv = v.as<uint8_t>();
                if (*(uint8_t*)m->valuePtr != nv) { *(uint8_t*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Bool: {
                if (!v.is<bool>()) continue;
                const bool nv = v.as<bool>();
                if (*(bool*)m->valuePtr != nv) { *(bool*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Float: {
                if (!v.is<float>()) continue;
                const float nv = v.as<float>();
                if (!isfinite(nv)) continue;
                if (*(float*)m->valuePtr != nv) { *(float*)m->valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::CharArray: {
                const char* s = v.as<const char*>();
                if (!s || m->size == 0) continue;
                size_t len = strlen(s);
                if (len >= m->size) len = m->size - 1;
                char* dst = (char*)m->valuePtr;
                if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                    memcpy(dst, s, len);
                    dst[len] = '\0';
                    changed = true;
                }
                break;
            }
            }

            if (!changed) continue;
            changedCount++;
            if (m->persistence == ConfigPersistence::Persistent) writePersistent_(*m);
            notifyChanged_(m->nvsKey);
        }
    }

    Log::info(LOG_TAG_CORE, "applyJson: %u value(s) changed", (unsigned)changedCount);
    return true;
}
