/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"

static constexpr uint8_t kMaxListedModules = 24;

static void writeCmdError_(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool ConfigStoreModule::svcApplyJson_(void* ctx, const char* json) {
    return static_cast<ConfigStore*>(ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson_(void* ctx, char* out, size_t outLen) {
    return static_cast<ConfigStore*>(ctx)->toJson(out, outLen);
}

bool ConfigStoreModule::svcToJsonModule_(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return static_cast<ConfigStore*>(ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules_(void* ctx, const char** out, uint8_t max) {
    return static_cast<ConfigStore*>(ctx)->listModules(out, max);
}

bool ConfigStoreModule::svcErase_(void* ctx) {
    return static_cast<ConfigStore*>(ctx)->erasePersistent();
}

// {"module":"irr/z0"} returns that module's values, no args lists module names.
bool ConfigStoreModule::cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "config.get";
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self || !self->registry_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::CfgServiceUnavailable);
        return false;
    }

    const char* module = nullptr;
    StaticJsonDocument<Limits::JsonCmdBuf> args;
    if (req.args && req.args[0] != '\0') {
        const DeserializationError err = deserializeJson(args, req.args);
        if (err || !args.is<JsonObjectConst>()) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::BadCmdJson);
            return false;
        }
        module = args["module"].as<const char*>();
    }

    if (!module) {
        const char* names[kMaxListedModules] = {nullptr};
        const uint8_t n = self->registry_->listModules(names, kMaxListedModules);

        StaticJsonDocument<Limits::JsonCmdBuf * 4> doc;
        doc["ok"] = true;
        JsonArray arr = doc.createNestedArray("modules");
        for (uint8_t i = 0; i < n; ++i) arr.add(names[i]);

        if (doc.overflowed() || measureJson(doc) >= replyLen) {
            writeCmdError_(reply, replyLen, kWhere, ErrorCode::Failed);
            return false;
        }
        serializeJson(doc, reply, replyLen);
        return true;
    }

    static char valuesBuf[Limits::JsonCmdBuf * 4];
    bool truncated = false;
    if (!self->registry_->toJsonModule(module, valuesBuf, sizeof(valuesBuf), &truncated)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::UnknownModule);
        return false;
    }
    if (truncated) {
        LOGW("config.get: %s truncated", module);
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::Failed);
        return false;
    }

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"module\":\"%s\",\"values\":%s}", module, valuesBuf);
    if (!(wrote > 0 && (size_t)wrote < replyLen)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::Failed);
        return false;
    }
    return true;
}

// Args are a patch document: {"<module>":{"<name>":value,...},...}.
bool ConfigStoreModule::cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    static constexpr const char* kWhere = "config.set";
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self || !self->registry_) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::CfgServiceUnavailable);
        return false;
    }
    if (!req.args || req.args[0] == '\0') {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::MissingArgs);
        return false;
    }
    if (!self->registry_->applyJson(req.args)) {
        writeCmdError_(reply, replyLen, kWhere, ErrorCode::CfgApplyFailed);
        return false;
    }
    snprintf(reply, replyLen, "{\"ok\":true}");
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry_ = &cfg;
    svc_.ctx = registry_;

    if (!services.add("config", &svc_)) {
        LOGE("service registration failed: config");
        return;
    }

    const CommandService* cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc) {
        LOGW("command service missing, config.* commands disabled");
        return;
    }
    bool ok = cmdSvc->registerHandler(cmdSvc->ctx, "config.get", cmdGet_, this);
    ok = cmdSvc->registerHandler(cmdSvc->ctx, "config.set", cmdSet_, this) && ok;
    if (!ok) LOGE("config command registration failed");

    LOGI("ConfigStoreService registered");
}
