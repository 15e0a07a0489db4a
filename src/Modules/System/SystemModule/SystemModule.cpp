/**
 * @file SystemModule.cpp
 * @brief Implementation file.
 */
#include "SystemModule.h"
#include "Core/ErrorCodes.h"
#include "Core/EventBus/EventPayloads.h"
#include <Arduino.h>
#include <esp_system.h>
#include <string.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

static bool writeOkReply_(char* reply, size_t replyLen, const char* json, const char* where)
{
    if (!reply || replyLen == 0 || !json) return false;
    const int wrote = snprintf(reply, replyLen, "%s", json);
    if (wrote > 0 && (size_t)wrote < replyLen) return true;
    if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
    return false;
}

bool SystemModule::cmdPing_(void*, const CommandRequest&, char* reply, size_t replyLen) {
    return writeOkReply_(reply, replyLen, "{\"ok\":true,\"pong\":true}", "system.ping");
}

// The restart path runs the irrigation shutdown handler, which closes every valve.
bool SystemModule::cmdReboot_(void*, const CommandRequest&, char* reply, size_t replyLen) {
    if (!writeOkReply_(reply, replyLen, "{\"ok\":true,\"msg\":\"rebooting\"}", "system.reboot")) {
        return false;
    }
    LOGW("Reboot requested");
    delay(200); ///< let the console print the reply
    esp_restart();
    return true;
}

bool SystemModule::cmdFactoryReset_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    SystemModule* self = static_cast<SystemModule*>(userCtx);
    if (!self || !self->cfgSvc_ || !self->cfgSvc_->erase) {
        if (!writeErrorJson(reply, replyLen, ErrorCode::NotReady, "system.factory_reset")) {
            snprintf(reply, replyLen, "{\"ok\":false}");
        }
        return false;
    }

    if (!self->cfgSvc_->erase(self->cfgSvc_->ctx)) {
        LOGE("Factory reset failed: config erase");
        if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "system.factory_reset")) {
            snprintf(reply, replyLen, "{\"ok\":false}");
        }
        return false;
    }

    if (!writeOkReply_(reply, replyLen, "{\"ok\":true,\"msg\":\"factory_reset\"}", "system.factory_reset")) {
        return false;
    }

    LOGI("Factory reset done");
    delay(300);
    esp_restart();
    return true;
}

void SystemModule::applyLogLevel_()
{
    uint8_t lvl = logLevel_;
    if (lvl > (uint8_t)LogLevel::Error) lvl = (uint8_t)LogLevel::Error;
    Log::setMinLevel((LogLevel)lvl);
}

void SystemModule::onEventStatic_(const Event& e, void* user)
{
    SystemModule* self = static_cast<SystemModule*>(user);
    if (!self || e.id != EventId::ConfigChanged) return;
    const ConfigChangedPayload* p = eventPayload<ConfigChangedPayload>(e);
    if (!p || strcmp(p->nvsKey, NvsKeys::System::LogLevel) != 0) return;
    self->applyLogLevel_();
    LOGI("Log level set to %u", (unsigned)self->logLevel_);
}

void SystemModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cmdSvc_ = services.get<CommandService>("cmd");
    cfgSvc_ = services.get<ConfigStoreService>("config");
    eventBusSvc_ = services.get<EventBusService>("eventbus");

    cfg.registerVar(logLevelVar_);

    if (!cmdSvc_) {
        LOGE("command service missing");
        return;
    }
    bool ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "system.ping", cmdPing_, this);
    ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "system.reboot", cmdReboot_, this) && ok;
    ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "system.factory_reset", cmdFactoryReset_, this) && ok;
    if (!ok) {
        LOGE("system command registration failed");
        return;
    }

    LOGI("Commands registered: system.ping system.reboot system.factory_reset");
}

void SystemModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    applyLogLevel_();

    EventBus* bus = eventBusSvc_ ? eventBusSvc_->bus : nullptr;
    if (!bus || !bus->subscribe(EventId::ConfigChanged, &SystemModule::onEventStatic_, this)) {
        LOGW("log level changes need a reboot");
    }
}
