/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"

bool CommandModule::svcRegister_(void* ctx, const char* cmd, CommandHandler fn, void* userCtx)
{
    return static_cast<CommandRegistry*>(ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute_(void* ctx, const char* cmd, const char* json, const char* args,
                                char* reply, size_t replyLen)
{
    return static_cast<CommandRegistry*>(ctx)->execute(cmd, json, args, reply, replyLen);
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services)
{
    if (!services.add("cmd", &svc_)) {
        LOGE("service registration failed: cmd");
        return;
    }
    LOGI("CommandService registered");
}

void CommandModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    LOGI("%u command(s) registered", (unsigned)registry_.count());
}
