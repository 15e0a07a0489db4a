/**
 * @file SerialConsoleModule.cpp
 * @brief Implementation file.
 */
#include "SerialConsoleModule.h"
#include "Core/ErrorCodes.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "Console"
#include "Core/ModuleLog.h"

void SerialConsoleModule::init(ConfigStore&, ServiceRegistry& services)
{
    cmdSvc_ = services.get<CommandService>("cmd");
    if (!cmdSvc_) LOGW("command service missing, console is read-only");
}

void SerialConsoleModule::printError_(ErrorCode code, const char* where)
{
    char err[128];
    if (!writeErrorJson(err, sizeof(err), code, where)) {
        snprintf(err, sizeof(err), "{\"ok\":false}");
    }
    Serial.println(err);
}

void SerialConsoleModule::loop()
{
    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;
        if (c == '\r') continue;

        if (c == '\n') {
            if (overflow_) {
                LOGW("input line too long, dropped");
                printError_(ErrorCode::ArgsTooLarge, "console");
            } else if (lineLen_ > 0) {
                line_[lineLen_] = '\0';
                processLine_();
            }
            lineLen_ = 0;
            overflow_ = false;
            continue;
        }

        if (lineLen_ + 1 >= sizeof(line_)) {
            overflow_ = true;
            continue;
        }
        line_[lineLen_++] = (char)c;
    }
}

void SerialConsoleModule::processLine_()
{
    static StaticJsonDocument<Limits::JsonCmdBuf * 2> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, line_);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGD("bad cmd json (%s)", err.c_str());
        printError_(ErrorCode::BadCmdJson, "cmd");
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    const char* cmdVal = root["cmd"].as<const char*>();
    if (!cmdVal || cmdVal[0] == '\0') {
        printError_(ErrorCode::MissingCmd, "cmd");
        return;
    }
    if (!cmdSvc_ || !cmdSvc_->execute) {
        printError_(ErrorCode::CmdServiceUnavailable, "cmd");
        return;
    }

    char cmd[Limits::Console::CmdName];
    size_t clen = strlen(cmdVal);
    if (clen >= sizeof(cmd)) clen = sizeof(cmd) - 1;
    memcpy(cmd, cmdVal, clen);
    cmd[clen] = '\0';

    const char* argsJson = nullptr;
    char argsBuf[Limits::Console::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            LOGW("args too large (cmd=%s)", cmd);
            printError_(ErrorCode::ArgsTooLarge, "cmd");
            return;
        }
        argsJson = argsBuf;
    }

    replyBuf_[0] = '\0';
    const bool ok = cmdSvc_->execute(cmdSvc_->ctx, cmd, line_, argsJson, replyBuf_, sizeof(replyBuf_));
    if (!ok) {
        // Handlers leave their own ErrorCode JSON in the reply.
        LOGD("command failed (cmd=%s)", cmd);
        Serial.println(replyBuf_);
        return;
    }

    Serial.printf("{\"ok\":true,\"cmd\":\"%s\",\"reply\":%s}\n", cmd, replyBuf_);
}
