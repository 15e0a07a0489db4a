#pragma once
/**
 * @file SerialConsoleModule.h
 * @brief Line-oriented JSON command console on the USB serial port.
 *
 * Each input line is `{"cmd":"<name>","args":{...}}`. The reply is printed
 * on one line as `{"ok":true,"cmd":"<name>","reply":{...}}` or as an
 * ErrorCode JSON object.
 */
#include "Core/Module.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"

class SerialConsoleModule : public Module {
public:
    const char* moduleId() const override { return "console"; }
    const char* taskName() const override { return "console"; }
    BaseType_t taskCore() const override { return 0; }
    uint16_t taskStackSize() const override { return 4096; }
    uint32_t loopDelayMs() const override { return 20; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "log.sink.serial";
        if (i == 2) return "cmd";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    void processLine_();
    void printError_(ErrorCode code, const char* where);

    const CommandService* cmdSvc_ = nullptr;

    char line_[Limits::Console::LineBuf] = {0};
    size_t lineLen_ = 0;
    bool overflow_ = false;

    char replyBuf_[Limits::Console::ReplyBuf] = {0};
};
