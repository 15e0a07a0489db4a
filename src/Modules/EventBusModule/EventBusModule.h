#pragma once
/**
 * @file EventBusModule.h
 * @brief Active module hosting the EventBus task/dispatch loop.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/EventBus/EventBus.h"

/**
 * @brief Active module that owns the EventBus instance.
 *
 * Every subscriber callback runs on this task.
 */
class EventBusModule : public Module {
public:
    const char* moduleId() const override { return "eventbus"; }
    const char* taskName() const override { return "EventBus"; }

    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Dispatch events from the queue. */
    void loop() override;

    uint16_t taskStackSize() const override { return 4096; }
    UBaseType_t taskPriority() const override { return 2; }
    uint32_t loopDelayMs() const override { return 5; }

private:
    EventBus bus_;
    EventBusService svc_{ &bus_ };
    uint32_t lastDropped_ = 0;
};
