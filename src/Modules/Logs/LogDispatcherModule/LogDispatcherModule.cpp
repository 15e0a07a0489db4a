/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

void LogDispatcherModule::init(ConfigStore&, ServiceRegistry& services)
{
    const LogHubService* hubSvc = services.get<LogHubService>("loghub");
    sinkReg_ = services.get<LogSinkRegistryService>("logsinks");

    if (!hubSvc || !hubSvc->ctx || !sinkReg_) {
        Serial.println("[LogDisp] log hub or sink registry missing, logs stay queued");
        return;
    }
    hub_ = static_cast<LogHub*>(hubSvc->ctx);

    const BaseType_t ok = xTaskCreatePinnedToCore(
        LogDispatcherModule::taskFn_,
        "LogDispatch",
        4096,
        this,
        1,
        nullptr,
        0
    );
    if (ok != pdPASS) {
        Serial.println("[LogDisp] dispatcher task creation failed");
    }
}

void LogDispatcherModule::taskFn_(void* pv)
{
    LogDispatcherModule* self = static_cast<LogDispatcherModule*>(pv);
    const LogSinkRegistryService* sinks = self->sinkReg_;
    LogEntry e;

    while (true) {
        if (!self->hub_->dequeue(e, portMAX_DELAY)) continue;

        const int n = sinks->count(sinks->ctx);
        for (int i = 0; i < n; ++i) {
            LogSinkService sink = sinks->get(sinks->ctx, i);
            if (sink.write) sink.write(sink.ctx, e);
        }
    }
}
