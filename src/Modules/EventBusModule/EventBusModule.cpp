/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

void EventBusModule::init(ConfigStore&, ServiceRegistry& services)
{
    if (!services.add("eventbus", &svc_)) {
        LOGE("service registration failed: eventbus");
        return;
    }
    LOGI("EventBusService registered");
}

void EventBusModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    // Queued until the dispatch task starts, after every module is wired.
    bus_.post(EventId::SystemStarted, nullptr, 0);
}

void EventBusModule::loop()
{
    bus_.dispatch(8);

    const uint32_t dropped = bus_.droppedCount();
    if (dropped != lastDropped_) {
        LOGW("%lu event(s) dropped, queue full", (unsigned long)(dropped - lastDropped_));
        lastDropped_ = dropped;
    }
}
