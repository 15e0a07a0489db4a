/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

void LogHubModule::init(ConfigStore&, ServiceRegistry& services)
{
    hub_.init(Limits::LogQueueLen);

    hubSvc_.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc_.ctx = &hub_;

    sinksSvc_.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc_.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc_.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc_.ctx = &sinks_;

    const bool ok = services.add("loghub", &hubSvc_) && services.add("logsinks", &sinksSvc_);

    Log::setHub(&hubSvc_);
    if (!ok) Log::error("LogHubMd", "log services registration failed");
}
