#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed-capacity registry of log sinks.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

class LogSinkRegistry {
public:
    bool add(LogSinkService sink);
    int count() const { return n_; }
    LogSinkService get(int idx) const;

private:
    LogSinkService sinks_[Limits::MaxLogSinks]{};
    int n_ = 0;
};
