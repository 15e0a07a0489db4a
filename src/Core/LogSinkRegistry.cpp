/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    if (n_ >= Limits::MaxLogSinks) return false;
    sinks_[n_++] = sink;
    return true;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n_) return LogSinkService{};
    return sinks_[idx];
}
