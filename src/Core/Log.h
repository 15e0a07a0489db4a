/**
 * @file Log.h
 * @brief Global log helper for core and modules.
 *
 * Entries are pushed to the LogHub service when one is installed; until then
 * (early boot, host tests) every call is a silent no-op.
 */
#pragma once

#include "Core/Services/ILogger.h"

namespace Log {
    /** @brief Millisecond clock used to stamp entries. */
    using ClockFn = uint32_t (*)();

    /** @brief Set the global log hub service. */
    void setHub(const LogHubService* hub);

    /** @brief Get the current global log hub service. */
    const LogHubService* hub();

    /** @brief Install the timestamp source (millis() on target). */
    void setClock(ClockFn clock);

    /** @brief Drop entries below this level (default Debug). */
    void setMinLevel(LogLevel lvl);
    LogLevel minLevel();

    /** @brief Log a formatted message with a given level. */
    void logf(LogLevel lvl, const char* tag, const char* fmt, ...);

    void debug(const char* tag, const char* fmt, ...);
    void info(const char* tag, const char* fmt, ...);
    void warn(const char* tag, const char* fmt, ...);
    void error(const char* tag, const char* fmt, ...);
}

// Macros are provided by Core/ModuleLog.h to keep Module.h neutral.
