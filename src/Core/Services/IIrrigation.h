#pragma once
/**
 * @file IIrrigation.h
 * @brief Irrigation engine service exposed by IrrigationModule.
 *
 * Every entry point takes the engine mutex; callers may use it from any task.
 * Failures leave state untouched.
 */
#include <stdint.h>
#include <stddef.h>

struct IrrigationService {
    /** @brief Presentation-layer zone request (debounced). */
    bool (*requestZone)(void* ctx, uint8_t zoneId, bool on);
    /** @brief Presentation-layer system request (debounced). fromSwitch marks the power switch. */
    bool (*requestSystem)(void* ctx, bool on, bool fromSwitch);

    bool (*activateZone)(void* ctx, uint8_t zoneId);
    bool (*deactivateZone)(void* ctx, uint8_t zoneId);
    bool (*setPower)(void* ctx, bool on);
    bool (*setPause)(void* ctx, uint32_t untilEpochSec);
    bool (*renameZone)(void* ctx, uint8_t zoneId, const char* name);
    bool (*setZoneEnabled)(void* ctx, uint8_t zoneId, bool enabled);
    bool (*setZoneRuntime)(void* ctx, uint8_t zoneId, uint32_t seconds);

    /** @brief JSON snapshot of system and zone state. */
    bool (*buildSnapshot)(void* ctx, char* out, size_t outLen);
    void* ctx;
};
