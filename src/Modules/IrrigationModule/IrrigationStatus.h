#pragma once
/**
 * @file IrrigationStatus.h
 * @brief JSON snapshot of the irrigation engine (`irrigation.status`).
 */
#include <stddef.h>

class ZoneController;
class PowerScheduler;
class LeakDetector;
class FlowSampler;

/**
 * @brief Serialize power, leak, flow and per-zone state.
 *
 * leak and flow may be null when the feature is not configured; their
 * fields are then reported as null. Returns false if out is too small.
 * Not reentrant (static document), callers hold the engine mutex.
 */
bool buildIrrigationStatusJson(const ZoneController& zones, const PowerScheduler& power,
                               const LeakDetector* leak, const FlowSampler* flow,
                               char* out, size_t outLen);
