#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Maximum number of modules handled by `ModuleManager`. */
constexpr uint8_t MaxModules = 16;
/** @brief Maximum number of entries in `ServiceRegistry`. */
constexpr uint8_t MaxServices = 16;
/** @brief Maximum number of registered commands in `CommandRegistry`. */
constexpr uint8_t MaxCommands = 24;
/** @brief Maximum number of log sinks in `LogSinkRegistry`. */
constexpr int MaxLogSinks = 4;

/** @brief JSON capacity for command args parsing (`irrigation.*`, `tanklevel.*`). */
constexpr size_t JsonCmdBuf = 256;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers full multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 4096;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 96;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;

/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 40;
/** @brief Subscriber table size in `EventBus`. Valves subscribe individually. */
constexpr uint16_t EventSubscribers = 64;
/** @brief Subscriber slots per `GuardedEventChannel`. */
constexpr uint8_t GuardedSubscribers = 48;

/** @brief Irrigation engine capacities. */
namespace Irrigation {
/** @brief Number of zone slots (config + controller). */
constexpr uint8_t MaxZones = 8;
/** @brief Relay pins (valves) a single zone may sequence. */
constexpr uint8_t MaxValvesPerZone = 4;
/** @brief Zone display name buffer (including terminator). */
constexpr size_t ZoneNameLen = 24;
/** @brief Per-zone relay pin list buffer (`"17,27,22"`). */
constexpr size_t ZonePinsLen = 24;
/** @brief Flow samples kept by the leak detector (30 s window at 1 Hz plus margin). */
constexpr uint8_t LeakSampleSlots = 48;
/** @brief Requests held by one debounce batch. */
constexpr uint8_t DebounceBatch = 24;
/** @brief Irrigation task stack size. */
constexpr uint16_t TaskStackSize = 4096;
/** @brief JSON document capacity for the `irrigation.status` snapshot. */
constexpr size_t StatusJsonBuf = 2048;
}  // namespace Irrigation

/** @brief Power-off closes every zone at once: one ValveClosed, ZoneStateChanged
 *  and ZoneSessionEnded per zone, then PowerChanged. */
constexpr uint8_t PowerOffBurstEvents = Irrigation::MaxZones * 3 + 1;
static_assert(EventQueueLen >= PowerOffBurstEvents, "event queue must hold a full power-off burst");

/** @brief Tank level capacities. */
namespace Tank {
/** @brief Number of tank slots. */
constexpr uint8_t MaxTanks = 4;
/** @brief Stack of a detached ultrasonic measurement task. */
constexpr uint16_t MeasureStackSize = 2048;
}  // namespace Tank

/** @brief Serial command console buffers. */
namespace Console {
/** @brief One input line (`{"cmd":...,"args":{...}}`). */
constexpr size_t LineBuf = 512;
constexpr size_t CmdName = 48;
constexpr size_t CmdArgs = 384;
/** @brief Handler reply buffer, large enough for `irrigation.status`. */
constexpr size_t ReplyBuf = 2048;
}  // namespace Console

}  // namespace Limits
