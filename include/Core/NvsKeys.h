#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "irrigaio";

namespace System {
constexpr char LogLevel[] = "sys_loglvl";
}  // namespace System

namespace Io {
constexpr char RelayActiveHigh[] = "io_rlyhi";
constexpr char EchoTimeoutUs[] = "io_echous";
}  // namespace Io

namespace Irrigation {
constexpr char Power[] = "ir_power";
constexpr char PauseUntil[] = "ir_pause";
constexpr char MaxRuntime[] = "ir_maxrt";
constexpr char MaxActive[] = "ir_maxact";
constexpr char FlowPin[] = "ir_flowpin";
constexpr char FlowFactor[] = "ir_flowk";
constexpr char LeakEnabled[] = "ir_leak";
constexpr char UtcOffset[] = "ir_utcoff";

/** @brief printf format for per-zone name key (example `zn0name`). */
constexpr char ZoneNameFmt[] = "zn%uname";
/** @brief printf format for per-zone enabled key (example `zn0en`). */
constexpr char ZoneEnabledFmt[] = "zn%uen";
/** @brief printf format for per-zone runtime key (example `zn0rt`). */
constexpr char ZoneRuntimeFmt[] = "zn%urt";
/** @brief printf format for per-zone relay pin list key (example `zn0pins`). */
constexpr char ZonePinsFmt[] = "zn%upins";
}  // namespace Irrigation

namespace Tank {
/** @brief printf format for per-tank enabled key (example `tk0en`). */
constexpr char EnabledFmt[] = "tk%uen";
/** @brief printf format for per-tank sensor height key (example `tk0h`). */
constexpr char HeightFmt[] = "tk%uh";
/** @brief printf format for per-tank minimum level key (example `tk0min`). */
constexpr char MinLevelFmt[] = "tk%umin";
/** @brief printf format for per-tank trigger pin key (example `tk0trig`). */
constexpr char TrigFmt[] = "tk%utrig";
/** @brief printf format for per-tank echo pin key (example `tk0echo`). */
constexpr char EchoFmt[] = "tk%uecho";
/** @brief printf format for per-tank capacity key (example `tk0cap`). */
constexpr char CapacityFmt[] = "tk%ucap";
}  // namespace Tank

}  // namespace NvsKeys
