#pragma once

#include <stdint.h>

#ifndef BOARD_REV
#define BOARD_REV 1
#endif

namespace Board {

/** @brief Highest GPIO accepted in pin configuration. */
constexpr uint8_t MaxGpio = 39;

#if BOARD_REV == 1
namespace Relay {
constexpr uint8_t Zone1 = 32;
constexpr uint8_t Zone2 = 33;
constexpr uint8_t Zone3 = 25;
constexpr uint8_t Zone4 = 26;
constexpr uint8_t Zone5 = 27;
constexpr uint8_t Zone6 = 14;
constexpr uint8_t Zone7 = 12;
constexpr uint8_t Zone8 = 13;
/** @brief Relay boards are active low. */
constexpr bool ActiveHigh = false;
}  // namespace Relay

namespace DI {
constexpr uint8_t FlowPulse = 34;
}  // namespace DI

namespace Usonic {
constexpr uint8_t Trig1 = 5;
constexpr uint8_t Echo1 = 18;
constexpr uint8_t Trig2 = 19;
constexpr uint8_t Echo2 = 21;
}  // namespace Usonic
#else
#error "Unsupported BOARD_REV value"
#endif

}  // namespace Board
