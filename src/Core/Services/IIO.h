#pragma once
/**
 * @file IIO.h
 * @brief Hardware I/O service exposed by IOModule.
 *
 * Pins are raw GPIO numbers; IO_PIN_NONE marks an unassigned pin and every
 * operation on it fails without touching hardware.
 */
#include <stdint.h>

constexpr uint8_t IO_PIN_NONE = 0xFF;

/** @brief Outcome of an ultrasonic distance measurement. */
enum IoDistanceStatus : uint8_t {
    IO_DIST_OK = 0,
    IO_DIST_OUT_OF_RANGE = 1,
    IO_DIST_NO_ECHO = 2,
    IO_DIST_BAD_PIN = 3
};

/** @brief Edge callback, invoked from interrupt context. */
typedef void (*IoEdgeCallback)(void* ctx);

struct IOService {
    /** @brief Energize the relay on pin (valve open). */
    bool (*openRelay)(void* ctx, uint8_t pin);
    /** @brief De-energize the relay on pin (valve closed). */
    bool (*closeRelay)(void* ctx, uint8_t pin);
    /** @brief Attach an edge interrupt to a digital input. */
    bool (*pollDigitalInput)(void* ctx, uint8_t pin, IoEdgeCallback onEdge, void* edgeCtx);
    /** @brief Blocking trigger/echo measurement, millimetres. */
    IoDistanceStatus (*measureDistance)(void* ctx, uint8_t trigPin, uint8_t echoPin, float* outMm);
    void* ctx;
};
