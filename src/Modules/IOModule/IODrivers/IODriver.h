#pragma once
/**
 * @file IODriver.h
 * @brief Base interface for IO drivers.
 */

#include <stdint.h>

class IODriver {
public:
    virtual ~IODriver() = default;
    virtual const char* id() const = 0;
    virtual bool begin() = 0;
};

class IDigitalPinDriver : public IODriver {
public:
    virtual bool write(bool on) = 0;
    virtual bool read(bool& on) const = 0;
};

/** @brief Raw outcome of one echo measurement. */
enum class IODistanceResult : uint8_t {
    Ok,
    OutOfRange,
    NoEcho
};

class IDistanceDriver : public IODriver {
public:
    /** @brief Blocking single measurement in millimetres. */
    virtual IODistanceResult measure(float& outMm) = 0;
};
