#pragma once
/**
 * @file UltrasonicDriver.h
 * @brief Trigger/echo ultrasonic ranger (HC-SR04, JSN-SR04T).
 */

#include <stdint.h>
#include "Modules/IOModule/IODrivers/IODriver.h"

struct UltrasonicDriverConfig {
    uint8_t trigPin = 0;
    uint8_t echoPin = 0;
    uint32_t echoTimeoutUs = 30000;
    float minRangeMm = 200.0f;
    float maxRangeMm = 4500.0f;
};

class UltrasonicDriver : public IDistanceDriver {
public:
    UltrasonicDriver(const char* driverId, const UltrasonicDriverConfig& cfg);

    const char* id() const override { return driverId_; }
    bool begin() override;
    IODistanceResult measure(float& outMm) override;

    uint8_t trigPin() const { return cfg_.trigPin; }
    uint8_t echoPin() const { return cfg_.echoPin; }

    /** @brief Echo round trip to distance (speed of sound 343 m/s). */
    static float echoToMm(uint32_t echoUs) { return (float)echoUs * 0.343f / 2.0f; }

private:
    const char* driverId_ = nullptr;
    UltrasonicDriverConfig cfg_{};
    bool begun_ = false;
};
