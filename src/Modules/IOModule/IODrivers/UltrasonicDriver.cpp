/**
 * @file UltrasonicDriver.cpp
 * @brief Implementation file.
 */

#include "UltrasonicDriver.h"
#include <Arduino.h>

UltrasonicDriver::UltrasonicDriver(const char* driverId, const UltrasonicDriverConfig& cfg)
    : driverId_(driverId), cfg_(cfg)
{
}

bool UltrasonicDriver::begin()
{
    pinMode(cfg_.trigPin, OUTPUT);
    digitalWrite(cfg_.trigPin, LOW);
    pinMode(cfg_.echoPin, INPUT);
    begun_ = true;
    return true;
}

IODistanceResult UltrasonicDriver::measure(float& outMm)
{
    if (!begun_) return IODistanceResult::NoEcho;

    digitalWrite(cfg_.trigPin, LOW);
    delayMicroseconds(2);
    digitalWrite(cfg_.trigPin, HIGH);
    delayMicroseconds(10);
    digitalWrite(cfg_.trigPin, LOW);

    unsigned long echoUs = pulseIn(cfg_.echoPin, HIGH, cfg_.echoTimeoutUs);
    if (echoUs == 0) return IODistanceResult::NoEcho;

    outMm = echoToMm((uint32_t)echoUs);
    if (outMm < cfg_.minRangeMm || outMm > cfg_.maxRangeMm) return IODistanceResult::OutOfRange;
    return IODistanceResult::Ok;
}
