#include <unity.h>

#include "Modules/IrrigationModule/PowerScheduler.h"
#include "Modules/IrrigationModule/ZoneController.h"
#include "support/FakeIo.h"
#include "support/TestEventChannel.h"

static TestEventChannel bus;
static FakeIo io;

// 2024-01-01 12:00:00 UTC
static const uint32_t kNoon = 1704110400UL;

void setUp()
{
    bus.reset();
    io.reset();
}

void tearDown() {}

static void defineZone(ZoneController& zc, uint8_t id)
{
    ZoneDefinition def{};
    def.enabled = true;
    def.runtimeSec = 600;
    def.pinCount = 1;
    def.pins[0] = (uint8_t)(17 + id);
    zc.defineZone(id, def, 0);
}

void test_pause_for_one_day_resumes_exactly_once()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    power.begin(true, 0);

    TEST_ASSERT_TRUE(power.setPause(kNoon + 86400, kNoon, 0));
    TEST_ASSERT_FALSE(power.powered());
    TEST_ASSERT_EQUAL_UINT32(kNoon + 86400, power.pauseUntil());

    uint8_t resumed = 0;
    for (uint32_t now = kNoon; now <= kNoon + 86400 + 3 * 5; now += 5) {
        if (power.tick(now, 0)) resumed++;
    }
    TEST_ASSERT_EQUAL_UINT8(1, resumed);
    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_EQUAL_UINT32(0, power.pauseUntil());

    PowerPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::PowerChanged, p));
    TEST_ASSERT_TRUE(p.power);
    TEST_ASSERT_EQUAL_UINT32(0, p.pauseUntil);
    TEST_ASSERT_EQUAL_UINT16(2, bus.count(EventId::PowerChanged));
}

void test_pause_rejected_without_clock_or_in_past()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    power.begin(true, 0);

    TEST_ASSERT_FALSE(power.setPause(86400, 1000, 0));
    TEST_ASSERT_FALSE(power.setPause(kNoon, kNoon, 0));
    TEST_ASSERT_FALSE(power.setPause(kNoon - 1, kNoon, 0));
    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::PowerChanged));

    // An unset clock never resumes a restored pause.
    PowerScheduler restored(zc, &bus);
    restored.begin(true, kNoon);
    TEST_ASSERT_FALSE(restored.tick(5000, 0));
    TEST_ASSERT_FALSE(restored.powered());
}

void test_pause_stops_running_zones()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    defineZone(zc, 0);
    power.begin(true, 0);
    zc.activate(0, 0);
    TEST_ASSERT_TRUE(io.energized(17));

    TEST_ASSERT_TRUE(power.pauseForDays(2, kNoon, 0, 1000));
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_FALSE(io.energized(17));
    TEST_ASSERT_FALSE(zc.activate(0, 2000));

    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneStateChanged, s));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::PowerOff, (uint8_t)s.reason);
}

void test_power_off_and_on()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    defineZone(zc, 0);
    power.begin(true, 0);
    zc.activate(0, 0);

    TEST_ASSERT_TRUE(power.setPower(false, 100));
    TEST_ASSERT_FALSE(power.powered());
    TEST_ASSERT_FALSE(zc.powered());
    TEST_ASSERT_FALSE(zc.isActive(0));

    // Repeating the same state does not publish.
    power.setPower(false, 200);
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::PowerChanged));

    TEST_ASSERT_TRUE(power.setPower(true, 300));
    TEST_ASSERT_TRUE(zc.powered());
    TEST_ASSERT_TRUE(zc.activate(0, 400));
}

void test_power_on_clears_pause()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    power.begin(true, 0);
    power.setPause(kNoon + 3600, kNoon, 0);

    power.setPower(true, 0);
    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_EQUAL_UINT32(0, power.pauseUntil());
    TEST_ASSERT_FALSE(power.tick(kNoon + 7200, 0));
}

void test_begin_with_pending_pause_stays_off()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    power.begin(true, kNoon + 60);
    TEST_ASSERT_FALSE(power.powered());
    TEST_ASSERT_FALSE(zc.powered());

    TEST_ASSERT_TRUE(power.tick(kNoon + 60, 0));
    TEST_ASSERT_TRUE(power.powered());
}

void test_compute_pause_until_local_midnight()
{
    TEST_ASSERT_EQUAL_UINT32(1704153600UL, PowerScheduler::computePauseUntil(kNoon, 1, 0));
    TEST_ASSERT_EQUAL_UINT32(1704153600UL + 86400UL, PowerScheduler::computePauseUntil(kNoon, 2, 0));
    // UTC+1: local midnight is 23:00 UTC.
    TEST_ASSERT_EQUAL_UINT32(1704150000UL, PowerScheduler::computePauseUntil(kNoon, 1, 3600));
    // UTC-5: local 07:00, midnight is 05:00 UTC next day.
    TEST_ASSERT_EQUAL_UINT32(1704171600UL, PowerScheduler::computePauseUntil(kNoon, 1, -18000));

    TEST_ASSERT_EQUAL_UINT32(0, PowerScheduler::computePauseUntil(kNoon, 0, 0));
    TEST_ASSERT_EQUAL_UINT32(0, PowerScheduler::computePauseUntil(kNoon, IrrigationDefaults::PauseMaxDays + 1, 0));
}

void test_pause_for_days_range_checked()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    power.begin(true, 0);

    TEST_ASSERT_FALSE(power.pauseForDays(0, kNoon, 0, 0));
    TEST_ASSERT_FALSE(power.pauseForDays(IrrigationDefaults::PauseMaxDays + 1, kNoon, 0, 0));
    TEST_ASSERT_TRUE(power.powered());

    TEST_ASSERT_TRUE(power.pauseForDays(IrrigationDefaults::PauseMaxDays, kNoon, 0, 0));
    TEST_ASSERT_EQUAL_UINT32(1704153600UL + 6UL * 86400UL, power.pauseUntil());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_pause_for_one_day_resumes_exactly_once);
    RUN_TEST(test_pause_rejected_without_clock_or_in_past);
    RUN_TEST(test_pause_stops_running_zones);
    RUN_TEST(test_power_off_and_on);
    RUN_TEST(test_power_on_clears_pause);
    RUN_TEST(test_begin_with_pending_pause_stays_off);
    RUN_TEST(test_compute_pause_until_local_midnight);
    RUN_TEST(test_pause_for_days_range_checked);
    return UNITY_END();
}
