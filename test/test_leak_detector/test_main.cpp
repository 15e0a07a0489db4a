#include <unity.h>

#include "Modules/IrrigationModule/LeakDetector.h"
#include "support/TestEventChannel.h"

static TestEventChannel bus;

void setUp()
{
    bus.reset();
}

void tearDown() {}

static FlowSamplePayload sample(uint32_t tsMs, float volumeL)
{
    FlowSamplePayload s{};
    s.tsMs = tsMs;
    s.volumeL = volumeL;
    s.rateLpm = volumeL * 60.0f;
    return s;
}

void test_leak_raised_above_eighty_percent_after_settle()
{
    LeakDetector leak(&bus);
    leak.onValveClosed(10000);

    // 30 one-second samples, 5 dry then 25 with flow.
    uint32_t t = 1000;
    for (uint8_t i = 0; i < 5; ++i, t += 1000) leak.onFlowSample(sample(t, 0.0f));
    for (uint8_t i = 0; i < 20; ++i, t += 1000) leak.onFlowSample(sample(t, 0.02f));

    // 20 of 25 is exactly 80%, not above.
    TEST_ASSERT_FALSE(leak.leak());

    for (uint8_t i = 0; i < 5; ++i, t += 1000) leak.onFlowSample(sample(t, 0.02f));
    TEST_ASSERT_TRUE(leak.leak());
    TEST_ASSERT_EQUAL_UINT8(30, leak.sampleCount());
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::LeakDetected));

    LeakPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::LeakDetected, p));
    TEST_ASSERT_EQUAL_UINT32(26000, p.tsMs);
}

void test_recent_valve_close_suppresses_detection()
{
    LeakDetector leak(&bus);
    leak.onZoneState(0, true);
    for (uint32_t t = 1000; t < 25000; t += 1000) leak.onFlowSample(sample(t, 0.05f));
    leak.onZoneState(0, false);
    leak.onValveClosed(25000);

    // Pipes still draining after the run.
    for (uint32_t t = 25000; t <= 35000; t += 1000) leak.onFlowSample(sample(t, 0.05f));
    TEST_ASSERT_FALSE(leak.leak());

    leak.onFlowSample(sample(35001, 0.05f));
    TEST_ASSERT_TRUE(leak.leak());
}

void test_flag_frozen_while_zone_active()
{
    LeakDetector leak(&bus);
    leak.onZoneState(2, true);
    TEST_ASSERT_EQUAL_UINT8(1, leak.activeZones());

    for (uint32_t t = 1000; t <= 30000; t += 1000) leak.onFlowSample(sample(t, 0.5f));
    TEST_ASSERT_FALSE(leak.leak());
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::LeakDetected));

    leak.onZoneState(2, false);
    leak.onFlowSample(sample(31000, 0.5f));
    TEST_ASSERT_TRUE(leak.leak());
}

void test_active_flag_stays_set_during_zone_run()
{
    LeakDetector leak(&bus);
    for (uint32_t t = 1000; t <= 5000; t += 1000) leak.onFlowSample(sample(t, 0.5f));
    TEST_ASSERT_TRUE(leak.leak());

    leak.onZoneState(0, true);
    for (uint32_t t = 6000; t <= 80000; t += 1000) leak.onFlowSample(sample(t, 0.0f));
    TEST_ASSERT_TRUE(leak.leak());
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::LeakCleared));
}

void test_leak_clears_when_window_runs_dry()
{
    LeakDetector leak(&bus);
    for (uint32_t t = 1000; t <= 30000; t += 1000) leak.onFlowSample(sample(t, 0.1f));
    TEST_ASSERT_TRUE(leak.leak());
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::LeakDetected));

    for (uint32_t t = 31000; t <= 60000; t += 1000) leak.onFlowSample(sample(t, 0.0f));
    TEST_ASSERT_TRUE(leak.leak());

    // The last wet sample (30000) leaves the 30 s window.
    leak.onFlowSample(sample(61000, 0.0f));
    TEST_ASSERT_FALSE(leak.leak());
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::LeakCleared));

    leak.onFlowSample(sample(62000, 0.0f));
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::LeakCleared));
}

void test_window_evicts_old_samples()
{
    LeakDetector leak(&bus);
    leak.onZoneState(0, true);
    for (uint32_t t = 0; t <= 100000; t += 1000) leak.onFlowSample(sample(t, 0.0f));
    TEST_ASSERT_EQUAL_UINT8(31, leak.sampleCount());
    TEST_ASSERT_EQUAL_UINT8(0, leak.nonZeroPct());
}

void test_events_drive_detector_through_bus()
{
    LeakDetector leak(&bus);
    TEST_ASSERT_TRUE(leak.attach());

    ZoneStatePayload z{};
    z.zoneId = 1;
    z.active = true;
    bus.post(EventId::ZoneStateChanged, &z, sizeof(z));

    FlowSamplePayload s = sample(1000, 0.3f);
    bus.post(EventId::FlowSampled, &s, sizeof(s));
    bus.dispatch();
    TEST_ASSERT_FALSE(leak.leak());

    z.active = false;
    bus.post(EventId::ZoneStateChanged, &z, sizeof(z));
    ValveEventPayload v{};
    v.tsMs = 2000;
    bus.post(EventId::ValveClosed, &v, sizeof(v));
    s = sample(3000, 0.3f);
    bus.post(EventId::FlowSampled, &s, sizeof(s));
    bus.dispatch();
    TEST_ASSERT_FALSE(leak.leak());

    s = sample(12001, 0.3f);
    bus.post(EventId::FlowSampled, &s, sizeof(s));
    bus.dispatch();
    TEST_ASSERT_TRUE(leak.leak());
}

void test_countdown_marks_zone_active()
{
    LeakDetector leak(&bus);
    TEST_ASSERT_TRUE(leak.attach());

    ZoneCountdownPayload c{};
    c.zoneId = 3;
    c.openValve = 0;
    c.remainingSec = 42;
    bus.post(EventId::ZoneCountdown, &c, sizeof(c));
    bus.dispatch();
    TEST_ASSERT_EQUAL_UINT8(1, leak.activeZones());

    for (uint32_t t = 1000; t <= 20000; t += 1000) {
        FlowSamplePayload s = sample(t, 0.4f);
        bus.post(EventId::FlowSampled, &s, sizeof(s));
    }
    bus.dispatch();
    TEST_ASSERT_FALSE(leak.leak());

    ZoneStatePayload z{};
    z.zoneId = 3;
    z.active = false;
    bus.post(EventId::ZoneStateChanged, &z, sizeof(z));
    bus.dispatch();
    TEST_ASSERT_EQUAL_UINT8(0, leak.activeZones());
}

void test_event_queue_holds_power_off_burst()
{
    TEST_ASSERT_TRUE(Limits::EventQueueLen >= Limits::Irrigation::MaxZones * 3 + 1);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_leak_raised_above_eighty_percent_after_settle);
    RUN_TEST(test_recent_valve_close_suppresses_detection);
    RUN_TEST(test_flag_frozen_while_zone_active);
    RUN_TEST(test_active_flag_stays_set_during_zone_run);
    RUN_TEST(test_leak_clears_when_window_runs_dry);
    RUN_TEST(test_window_evicts_old_samples);
    RUN_TEST(test_events_drive_detector_through_bus);
    RUN_TEST(test_countdown_marks_zone_active);
    RUN_TEST(test_event_queue_holds_power_off_burst);
    return UNITY_END();
}
