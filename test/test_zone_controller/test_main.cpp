#include <unity.h>
#include <string.h>

#include "Modules/IrrigationModule/ZoneController.h"
#include "support/FakeIo.h"
#include "support/TestEventChannel.h"

static TestEventChannel bus;
static FakeIo io;

void setUp()
{
    bus.reset();
    io.reset();
}

void tearDown() {}

static ZoneDefinition makeZone(const char* name, uint32_t runtimeSec, uint8_t pinCount, uint8_t firstPin)
{
    ZoneDefinition def{};
    strncpy(def.name, name, sizeof(def.name) - 1);
    def.enabled = true;
    def.runtimeSec = runtimeSec;
    def.pinCount = pinCount;
    for (uint8_t i = 0; i < pinCount; ++i) def.pins[i] = (uint8_t)(firstPin + i);
    return def;
}

static void postFlow(uint32_t tsMs, float volumeL)
{
    FlowSamplePayload p{};
    p.tsMs = tsMs;
    p.volumeL = volumeL;
    bus.post(EventId::FlowSampled, &p, sizeof(p));
    bus.dispatch();
}

static bool lastState(ZoneStatePayload& out)
{
    return bus.last(EventId::ZoneStateChanged, out);
}

void test_activate_opens_valve_and_reports_runtime()
{
    ZoneController zc(&bus, io.service());
    TEST_ASSERT_TRUE(zc.defineZone(0, makeZone("Lawn", 120, 1, 17), 0));

    TEST_ASSERT_TRUE(zc.activate(0, 1000));
    TEST_ASSERT_TRUE(zc.isActive(0));
    TEST_ASSERT_TRUE(io.energized(17));

    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(lastState(s));
    TEST_ASSERT_TRUE(s.active);
    TEST_ASSERT_EQUAL_UINT32(120, s.remainingSec);

    // Second activate is idempotent.
    TEST_ASSERT_TRUE(zc.activate(0, 2000));
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ZoneStateChanged));
}

void test_unknown_and_disabled_zones_are_rejected()
{
    ZoneController zc(&bus, io.service());
    ZoneDefinition def = makeZone("Beds", 60, 1, 17);
    def.enabled = false;
    zc.defineZone(1, def, 0);

    TEST_ASSERT_FALSE(zc.activate(0, 0));
    TEST_ASSERT_FALSE(zc.activate(ZoneController::MAX_ZONES, 0));
    TEST_ASSERT_FALSE(zc.activate(1, 0));
    TEST_ASSERT_FALSE(zc.isActive(1));
    TEST_ASSERT_FALSE(io.energized(17));
    TEST_ASSERT_FALSE(zc.deactivate(0, 0));
}

void test_runtime_expiry_stops_zone()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 5, 1, 17), 0);
    zc.activate(0, 0);

    for (uint32_t t = 1000; t < 5000; t += 1000) {
        zc.tick(t);
        TEST_ASSERT_TRUE(zc.isActive(0));
    }
    ZoneCountdownPayload c{};
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneCountdown, c));
    TEST_ASSERT_EQUAL_UINT32(1, c.remainingSec);
    TEST_ASSERT_EQUAL_UINT8(0, c.openValve);

    zc.tick(5000);
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_FALSE(io.energized(17));

    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(lastState(s));
    TEST_ASSERT_FALSE(s.active);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::Expired, (uint8_t)s.reason);

    bus.dispatch();
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ZoneSessionEnded));
}

void test_runtime_is_capped_by_max_runtime()
{
    ZoneController zc(&bus, io.service());
    zc.setMaxRuntimeSec(60);
    zc.defineZone(0, makeZone("Lawn", 600, 1, 17), 0);

    ZoneSnapshot snap{};
    TEST_ASSERT_TRUE(zc.snapshot(0, snap));
    TEST_ASSERT_EQUAL_UINT32(60, snap.runtimeSec);
}

void test_virtual_zone_opens_one_valve_at_a_time()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Hedge", 30, 3, 17), 0);
    zc.activate(0, 0);

    TEST_ASSERT_TRUE(io.energized(17));
    TEST_ASSERT_EQUAL_UINT8(1, zc.openValveCount(0));

    for (uint32_t t = 1000; t < 30000; t += 1000) {
        zc.tick(t);
        TEST_ASSERT_TRUE(zc.isActive(0));
        TEST_ASSERT_EQUAL_UINT8(1, zc.openValveCount(0));
        TEST_ASSERT_EQUAL_UINT8(1, io.energizedCount());

        const uint8_t expected = (uint8_t)(17 + t / 10000);
        TEST_ASSERT_TRUE(io.energized(expected));
    }

    zc.tick(30000);
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_EQUAL_UINT8(0, io.energizedCount());
}

void test_three_valve_zone_slices_runtime_evenly()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Orchard", 300, 3, 25), 0);
    zc.activate(0, 0);

    for (uint32_t t = 1000; t < 300000; t += 1000) {
        zc.tick(t);
        if (t == 99000) TEST_ASSERT_TRUE(io.energized(25));
        if (t == 100000) TEST_ASSERT_TRUE(io.energized(26));
        if (t == 199000) TEST_ASSERT_TRUE(io.energized(26));
        if (t == 200000) TEST_ASSERT_TRUE(io.energized(27));
        if (t == 299000) TEST_ASSERT_TRUE(io.energized(27));
    }

    zc.tick(300000);
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_EQUAL_UINT8(0, zc.openValveCount(0));
    TEST_ASSERT_EQUAL_UINT8(0, io.energizedCount());
}

void test_virtual_zone_catches_up_after_missed_ticks()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Hedge", 30, 3, 17), 0);
    zc.activate(0, 0);

    zc.tick(25000);
    TEST_ASSERT_EQUAL_UINT8(1, zc.openValveCount(0));
    TEST_ASSERT_TRUE(io.energized(19));
    TEST_ASSERT_FALSE(io.energized(17));
    TEST_ASSERT_FALSE(io.energized(18));
}

void test_max_active_evicts_least_remaining()
{
    ZoneController zc(&bus, io.service());
    zc.setMaxActive(2);
    zc.defineZone(0, makeZone("A", 100, 1, 17), 0);
    zc.defineZone(1, makeZone("B", 50, 1, 18), 0);
    zc.defineZone(2, makeZone("C", 80, 1, 19), 0);

    zc.activate(0, 0);
    zc.activate(1, 0);
    TEST_ASSERT_EQUAL_UINT8(2, zc.activeCount());

    TEST_ASSERT_TRUE(zc.activate(2, 1000));
    TEST_ASSERT_EQUAL_UINT8(2, zc.activeCount());
    TEST_ASSERT_TRUE(zc.isActive(0));
    TEST_ASSERT_FALSE(zc.isActive(1));
    TEST_ASSERT_TRUE(zc.isActive(2));

    ZoneStatePayload s{};
    bool sawEviction = false;
    for (uint16_t i = 0; bus.nth(EventId::ZoneStateChanged, i, s); ++i) {
        if (s.zoneId == 1 && !s.active) {
            TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::Evicted, (uint8_t)s.reason);
            sawEviction = true;
        }
    }
    TEST_ASSERT_TRUE(sawEviction);
}

void test_single_active_zone_by_default()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("A", 100, 1, 17), 0);
    zc.defineZone(1, makeZone("B", 100, 1, 18), 0);

    zc.activate(0, 0);
    zc.activate(1, 500);
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_TRUE(zc.isActive(1));
    TEST_ASSERT_FALSE(io.energized(17));
    TEST_ASSERT_TRUE(io.energized(18));
}

void test_reactivation_ignores_previous_countdown()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 10, 1, 17), 0);

    zc.activate(0, 0);
    zc.deactivate(0, 5000);
    zc.activate(0, 6000);

    // The first run would have ended at 10000.
    zc.tick(10000);
    zc.tick(11000);
    TEST_ASSERT_TRUE(zc.isActive(0));

    ZoneSnapshot snap{};
    zc.snapshot(0, snap);
    TEST_ASSERT_EQUAL_UINT32(5, snap.remainingSec);

    zc.tick(16000);
    TEST_ASSERT_FALSE(zc.isActive(0));
}

void test_powered_off_request_is_reverted()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 10, 1, 17), 0);
    zc.setPowered(false);

    TEST_ASSERT_FALSE(zc.activate(0, 0));
    TEST_ASSERT_FALSE(io.energized(17));

    zc.tick(IrrigationDefaults::RevertDelayMs - 1);
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ZoneStateChanged));

    zc.tick(IrrigationDefaults::RevertDelayMs);
    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(lastState(s));
    TEST_ASSERT_FALSE(s.active);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::Reverted, (uint8_t)s.reason);
}

void test_stale_revert_is_dropped()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 10, 1, 17), 0);
    zc.setPowered(false);
    zc.activate(0, 0);

    zc.setPowered(true);
    TEST_ASSERT_TRUE(zc.activate(0, 100));
    zc.tick(1000);

    ZoneStatePayload s{};
    for (uint16_t i = 0; bus.nth(EventId::ZoneStateChanged, i, s); ++i) {
        TEST_ASSERT_NOT_EQUAL((uint8_t)ZoneChangeReason::Reverted, (uint8_t)s.reason);
    }
    TEST_ASSERT_TRUE(zc.isActive(0));
}

void test_session_summary_totals_all_valves()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Hedge", 20, 2, 17), 0);

    zc.activate(0, 0);
    postFlow(1000, 1.0f);
    zc.tick(10000);          // hand-off to the second valve
    bus.dispatch();
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ZoneSessionEnded));

    postFlow(11000, 2.0f);
    zc.deactivate(0, 15000);
    bus.dispatch();

    ZoneSessionPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneSessionEnded, p));
    TEST_ASSERT_EQUAL_UINT8(0, p.zoneId);
    TEST_ASSERT_EQUAL_FLOAT(3.0f, p.waterL);
    TEST_ASSERT_EQUAL_UINT32(15, p.durationSec);
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ZoneSessionEnded));
}

void test_immediate_restart_reports_previous_session()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 120, 1, 17), 0);

    zc.activate(0, 0);
    for (uint32_t t = 1000; t <= 10000; t += 1000) postFlow(t, 1.0f);

    // Stop and restart before the queued close record is delivered.
    zc.deactivate(0, 11000);
    TEST_ASSERT_TRUE(zc.activate(0, 11000));
    bus.dispatch();

    ZoneSessionPayload p{};
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ZoneSessionEnded));
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneSessionEnded, p));
    TEST_ASSERT_EQUAL_FLOAT(10.0f, p.waterL);
    TEST_ASSERT_EQUAL_UINT32(11, p.durationSec);

    // The new run starts from zero.
    postFlow(12000, 0.5f);
    ZoneSnapshot snap;
    TEST_ASSERT_TRUE(zc.snapshot(0, snap));
    TEST_ASSERT_TRUE(snap.active);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, snap.sessionWaterL);

    zc.deactivate(0, 14000);
    TEST_ASSERT_EQUAL_UINT16(2, bus.count(EventId::ZoneSessionEnded));
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneSessionEnded, p));
    TEST_ASSERT_EQUAL_FLOAT(0.5f, p.waterL);
    TEST_ASSERT_EQUAL_UINT32(3, p.durationSec);
}

void test_disable_running_zone_stops_it()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 60, 1, 17), 0);
    zc.activate(0, 0);

    TEST_ASSERT_TRUE(zc.setZoneEnabled(0, false, 1000));
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_FALSE(io.energized(17));

    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(lastState(s));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::Disabled, (uint8_t)s.reason);

    ZoneConfigPayload c{};
    TEST_ASSERT_TRUE(bus.last(EventId::ZoneConfigChanged, c));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneConfigField::Enabled, (uint8_t)c.field);
    TEST_ASSERT_FALSE(zc.activate(0, 2000));
}

void test_runtime_and_name_validation()
{
    ZoneController zc(&bus, io.service());
    zc.setMaxRuntimeSec(3600);
    zc.defineZone(0, makeZone("Lawn", 60, 1, 17), 0);

    TEST_ASSERT_FALSE(zc.setZoneRuntime(0, 0));
    TEST_ASSERT_FALSE(zc.setZoneRuntime(0, 3601));
    TEST_ASSERT_FALSE(zc.setZoneRuntime(5, 60));
    TEST_ASSERT_TRUE(zc.setZoneRuntime(0, 3600));

    TEST_ASSERT_FALSE(zc.renameZone(0, ""));
    TEST_ASSERT_FALSE(zc.renameZone(0, nullptr));
    TEST_ASSERT_TRUE(zc.renameZone(0, "Front lawn"));

    ZoneSnapshot snap{};
    zc.snapshot(0, snap);
    TEST_ASSERT_EQUAL_UINT32(3600, snap.runtimeSec);
    TEST_ASSERT_EQUAL_STRING("Front lawn", snap.name);
    TEST_ASSERT_EQUAL_UINT16(2, bus.count(EventId::ZoneConfigChanged));

    // Unchanged values do not emit.
    TEST_ASSERT_TRUE(zc.renameZone(0, "Front lawn"));
    TEST_ASSERT_TRUE(zc.setZoneRuntime(0, 3600));
    TEST_ASSERT_EQUAL_UINT16(2, bus.count(EventId::ZoneConfigChanged));
}

void test_rename_mid_run_keeps_countdown()
{
    ZoneController zc(&bus, io.service());
    zc.defineZone(0, makeZone("Lawn", 60, 1, 17), 0);
    zc.activate(0, 0);
    zc.tick(20000);

    ZoneSnapshot before{};
    zc.snapshot(0, before);
    TEST_ASSERT_TRUE(zc.renameZone(0, "Back lawn"));

    ZoneSnapshot after{};
    zc.snapshot(0, after);
    TEST_ASSERT_TRUE(after.active);
    TEST_ASSERT_EQUAL_UINT32(before.remainingSec, after.remainingSec);
    TEST_ASSERT_EQUAL_UINT32(before.generation, after.generation);

    zc.tick(60000);
    TEST_ASSERT_FALSE(zc.isActive(0));
}

void test_unnamed_zone_gets_default_name()
{
    ZoneController zc(&bus, io.service());
    ZoneDefinition def = makeZone("", 60, 1, 17);
    zc.defineZone(2, def, 0);

    ZoneSnapshot snap{};
    zc.snapshot(2, snap);
    TEST_ASSERT_EQUAL_STRING("Zone 3", snap.name);
}

void test_force_close_all_releases_every_relay()
{
    ZoneController zc(&bus, io.service());
    zc.setMaxActive(2);
    zc.defineZone(0, makeZone("A", 60, 1, 17), 0);
    zc.defineZone(1, makeZone("B", 60, 2, 20), 0);
    zc.activate(0, 0);
    zc.activate(1, 0);
    TEST_ASSERT_EQUAL_UINT8(2, io.energizedCount());

    zc.forceCloseAll(1000);
    TEST_ASSERT_EQUAL_UINT8(0, io.energizedCount());
    TEST_ASSERT_EQUAL_UINT8(0, zc.activeCount());

    ZoneStatePayload s{};
    TEST_ASSERT_TRUE(lastState(s));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)ZoneChangeReason::Shutdown, (uint8_t)s.reason);
}

void test_parse_pins()
{
    uint8_t pins[4] = {0};
    TEST_ASSERT_EQUAL_UINT8(3, ZoneController::parsePins("17, 27,22", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(17, pins[0]);
    TEST_ASSERT_EQUAL_UINT8(27, pins[1]);
    TEST_ASSERT_EQUAL_UINT8(22, pins[2]);

    TEST_ASSERT_EQUAL_UINT8(1, ZoneController::parsePins("5", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(0, ZoneController::parsePins("", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(0, ZoneController::parsePins("17,,2", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(0, ZoneController::parsePins("abc", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(0, ZoneController::parsePins("1,2,3,4,5", pins, 4));
    TEST_ASSERT_EQUAL_UINT8(0, ZoneController::parsePins("300", pins, 4));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_activate_opens_valve_and_reports_runtime);
    RUN_TEST(test_unknown_and_disabled_zones_are_rejected);
    RUN_TEST(test_runtime_expiry_stops_zone);
    RUN_TEST(test_runtime_is_capped_by_max_runtime);
    RUN_TEST(test_virtual_zone_opens_one_valve_at_a_time);
    RUN_TEST(test_three_valve_zone_slices_runtime_evenly);
    RUN_TEST(test_virtual_zone_catches_up_after_missed_ticks);
    RUN_TEST(test_max_active_evicts_least_remaining);
    RUN_TEST(test_single_active_zone_by_default);
    RUN_TEST(test_reactivation_ignores_previous_countdown);
    RUN_TEST(test_powered_off_request_is_reverted);
    RUN_TEST(test_stale_revert_is_dropped);
    RUN_TEST(test_session_summary_totals_all_valves);
    RUN_TEST(test_immediate_restart_reports_previous_session);
    RUN_TEST(test_disable_running_zone_stops_it);
    RUN_TEST(test_runtime_and_name_validation);
    RUN_TEST(test_rename_mid_run_keeps_countdown);
    RUN_TEST(test_unnamed_zone_gets_default_name);
    RUN_TEST(test_force_close_all_releases_every_relay);
    RUN_TEST(test_parse_pins);
    return UNITY_END();
}
