#include <unity.h>
#include <string.h>

#include "Modules/IrrigationModule/PowerScheduler.h"
#include "Modules/IrrigationModule/RequestDebouncer.h"
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

static void defineZones(ZoneController& zc, uint8_t n)
{
    for (uint8_t i = 0; i < n; ++i) {
        ZoneDefinition def{};
        def.enabled = true;
        def.runtimeSec = 60;
        def.pinCount = 1;
        def.pins[0] = (uint8_t)(17 + i);
        zc.defineZone(i, def, 0);
    }
}

static ActivationRequest req(RequestSource source, uint8_t zone, bool on)
{
    ActivationRequest r{};
    r.source = source;
    r.zoneId = zone;
    r.on = on;
    return r;
}

void test_resolve_system_fan_out_keeps_system_only()
{
    const ActivationRequest batch[] = {
        req(RequestSource::System, 0, true),
        req(RequestSource::Zone, 0, true),
        req(RequestSource::Zone, 1, true),
        req(RequestSource::Zone, 2, true),
    };
    bool suppressed[4] = {false};
    TEST_ASSERT_EQUAL_UINT8(1, RequestDebouncer::resolve(batch, 4, 3, suppressed));
    TEST_ASSERT_FALSE(suppressed[0]);
    TEST_ASSERT_TRUE(suppressed[1]);
    TEST_ASSERT_TRUE(suppressed[2]);
    TEST_ASSERT_TRUE(suppressed[3]);
}

void test_resolve_single_zone_drops_system()
{
    const ActivationRequest batch[] = {
        req(RequestSource::Switch, 0, true),
        req(RequestSource::Zone, 2, true),
    };
    bool suppressed[2] = {false};
    TEST_ASSERT_EQUAL_UINT8(1, RequestDebouncer::resolve(batch, 2, 3, suppressed));
    TEST_ASSERT_TRUE(suppressed[0]);
    TEST_ASSERT_FALSE(suppressed[1]);
}

void test_resolve_mixed_batch_keeps_everything()
{
    const ActivationRequest batch[] = {
        req(RequestSource::System, 0, true),
        req(RequestSource::System, 0, false),
        req(RequestSource::Zone, 0, true),
        req(RequestSource::Zone, 1, true),
    };
    bool suppressed[4] = {false};
    TEST_ASSERT_EQUAL_UINT8(4, RequestDebouncer::resolve(batch, 4, 3, suppressed));
}

void test_resolve_single_enabled_zone_keeps_system()
{
    const ActivationRequest batch[] = {
        req(RequestSource::System, 0, true),
        req(RequestSource::Zone, 0, true),
    };
    bool suppressed[2] = {false};
    TEST_ASSERT_EQUAL_UINT8(1, RequestDebouncer::resolve(batch, 2, 1, suppressed));
    TEST_ASSERT_FALSE(suppressed[0]);
    TEST_ASSERT_TRUE(suppressed[1]);
}

void test_system_on_with_one_enabled_zone_powers_up_only()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    RequestDebouncer deb(zc, power);
    defineZones(zc, 1);
    power.begin(false, 0);

    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::System, 0, true), 0));
    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::Zone, 0, true), 100));
    TEST_ASSERT_TRUE(deb.tick(IrrigationDefaults::DebounceWindowMs + 100));

    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_EQUAL_UINT8(0, io.energizedCount());
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::PowerChanged));
}

void test_voice_system_on_powers_up_without_starting_zones()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    RequestDebouncer deb(zc, power);
    defineZones(zc, 3);
    power.begin(false, 0);

    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::System, 0, true), 0));
    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::Zone, 0, true), 100));
    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::Zone, 1, true), 150));
    TEST_ASSERT_TRUE(deb.submit(req(RequestSource::Zone, 2, true), 200));

    TEST_ASSERT_FALSE(deb.tick(IrrigationDefaults::DebounceWindowMs - 1));
    TEST_ASSERT_FALSE(power.powered());

    TEST_ASSERT_TRUE(deb.tick(IrrigationDefaults::DebounceWindowMs));
    TEST_ASSERT_FALSE(deb.pending());
    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_EQUAL_UINT8(0, zc.activeCount());
    TEST_ASSERT_EQUAL_UINT8(0, io.energizedCount());

    // Dropped zone requests are shown inactive again.
    zc.tick(IrrigationDefaults::DebounceWindowMs + IrrigationDefaults::RevertDelayMs);
    uint8_t reverted = 0;
    ZoneStatePayload s{};
    for (uint16_t i = 0; bus.nth(EventId::ZoneStateChanged, i, s); ++i) {
        if (s.reason == ZoneChangeReason::Reverted) reverted++;
    }
    TEST_ASSERT_EQUAL_UINT8(3, reverted);
}

void test_single_zone_request_does_not_touch_power()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    RequestDebouncer deb(zc, power);
    defineZones(zc, 3);
    power.begin(true, 0);

    deb.submit(req(RequestSource::System, 0, false), 0);
    deb.submit(req(RequestSource::Zone, 1, true), 50);
    deb.tick(IrrigationDefaults::DebounceWindowMs);

    TEST_ASSERT_TRUE(power.powered());
    TEST_ASSERT_TRUE(zc.isActive(1));
    TEST_ASSERT_TRUE(io.energized(18));
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::PowerChanged));
}

void test_window_starts_at_first_request()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    RequestDebouncer deb(zc, power);
    defineZones(zc, 3);
    power.begin(true, 0);

    deb.submit(req(RequestSource::Zone, 0, true), 1000);
    deb.submit(req(RequestSource::Zone, 0, false), 1400);
    TEST_ASSERT_EQUAL_UINT8(2, deb.pendingCount());

    TEST_ASSERT_FALSE(deb.tick(1499));
    TEST_ASSERT_TRUE(deb.tick(1500));
    TEST_ASSERT_FALSE(zc.isActive(0));
    TEST_ASSERT_EQUAL_UINT32(1, io.opens);

    // A new request opens a fresh window.
    deb.submit(req(RequestSource::Zone, 2, true), 5000);
    TEST_ASSERT_FALSE(deb.tick(5100));
    TEST_ASSERT_TRUE(deb.tick(5500));
    TEST_ASSERT_TRUE(zc.isActive(2));
}

void test_full_batch_rejects_requests()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    RequestDebouncer deb(zc, power);

    for (uint8_t i = 0; i < Limits::Irrigation::DebounceBatch; ++i) {
        TEST_ASSERT_TRUE(deb.submit(req(RequestSource::Zone, 0, false), 0));
    }
    TEST_ASSERT_FALSE(deb.submit(req(RequestSource::Zone, 0, false), 10));
    TEST_ASSERT_EQUAL_UINT8(Limits::Irrigation::DebounceBatch, deb.pendingCount());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_resolve_system_fan_out_keeps_system_only);
    RUN_TEST(test_resolve_single_zone_drops_system);
    RUN_TEST(test_resolve_mixed_batch_keeps_everything);
    RUN_TEST(test_resolve_single_enabled_zone_keeps_system);
    RUN_TEST(test_system_on_with_one_enabled_zone_powers_up_only);
    RUN_TEST(test_voice_system_on_powers_up_without_starting_zones);
    RUN_TEST(test_single_zone_request_does_not_touch_power);
    RUN_TEST(test_window_starts_at_first_request);
    RUN_TEST(test_full_batch_rejects_requests);
    return UNITY_END();
}
