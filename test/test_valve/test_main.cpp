#include <unity.h>

#include "Modules/IrrigationModule/Valve.h"
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

static void postFlow(uint32_t tsMs, float volumeL)
{
    FlowSamplePayload p{};
    p.tsMs = tsMs;
    p.rateLpm = volumeL * 60.0f;
    p.volumeL = volumeL;
    bus.post(EventId::FlowSampled, &p, sizeof(p));
    bus.dispatch();
}

void test_configure_releases_relay_and_subscribes()
{
    Valve v;
    v.configure(3, 0, 17, io.service(), &bus);

    TEST_ASSERT_TRUE(v.configured());
    TEST_ASSERT_TRUE(v.hasRelay());
    TEST_ASSERT_FALSE(v.isOpen());
    TEST_ASSERT_EQUAL_UINT32(1, io.closes);
    TEST_ASSERT_EQUAL_UINT16(1, bus.subscriberCount());

    // Reconfiguring does not subscribe twice.
    v.configure(3, 0, 17, io.service(), &bus);
    TEST_ASSERT_EQUAL_UINT16(1, bus.subscriberCount());
}

void test_open_energizes_relay_and_publishes()
{
    Valve v;
    v.configure(1, 0, 17, io.service(), &bus);

    TEST_ASSERT_TRUE(v.open(1000, 7));
    TEST_ASSERT_TRUE(v.isOpen());
    TEST_ASSERT_TRUE(io.energized(17));

    ValveEventPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::ValveOpened, p));
    TEST_ASSERT_EQUAL_UINT8(1, p.valveId);
    TEST_ASSERT_EQUAL_UINT8(17, p.pin);
    TEST_ASSERT_EQUAL_UINT16(7, p.session);

    // Opening an open valve is a no-op.
    TEST_ASSERT_TRUE(v.open(1500, 8));
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ValveOpened));
    TEST_ASSERT_EQUAL_UINT16(7, v.session());
}

void test_volume_accumulates_only_while_open()
{
    Valve v;
    v.configure(0, 0, 17, io.service(), &bus);

    postFlow(500, 1.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, v.waterL());

    v.open(1000);
    postFlow(2000, 0.5f);
    postFlow(3000, 0.25f);
    postFlow(4000, 0.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.75f, v.waterL());

    TEST_ASSERT_TRUE(v.close(11000));
    TEST_ASSERT_FALSE(io.energized(17));

    ValveEventPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::ValveClosed, p));
    TEST_ASSERT_EQUAL_FLOAT(0.75f, p.waterL);
    TEST_ASSERT_EQUAL_UINT32(10, p.durationSec);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, v.waterL());

    postFlow(12000, 2.0f);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, v.waterL());
}

void test_reopen_starts_new_usage_record()
{
    Valve v;
    v.configure(0, 0, 17, io.service(), &bus);

    v.open(0);
    postFlow(1000, 1.0f);
    v.close(2000);

    v.open(3000);
    postFlow(4000, 0.5f);
    v.close(5000);

    ValveEventPayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::ValveClosed, p));
    TEST_ASSERT_EQUAL_FLOAT(0.5f, p.waterL);
    TEST_ASSERT_EQUAL_UINT32(2, p.durationSec);
}

void test_missing_relay_pin_is_inert()
{
    Valve v;
    v.configure(0, 0, IO_PIN_NONE, io.service(), &bus);

    TEST_ASSERT_TRUE(v.configured());
    TEST_ASSERT_FALSE(v.hasRelay());
    TEST_ASSERT_FALSE(v.open(0));
    TEST_ASSERT_FALSE(v.close(100));
    v.forceOff(200);

    TEST_ASSERT_EQUAL_UINT32(0, io.opens);
    TEST_ASSERT_EQUAL_UINT32(0, io.closes);
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ValveOpened));
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ValveClosed));
}

void test_failed_relay_write_keeps_valve_closed()
{
    Valve v;
    v.configure(0, 0, 17, io.service(), &bus);

    io.failWrites = true;
    TEST_ASSERT_FALSE(v.open(0));
    TEST_ASSERT_FALSE(v.isOpen());
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ValveOpened));
}

void test_force_off_closes_silently_when_closed()
{
    Valve v;
    v.configure(0, 0, 17, io.service(), &bus);

    v.forceOff(0);
    TEST_ASSERT_EQUAL_UINT16(0, bus.count(EventId::ValveClosed));
    TEST_ASSERT_EQUAL_UINT32(2, io.closes);

    v.open(1000);
    v.forceOff(2000);
    TEST_ASSERT_FALSE(v.isOpen());
    TEST_ASSERT_FALSE(io.energized(17));
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::ValveClosed));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_configure_releases_relay_and_subscribes);
    RUN_TEST(test_open_energizes_relay_and_publishes);
    RUN_TEST(test_volume_accumulates_only_while_open);
    RUN_TEST(test_reopen_starts_new_usage_record);
    RUN_TEST(test_missing_relay_pin_is_inert);
    RUN_TEST(test_failed_relay_write_keeps_valve_closed);
    RUN_TEST(test_force_off_closes_silently_when_closed);
    return UNITY_END();
}
