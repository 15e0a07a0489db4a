#include <unity.h>
#include <ArduinoJson.h>
#include <string.h>

#include "Modules/IrrigationModule/FlowSampler.h"
#include "Modules/IrrigationModule/IrrigationStatus.h"
#include "Modules/IrrigationModule/LeakDetector.h"
#include "Modules/IrrigationModule/PowerScheduler.h"
#include "Modules/IrrigationModule/ZoneController.h"
#include "support/FakeIo.h"
#include "support/TestEventChannel.h"

static TestEventChannel bus;
static FakeIo io;
static char out[2048];
static StaticJsonDocument<2048> parsed;

void setUp()
{
    bus.reset();
    io.reset();
    memset(out, 0, sizeof(out));
    parsed.clear();
}

void tearDown() {}

static void defineZone(ZoneController& zc, uint8_t id, const char* name, uint8_t pins)
{
    ZoneDefinition def{};
    strncpy(def.name, name, sizeof(def.name) - 1);
    def.enabled = true;
    def.runtimeSec = 90;
    def.pinCount = pins;
    for (uint8_t i = 0; i < pins; ++i) def.pins[i] = (uint8_t)(17 + id * 4 + i);
    zc.defineZone(id, def, 0);
}

void test_status_reports_zones_and_power()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    LeakDetector leak(&bus);
    FlowSampler flow(&bus);
    defineZone(zc, 0, "Lawn", 1);
    defineZone(zc, 3, "Hedge", 3);
    power.begin(true, 0);
    zc.activate(3, 1000);
    zc.tick(11000);

    TEST_ASSERT_TRUE(buildIrrigationStatusJson(zc, power, &leak, &flow, out, sizeof(out)));
    TEST_ASSERT_FALSE(deserializeJson(parsed, out));

    TEST_ASSERT_TRUE(parsed["ok"].as<bool>());
    TEST_ASSERT_TRUE(parsed["power"].as<bool>());
    TEST_ASSERT_EQUAL_UINT32(0, parsed["pause_until"].as<uint32_t>());
    TEST_ASSERT_EQUAL_UINT8(1, parsed["active"].as<uint8_t>());
    TEST_ASSERT_FALSE(parsed["leak"].as<bool>());
    TEST_ASSERT_TRUE(parsed["flow_lpm"].isNull());

    JsonArray zones = parsed["zones"].as<JsonArray>();
    TEST_ASSERT_EQUAL_UINT32(2, zones.size());

    JsonObject lawn = zones[0].as<JsonObject>();
    TEST_ASSERT_EQUAL_UINT8(0, lawn["id"].as<uint8_t>());
    TEST_ASSERT_EQUAL_STRING("Lawn", lawn["name"].as<const char*>());
    TEST_ASSERT_FALSE(lawn["active"].as<bool>());
    TEST_ASSERT_FALSE(lawn.containsKey("remaining_s"));

    JsonObject hedge = zones[1].as<JsonObject>();
    TEST_ASSERT_EQUAL_UINT8(3, hedge["id"].as<uint8_t>());
    TEST_ASSERT_TRUE(hedge["active"].as<bool>());
    TEST_ASSERT_EQUAL_UINT8(3, hedge["valves"].as<uint8_t>());
    TEST_ASSERT_EQUAL_UINT32(80, hedge["remaining_s"].as<uint32_t>());
    TEST_ASSERT_EQUAL_UINT8(0, hedge["open_valve"].as<uint8_t>());
}

void test_status_without_optional_features()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    FlowSampler flow(&bus);
    flow.begin(0);
    power.begin(false, 1704110400UL);

    TEST_ASSERT_TRUE(buildIrrigationStatusJson(zc, power, nullptr, &flow, out, sizeof(out)));
    TEST_ASSERT_FALSE(deserializeJson(parsed, out));

    TEST_ASSERT_FALSE(parsed["power"].as<bool>());
    TEST_ASSERT_EQUAL_UINT32(1704110400UL, parsed["pause_until"].as<uint32_t>());
    TEST_ASSERT_TRUE(parsed["leak"].isNull());
    TEST_ASSERT_FALSE(parsed["flow_lpm"].isNull());
    TEST_ASSERT_EQUAL_UINT32(0, parsed["zones"].as<JsonArray>().size());
}

void test_status_fails_on_small_buffer()
{
    ZoneController zc(&bus, io.service());
    PowerScheduler power(zc, &bus);
    defineZone(zc, 0, "Lawn", 1);

    char tiny[32];
    TEST_ASSERT_FALSE(buildIrrigationStatusJson(zc, power, nullptr, nullptr, tiny, sizeof(tiny)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_status_reports_zones_and_power);
    RUN_TEST(test_status_without_optional_features);
    RUN_TEST(test_status_fails_on_small_buffer);
    return UNITY_END();
}
