#include <unity.h>

#include "Modules/IrrigationModule/FlowSampler.h"
#include "support/TestEventChannel.h"

static TestEventChannel bus;

void setUp()
{
    bus.reset();
}

void tearDown() {}

void test_compute_rate_and_volume()
{
    float rate = -1.0f;
    float volume = -1.0f;

    // 7.5 Hz on a 1/7.5 L/min-per-Hz sensor is 1 L/min.
    FlowSampler::compute(450, 60000, 1.0f / 7.5f, rate, volume);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.0f, rate);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.0f, volume);

    FlowSampler::compute(20, 1000, 0.5f, rate, volume);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0f, rate);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 10.0f / 60.0f, volume);

    FlowSampler::compute(20, 0, 0.5f, rate, volume);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, rate);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, volume);
}

void test_sample_requires_begin_and_full_period()
{
    FlowSampler flow(&bus);
    flow.setCalibration(0.5f);
    TEST_ASSERT_FALSE(flow.sample(1000, 1000));

    flow.begin(0);
    TEST_ASSERT_TRUE(flow.started());
    for (int i = 0; i < 20; ++i) flow.onPulse();
    TEST_ASSERT_FALSE(flow.sample(999, 1000));

    FlowSamplePayload out{};
    TEST_ASSERT_TRUE(flow.sample(1000, 1000, &out));
    TEST_ASSERT_EQUAL_UINT32(1000, out.tsMs);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0f, out.rateLpm);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0f, flow.lastRateLpm());
    TEST_ASSERT_EQUAL_UINT16(1, bus.count(EventId::FlowSampled));
}

void test_counter_resets_each_sample()
{
    FlowSampler flow(&bus);
    flow.setCalibration(0.5f);
    flow.begin(0);

    for (int i = 0; i < 60; ++i) flow.onPulse();
    flow.sample(1000, 1000);
    flow.sample(2000, 1000);

    FlowSamplePayload p{};
    TEST_ASSERT_TRUE(bus.last(EventId::FlowSampled, p));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.rateLpm);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, p.volumeL);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.5f, flow.totalVolumeL());
}

void test_late_sample_uses_real_interval()
{
    FlowSampler flow(&bus);
    flow.setCalibration(0.5f);
    flow.begin(0);

    for (int i = 0; i < 40; ++i) flow.onPulse();
    FlowSamplePayload out{};
    TEST_ASSERT_TRUE(flow.sample(2000, 1000, &out));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0f, out.rateLpm);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 10.0f / 30.0f, out.volumeL);
}

void test_uncalibrated_sensor_reports_no_flow()
{
    FlowSampler flow(&bus);
    flow.begin(0);
    for (int i = 0; i < 100; ++i) flow.onPulse();

    FlowSamplePayload out{};
    TEST_ASSERT_TRUE(flow.sample(1000, 1000, &out));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, out.rateLpm);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, out.volumeL);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_compute_rate_and_volume);
    RUN_TEST(test_sample_requires_begin_and_full_period);
    RUN_TEST(test_counter_resets_each_sample);
    RUN_TEST(test_late_sample_uses_real_interval);
    RUN_TEST(test_uncalibrated_sensor_reports_no_flow);
    return UNITY_END();
}
