/**
 * @file FlowSampler.cpp
 * @brief Implementation file.
 */
#include "FlowSampler.h"

void FlowSampler::begin(uint32_t nowMs)
{
    pulses_.store(0U, std::memory_order_relaxed);
    anchorMs_ = nowMs;
    lastRateLpm_ = 0.0f;
    started_ = true;
}

void FlowSampler::compute(uint32_t pulses, uint32_t elapsedMs, float lpmPerHz, float& rateLpm, float& volumeL)
{
    rateLpm = 0.0f;
    volumeL = 0.0f;
    if (elapsedMs == 0) return;

    const float hz = (float)pulses / ((float)elapsedMs / 1000.0f);
    rateLpm = hz * lpmPerHz;
    volumeL = rateLpm * ((float)elapsedMs / 60000.0f);
}

bool FlowSampler::sample(uint32_t nowMs, uint32_t periodMs, FlowSamplePayload* out)
{
    if (!started_) return false;

    const uint32_t elapsed = nowMs - anchorMs_;
    if (elapsed == 0 || elapsed < periodMs) return false;

    const uint32_t pulses = pulses_.exchange(0U, std::memory_order_relaxed);
    anchorMs_ = nowMs;

    FlowSamplePayload p{};
    p.tsMs = nowMs;
    compute(pulses, elapsed, lpmPerHz_, p.rateLpm, p.volumeL);

    lastRateLpm_ = p.rateLpm;
    totalVolumeL_ += p.volumeL;

    if (bus_) bus_->post(EventId::FlowSampled, &p, sizeof(p));
    if (out) *out = p;
    return true;
}
