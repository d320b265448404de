// Chromatone: node processing
#include <algorithm>
#include "nodes.hpp"

namespace chromatone { namespace graph {

void AudioNode::sumInputs(float* dst) const {
    std::fill(dst, dst + RENDER_QUANTUM, 0.f);
    for (const AudioNode* input : inputs) {
        const float* src = input->output();
        for (int i = 0; i < RENDER_QUANTUM; i++) {
            dst[i] += src[i];
        }
    }
}

void MixNode::process(const RenderContext& ctx) {
    (void)ctx;
    sumInputs(buffer);
}

void GainNode::process(const RenderContext& ctx) {
    sumInputs(buffer);
    if (gain.computeValues(ctx.time, ctx.sampleRate, RENDER_QUANTUM, gainValues)) {
        float g = gainValues[0];
        for (int i = 0; i < RENDER_QUANTUM; i++) buffer[i] *= g;
        return;
    }
    for (int i = 0; i < RENDER_QUANTUM; i++) {
        buffer[i] *= gainValues[i];
    }
}

void ConstantSourceNode::process(const RenderContext& ctx) {
    offset.computeValues(ctx.time, ctx.sampleRate, RENDER_QUANTUM, buffer);
}

void OscillatorNode::process(const RenderContext& ctx) {
    bool steadyFrequency = frequency.computeValues(ctx.time, ctx.sampleRate, RENDER_QUANTUM, frequencyValues);
    bool steadyDetune = detune.computeValues(ctx.time, ctx.sampleRate, RENDER_QUANTUM, detuneValues);
    float nyquist = ctx.sampleRate * 0.5f;

    float steady = 0.f;
    if (steadyFrequency && steadyDetune) {
        steady = dsp::OscillatorHelper::detunedFrequency(frequencyValues[0], detuneValues[0]);
        steady = rack::math::clamp(steady, 0.f, nyquist);
    }

    for (int i = 0; i < RENDER_QUANTUM; i++) {
        float freq = steady;
        if (!(steadyFrequency && steadyDetune)) {
            freq = dsp::OscillatorHelper::detunedFrequency(frequencyValues[i], detuneValues[i]);
            freq = rack::math::clamp(freq, 0.f, nyquist);
        }
        if (periodicWave) {
            buffer[i] = periodicWave->sample(phase, freq, ctx.sampleRate);
        }
        else {
            buffer[i] = dsp::OscillatorHelper::generate(waveform, phase, freq, ctx.sampleRate);
        }
        phase = dsp::OscillatorHelper::advancePhase(phase, freq, ctx.sampleRate);
    }
}

void ConvolverNode::process(const RenderContext& ctx) {
    (void)ctx;
    if (!hasImpulse()) {
        std::fill(buffer, buffer + RENDER_QUANTUM, 0.f);
        return;
    }
    sumInputs(scratch);
    convolver->process(scratch, buffer);
}

}} // namespace chromatone::graph
