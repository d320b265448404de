// Chromatone: block-based signal graph nodes
#pragma once
#include <memory>
#include <vector>
#include "param.hpp"
#include "../dsp/oscillators.hpp"
#include "../dsp/convolution.hpp"

namespace chromatone { namespace graph {

// Frames rendered per block
constexpr int RENDER_QUANTUM = 128;

struct RenderContext {
    double time;      // audio-clock time of the first frame in the block
    float sampleRate;
};

/**
 * Base of every processing stage. A node sums the outputs of the nodes
 * connected to it and writes one block into its own output buffer.
 * Nodes must be processed after everything feeding them (inputs and modulators).
 */
class AudioNode {
public:
    virtual ~AudioNode() {}

    void connect(AudioNode* destination) { destination->inputs.push_back(this); }
    void connect(AudioParam& param) { param.addModulator(this); }

    virtual void process(const RenderContext& ctx) = 0;

    const float* output() const { return buffer; }

protected:
    std::vector<AudioNode*> inputs;
    float buffer[RENDER_QUANTUM] = {};

    void sumInputs(float* dst) const;
};

// Summing junction
class MixNode : public AudioNode {
public:
    void process(const RenderContext& ctx) override;
};

class GainNode : public AudioNode {
public:
    explicit GainNode(float initialGain = 1.f) : gain(initialGain) {}

    AudioParam gain;

    void process(const RenderContext& ctx) override;

private:
    float gainValues[RENDER_QUANTUM] = {};
};

// Emits its offset parameter as a signal
class ConstantSourceNode : public AudioNode {
public:
    explicit ConstantSourceNode(float initialOffset = 1.f) : offset(initialOffset) {}

    AudioParam offset;

    void process(const RenderContext& ctx) override;
};

class OscillatorNode : public AudioNode {
public:
    OscillatorNode(dsp::Waveform waveform, float initialFrequency, float initialDetuneCents = 0.f)
        : frequency(initialFrequency), detune(initialDetuneCents), waveform(waveform) {}

    AudioParam frequency; // Hz
    AudioParam detune;    // cents

    // Replaces the band-limited primitive with a wave table; null restores it
    void setPeriodicWave(std::shared_ptr<const dsp::PeriodicWave> wave) { periodicWave = wave; }
    bool hasPeriodicWave() const { return (bool)periodicWave; }
    dsp::Waveform getWaveform() const { return waveform; }

    void process(const RenderContext& ctx) override;

private:
    dsp::Waveform waveform;
    std::shared_ptr<const dsp::PeriodicWave> periodicWave;
    float phase = 0.f;
    float frequencyValues[RENDER_QUANTUM] = {};
    float detuneValues[RENDER_QUANTUM] = {};
};

// Convolution stage; silent until an impulse response is installed
class ConvolverNode : public AudioNode {
public:
    void setConvolver(std::shared_ptr<dsp::PartitionedConvolver> next) { convolver = next; }
    std::shared_ptr<dsp::PartitionedConvolver> getConvolver() const { return convolver; }
    bool hasImpulse() const { return convolver && convolver->hasImpulse(); }

    void process(const RenderContext& ctx) override;

private:
    std::shared_ptr<dsp::PartitionedConvolver> convolver;
    float scratch[RENDER_QUANTUM] = {};
};

}} // namespace chromatone::graph
