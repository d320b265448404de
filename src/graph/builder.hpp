// Chromatone: fixed signal topology of the Prism voice set
#pragma once
#include <array>
#include <memory>
#include <vector>
#include "nodes.hpp"
#include "../dsp/audio.hpp"

namespace chromatone { namespace graph {

constexpr int WAVEFORM_COUNT = 3;  // square, sawtooth, sine
constexpr int VOICE_COUNT = 4;

enum VoiceRole {
    VOICE_ROOT = 0,
    VOICE_THIRD = 1,
    VOICE_FIFTH = 2,
    VOICE_SEVENTH = 3
};

// Chord-free interval of each voice above the root, in semitones
constexpr int DEFAULT_VOICE_INTERVALS[VOICE_COUNT] = {0, 4, 7, 0};

// Three oscillators sharing pitch, each through its own gain, merged
struct WaveformChain {
    std::array<OscillatorNode*, WAVEFORM_COUNT> oscillators;  // indexed by dsp::Waveform
    std::array<GainNode*, WAVEFORM_COUNT> gains;
    MixNode* merge = nullptr;

    OscillatorNode* oscillator(dsp::Waveform w) const { return oscillators[(int)w]; }
    GainNode* gain(dsp::Waveform w) const { return gains[(int)w]; }
};

struct FrequencyVoice {
    VoiceRole role = VOICE_ROOT;
    int defaultIntervalSemitones = 0;
    WaveformChain chain;
    GainNode* output = nullptr;

    float defaultDetuneCents() const { return defaultIntervalSemitones * 100.f; }
};

// Effect ("wet") and bypass ("dry") gains feeding one merge point
struct WetDryPath {
    GainNode* wet = nullptr;
    GainNode* dry = nullptr;
    MixNode* merge = nullptr;
};

struct GraphOptions {
    float sampleRate = 44100.f;
    float volume = 0.1f;
    float lfoFrequency = 15.f;
    float lfoIntensity = 0.25f;
    float initialFrequency = 440.f;
    dsp::CrossfadeCurve curve = dsp::CrossfadeCurve::LINEAR;
};

/**
 * voices -> voiceMerge -> gate -> lfoStage -> reverb wet/dry -> volume -> out
 * The LFO wet/dry merge drives lfoStage's gain parameter (intrinsic value 0).
 */
class SignalGraph {
public:
    std::array<FrequencyVoice, VOICE_COUNT> voices;
    MixNode* voiceMerge = nullptr;
    GainNode* gate = nullptr;

    OscillatorNode* lfo = nullptr;
    ConstantSourceNode* lfoBypass = nullptr;
    WetDryPath lfoPath;
    GainNode* lfoStage = nullptr;

    ConvolverNode* reverb = nullptr;
    WetDryPath reverbPath;

    GainNode* volume = nullptr;

    dsp::CrossfadeCurve curve = dsp::CrossfadeCurve::LINEAR;

    double getCurrentTime() const { return currentTime; }
    float getSampleRate() const { return sampleRate; }
    void setSampleRate(float rate) { sampleRate = rate; }
    size_t nodeCount() const { return nodes.size(); }

    // Render one block and advance the audio clock
    void render(float* out);

    template <typename T>
    T* add(T* node) {
        nodes.push_back(std::unique_ptr<AudioNode>(node));
        return node;
    }

    template <typename F>
    void forEachOscillator(F fn) const {
        for (const FrequencyVoice& voice : voices) {
            for (OscillatorNode* osc : voice.chain.oscillators) fn(voice, osc);
        }
    }

private:
    friend std::unique_ptr<SignalGraph> buildSignalGraph(const GraphOptions& options);

    std::vector<std::unique_ptr<AudioNode>> nodes; // processing order
    double currentTime = 0.0;
    float sampleRate = 44100.f;
};

std::unique_ptr<SignalGraph> buildSignalGraph(const GraphOptions& options);

// wet = f(intensity), dry = f(1 - intensity), written at the given time
void applyWetDry(const WetDryPath& path, float intensity, dsp::CrossfadeCurve curve, double time);

}} // namespace chromatone::graph
