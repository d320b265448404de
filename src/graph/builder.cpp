// Chromatone: signal graph construction
#include <rack.hpp>
#include <algorithm>
#include "builder.hpp"

namespace chromatone { namespace graph {

namespace {

const dsp::Waveform CHAIN_WAVEFORMS[WAVEFORM_COUNT] = {
    dsp::Waveform::SQUARE,
    dsp::Waveform::SAWTOOTH,
    dsp::Waveform::SINE
};

WaveformChain createWaveformChain(SignalGraph& graph, float frequency, float detuneCents) {
    WaveformChain chain;
    for (int w = 0; w < WAVEFORM_COUNT; w++) {
        chain.oscillators[w] = graph.add(new OscillatorNode(CHAIN_WAVEFORMS[w], frequency, detuneCents));
    }
    for (int w = 0; w < WAVEFORM_COUNT; w++) {
        chain.gains[w] = graph.add(new GainNode(1.f));
        chain.oscillators[w]->connect(chain.gains[w]);
    }
    chain.merge = graph.add(new MixNode);
    for (GainNode* gain : chain.gains) {
        gain->connect(chain.merge);
    }
    return chain;
}

} // namespace

void applyWetDry(const WetDryPath& path, float intensity, dsp::CrossfadeCurve curve, double time) {
    intensity = rack::math::clamp(intensity, 0.f, 1.f);
    path.wet->gain.setValueAtTime(dsp::AudioProcessor::crossfadeGain(intensity, curve), time);
    path.dry->gain.setValueAtTime(dsp::AudioProcessor::crossfadeGain(1.f - intensity, curve), time);
}

std::unique_ptr<SignalGraph> buildSignalGraph(const GraphOptions& options) {
    std::unique_ptr<SignalGraph> graph(new SignalGraph);
    graph->sampleRate = options.sampleRate;
    graph->curve = options.curve;
    double now = graph->currentTime;

    // Voices
    for (int v = 0; v < VOICE_COUNT; v++) {
        FrequencyVoice& voice = graph->voices[v];
        voice.role = (VoiceRole)v;
        voice.defaultIntervalSemitones = DEFAULT_VOICE_INTERVALS[v];
        voice.chain = createWaveformChain(*graph, options.initialFrequency, voice.defaultDetuneCents());
        voice.output = graph->add(new GainNode(1.f));
        voice.chain.merge->connect(voice.output);
    }

    graph->voiceMerge = graph->add(new MixNode);
    for (FrequencyVoice& voice : graph->voices) {
        voice.output->connect(graph->voiceMerge);
    }

    // Start/stop gate, open
    graph->gate = graph->add(new GainNode(1.f));
    graph->voiceMerge->connect(graph->gate);

    // LFO: sine against a constant, merged into the gain of the LFO stage
    graph->lfo = graph->add(new OscillatorNode(dsp::Waveform::SINE, options.lfoFrequency));
    graph->lfoPath.wet = graph->add(new GainNode(0.f));
    graph->lfo->connect(graph->lfoPath.wet);
    graph->lfoBypass = graph->add(new ConstantSourceNode(1.f));
    graph->lfoPath.dry = graph->add(new GainNode(1.f));
    graph->lfoBypass->connect(graph->lfoPath.dry);
    graph->lfoPath.merge = graph->add(new MixNode);
    graph->lfoPath.wet->connect(graph->lfoPath.merge);
    graph->lfoPath.dry->connect(graph->lfoPath.merge);
    applyWetDry(graph->lfoPath, options.lfoIntensity, options.curve, now);

    graph->lfoStage = graph->add(new GainNode(0.f));
    graph->lfoPath.merge->connect(graph->lfoStage->gain);
    graph->gate->connect(graph->lfoStage);

    // Reverb: fully dry until an impulse response arrives
    graph->reverb = graph->add(new ConvolverNode);
    graph->lfoStage->connect(graph->reverb);
    graph->reverbPath.wet = graph->add(new GainNode(0.f));
    graph->reverb->connect(graph->reverbPath.wet);
    graph->reverbPath.dry = graph->add(new GainNode(1.f));
    graph->lfoStage->connect(graph->reverbPath.dry);
    graph->reverbPath.merge = graph->add(new MixNode);
    graph->reverbPath.wet->connect(graph->reverbPath.merge);
    graph->reverbPath.dry->connect(graph->reverbPath.merge);
    applyWetDry(graph->reverbPath, 0.f, options.curve, now);

    graph->volume = graph->add(new GainNode(rack::math::clamp(options.volume, 0.f, 1.f)));
    graph->reverbPath.merge->connect(graph->volume);

    INFO("Chromatone: built signal graph with %d nodes at %.0f Hz", (int)graph->nodes.size(), options.sampleRate);
    return graph;
}

void SignalGraph::render(float* out) {
    RenderContext ctx;
    ctx.time = currentTime;
    ctx.sampleRate = sampleRate;
    for (std::unique_ptr<AudioNode>& node : nodes) {
        node->process(ctx);
    }
    const float* result = volume->output();
    std::copy(result, result + RENDER_QUANTUM, out);
    currentTime += RENDER_QUANTUM / (double)sampleRate;
}

}} // namespace chromatone::graph
