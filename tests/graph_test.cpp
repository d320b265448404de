// Automation timeline, nodes and the built topology

#include <catch2/catch.hpp>

#include "graph/builder.hpp"

#include <cmath>
#include <vector>

using namespace chromatone;
using namespace chromatone::graph;

TEST_CASE("AudioParam holds its default without events", "[graph][param]") {
    AudioParam param(0.3f);
    CHECK(param.valueAt(0.0) == Approx(0.3f));
    CHECK(param.valueAt(100.0) == Approx(0.3f));
}

TEST_CASE("AudioParam steps at setValueAtTime", "[graph][param]") {
    AudioParam param(1.f);
    param.setValueAtTime(0.25f, 2.0);
    CHECK(param.valueAt(1.999) == Approx(1.f));
    CHECK(param.valueAt(2.0) == Approx(0.25f));
    CHECK(param.valueAt(5.0) == Approx(0.25f));
}

TEST_CASE("AudioParam ramps linearly between events", "[graph][param]") {
    AudioParam param(0.f);

    SECTION("ramp after a step") {
        param.setValueAtTime(0.f, 1.0);
        param.linearRampToValueAtTime(1.f, 2.0);
        CHECK(param.valueAt(0.5) == Approx(0.f));
        CHECK(param.valueAt(1.5) == Approx(0.5f));
        CHECK(param.valueAt(2.0) == Approx(1.f));
        CHECK(param.valueAt(3.0) == Approx(1.f));
    }

    SECTION("ramp without a previous event starts from the committed value") {
        AudioParam gain(2.f);
        gain.linearRampToValueAtTime(0.f, 4.0);
        CHECK(gain.valueAt(1.0) == Approx(1.5f));
        CHECK(gain.valueAt(2.0) == Approx(1.f));
    }
}

TEST_CASE("AudioParam approaches a target exponentially", "[graph][param]") {
    AudioParam param(1.f);
    param.setTargetAtTime(0.f, 1.0, 0.5);
    CHECK(param.valueAt(1.0) == Approx(1.f));
    CHECK(param.valueAt(1.5) == Approx(std::exp(-1.f)));
    CHECK(param.valueAt(3.0) == Approx(std::exp(-4.f)));

    SECTION("a later step ends the approach") {
        param.setValueAtTime(1.f, 2.0);
        CHECK(param.valueAt(2.5) == Approx(1.f));
    }

    SECTION("zero time constant is a step") {
        AudioParam other(1.f);
        other.setTargetAtTime(0.5f, 1.0, 0.0);
        CHECK(other.valueAt(1.0) == Approx(0.5f));
    }
}

TEST_CASE("cancelScheduledValues drops events at and after the time", "[graph][param]") {
    AudioParam param(0.f);
    param.setValueAtTime(1.f, 1.0);
    param.setValueAtTime(2.f, 2.0);
    param.setValueAtTime(3.f, 3.0);

    param.cancelScheduledValues(2.0);
    REQUIRE(param.getEvents().size() == 1);
    CHECK(param.valueAt(10.0) == Approx(1.f));
}

TEST_CASE("commit keeps evaluation unchanged", "[graph][param]") {
    AudioParam param(0.f);
    param.setValueAtTime(1.f, 1.0);
    param.linearRampToValueAtTime(3.f, 2.0);
    param.setTargetAtTime(0.f, 3.0, 1.0);

    float before = param.valueAt(3.5);
    param.commit(3.2);
    CHECK(param.getEvents().size() == 1);
    CHECK(param.valueAt(3.5) == Approx(before));
    CHECK(param.valueAt(3.0) == Approx(3.f));
}

TEST_CASE("computeValues reports constant blocks", "[graph][param]") {
    const float sampleRate = 1000.f;
    std::vector<float> block(RENDER_QUANTUM);
    AudioParam param(0.5f);

    CHECK(param.computeValues(0.0, sampleRate, RENDER_QUANTUM, block.data()));
    CHECK(block.front() == Approx(0.5f));
    CHECK(block.back() == Approx(0.5f));

    SECTION("a ramp in progress is not constant") {
        param.linearRampToValueAtTime(1.f, 1.0);
        CHECK_FALSE(param.computeValues(0.0, sampleRate, RENDER_QUANTUM, block.data()));
        CHECK(block[100] == Approx(0.5f + 0.5f * 0.1f));
    }

    SECTION("a step after the block leaves it constant") {
        param.setValueAtTime(0.f, 1.0);
        CHECK(param.computeValues(0.0, sampleRate, RENDER_QUANTUM, block.data()));
    }

    SECTION("a step inside the block lands on its frame") {
        param.setValueAtTime(0.f, 0.064);
        CHECK_FALSE(param.computeValues(0.0, sampleRate, RENDER_QUANTUM, block.data()));
        CHECK(block[63] == Approx(0.5f));
        CHECK(block[64] == Approx(0.f));
    }
}

TEST_CASE("GainNode applies its automated gain", "[graph][nodes]") {
    RenderContext ctx;
    ctx.time = 0.0;
    ctx.sampleRate = 44100.f;

    ConstantSourceNode source(2.f);
    GainNode gain(0.25f);
    source.connect(&gain);

    source.process(ctx);
    gain.process(ctx);
    CHECK(gain.output()[0] == Approx(0.5f));
    CHECK(gain.output()[RENDER_QUANTUM - 1] == Approx(0.5f));
}

TEST_CASE("a node connected to a parameter adds to it", "[graph][nodes]") {
    RenderContext ctx;
    ctx.time = 0.0;
    ctx.sampleRate = 44100.f;

    ConstantSourceNode signal(1.f);
    ConstantSourceNode modulator(0.75f);
    GainNode stage(0.f);
    signal.connect(&stage);
    modulator.connect(stage.gain);

    signal.process(ctx);
    modulator.process(ctx);
    stage.process(ctx);
    CHECK(stage.output()[10] == Approx(0.75f));
}

TEST_CASE("OscillatorNode follows its detuned frequency", "[graph][nodes]") {
    RenderContext ctx;
    ctx.time = 0.0;
    ctx.sampleRate = 44100.f;

    // One cycle of 441 Hz is 100 samples; 1200 cents doubles it to 50
    OscillatorNode osc(chromatone::dsp::Waveform::SINE, 441.f, 1200.f);
    osc.process(ctx);
    const float* out = osc.output();
    CHECK(out[0] == Approx(0.f).margin(1e-4));
    CHECK(out[25] == Approx(0.f).margin(1e-3));
    CHECK(out[50] == Approx(0.f).margin(1e-3));
    CHECK(out[12] > 0.9f);
    for (int i = 0; i < RENDER_QUANTUM; i++) {
        CHECK(std::fabs(out[i]) <= 1.001f);
    }
}

TEST_CASE("ConvolverNode is silent without an impulse", "[graph][nodes]") {
    RenderContext ctx;
    ctx.time = 0.0;
    ctx.sampleRate = 44100.f;

    ConstantSourceNode source(1.f);
    ConvolverNode reverb;
    source.connect(&reverb);
    source.process(ctx);
    reverb.process(ctx);
    CHECK_FALSE(reverb.hasImpulse());
    CHECK(reverb.output()[0] == 0.f);
}

TEST_CASE("PartitionedConvolver with a unit impulse passes audio through", "[graph][convolver]") {
    chromatone::dsp::PartitionedConvolver convolver(RENDER_QUANTUM);
    convolver.setImpulse({1.f});
    REQUIRE(convolver.hasImpulse());
    CHECK(convolver.partitionCount() == 1);

    std::vector<float> in(RENDER_QUANTUM), out(RENDER_QUANTUM);
    for (int block = 0; block < 3; block++) {
        for (int i = 0; i < RENDER_QUANTUM; i++) {
            in[i] = std::sin(0.05f * (block * RENDER_QUANTUM + i));
        }
        convolver.process(in.data(), out.data());
        for (int i = 0; i < RENDER_QUANTUM; i++) {
            CHECK(out[i] == Approx(in[i]).margin(1e-4));
        }
    }
}

TEST_CASE("PartitionedConvolver delays across partitions", "[graph][convolver]") {
    const int delay = 200;
    chromatone::dsp::PartitionedConvolver convolver(RENDER_QUANTUM);
    std::vector<float> impulse(delay + 1, 0.f);
    impulse[delay] = 1.f;
    convolver.setImpulse(impulse);
    REQUIRE(convolver.partitionCount() == 2);

    std::vector<float> in(RENDER_QUANTUM, 0.f), out(RENDER_QUANTUM);
    std::vector<float> response;
    in[0] = 1.f;
    for (int block = 0; block < 3; block++) {
        convolver.process(in.data(), out.data());
        response.insert(response.end(), out.begin(), out.end());
        in[0] = 0.f;
    }
    for (int i = 0; i < (int)response.size(); i++) {
        CAPTURE(i);
        CHECK(response[i] == Approx(i == delay ? 1.f : 0.f).margin(1e-4));
    }
}

TEST_CASE("buildSignalGraph creates the fixed topology", "[graph][builder]") {
    GraphOptions options;
    options.volume = 0.1f;
    options.lfoIntensity = 0.25f;
    std::unique_ptr<SignalGraph> graph = buildSignalGraph(options);
    REQUIRE(graph);

    SECTION("four voices with default intervals") {
        const float expected[VOICE_COUNT] = {0.f, 400.f, 700.f, 0.f};
        for (int v = 0; v < VOICE_COUNT; v++) {
            const FrequencyVoice& voice = graph->voices[v];
            CHECK(voice.role == (VoiceRole)v);
            for (OscillatorNode* osc : voice.chain.oscillators) {
                CHECK(osc->detune.valueAt(0.0) == Approx(expected[v]));
                CHECK(osc->frequency.valueAt(0.0) == Approx(440.f));
            }
        }
        CHECK(graph->voices[0].chain.oscillator(chromatone::dsp::Waveform::SAWTOOTH)->getWaveform() == chromatone::dsp::Waveform::SAWTOOTH);
    }

    SECTION("gate open, LFO split, reverb dry, volume set") {
        CHECK(graph->gate->gain.valueAt(0.0) == Approx(1.f));
        CHECK(graph->lfoPath.wet->gain.valueAt(0.0) == Approx(0.25f));
        CHECK(graph->lfoPath.dry->gain.valueAt(0.0) == Approx(0.75f));
        CHECK(graph->reverbPath.wet->gain.valueAt(0.0) == Approx(0.f));
        CHECK(graph->reverbPath.dry->gain.valueAt(0.0) == Approx(1.f));
        CHECK(graph->volume->gain.valueAt(0.0) == Approx(0.1f));
        CHECK(graph->lfo->frequency.valueAt(0.0) == Approx(15.f));
    }

    SECTION("rendering advances the audio clock by one quantum") {
        std::vector<float> out(RENDER_QUANTUM);
        graph->render(out.data());
        CHECK(graph->getCurrentTime() == Approx(RENDER_QUANTUM / 44100.0));

        float peak = 0.f;
        for (float v : out) peak = std::max(peak, std::fabs(v));
        CHECK(peak > 0.f);
    }
}

TEST_CASE("applyWetDry endpoints", "[graph][wetdry]") {
    std::unique_ptr<SignalGraph> graph = buildSignalGraph(GraphOptions());
    const chromatone::dsp::CrossfadeCurve curves[] = {chromatone::dsp::CrossfadeCurve::LINEAR, chromatone::dsp::CrossfadeCurve::EQUAL_POWER};

    for (chromatone::dsp::CrossfadeCurve curve : curves) {
        applyWetDry(graph->reverbPath, 0.f, curve, 1.0);
        CHECK(graph->reverbPath.wet->gain.valueAt(1.0) == Approx(0.f).margin(1e-6));
        CHECK(graph->reverbPath.dry->gain.valueAt(1.0) == Approx(1.f));

        applyWetDry(graph->reverbPath, 1.f, curve, 2.0);
        CHECK(graph->reverbPath.wet->gain.valueAt(2.0) == Approx(1.f));
        CHECK(graph->reverbPath.dry->gain.valueAt(2.0) == Approx(0.f).margin(1e-6));

        // Out of range intensities clamp
        applyWetDry(graph->lfoPath, 3.f, curve, 3.0);
        CHECK(graph->lfoPath.wet->gain.valueAt(3.0) == Approx(1.f));
    }

    SECTION("equal power keeps constant energy at the midpoint") {
        applyWetDry(graph->lfoPath, 0.5f, chromatone::dsp::CrossfadeCurve::EQUAL_POWER, 4.0);
        float wet = graph->lfoPath.wet->gain.valueAt(4.0);
        float dry = graph->lfoPath.dry->gain.valueAt(4.0);
        CHECK(wet * wet + dry * dry == Approx(1.f));
    }
}
