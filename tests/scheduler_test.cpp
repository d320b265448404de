// Chord tables and lookahead scheduling

#include <catch2/catch.hpp>

#include "prism/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace chromatone;
using namespace chromatone::prism;

namespace {

std::vector<graph::AudioParam::Event> eventsOfType(const graph::AudioParam& param, graph::AudioParam::EventType type) {
    std::vector<graph::AudioParam::Event> found;
    for (const graph::AudioParam::Event& e : param.getEvents()) {
        if (e.type == type) found.push_back(e);
    }
    return found;
}

Progression fourChords() {
    Progression p;
    p.name = "test";
    p.chords = {"I", "V", "vi", "IV"};
    return p;
}

}

TEST_CASE("every progression names known chords", "[chords]") {
    REQUIRE_FALSE(progressionTable().empty());
    for (const Progression& progression : progressionTable()) {
        CAPTURE(progression.name);
        CHECK(resolveProgression(progression).size() == progression.chords.size());
        CHECK(progression.chords.size() >= 2);
    }
}

TEST_CASE("chord lookup by roman numeral", "[chords]") {
    const ChordDefinition* five = findChord("V");
    REQUIRE(five != nullptr);
    CHECK(five->scaleDegreeSemitones == 7);
    // Triads double the root in the seventh voice
    CHECK(five->intervalSemitones[3] == 0);

    const ChordDefinition* dominant = findChord("V7");
    REQUIRE(dominant != nullptr);
    CHECK(dominant->intervalSemitones[3] == 10);

    CHECK(findChord("IX") == nullptr);

    SECTION("voice detune in cents") {
        CHECK(chordVoiceCents(*five, graph::VOICE_ROOT) == Approx(700.f));
        CHECK(chordVoiceCents(*five, graph::VOICE_THIRD) == Approx(1100.f));
        CHECK(chordVoiceCents(*five, graph::VOICE_FIFTH) == Approx(1400.f));
        // A triad leaves the seventh on the root
        CHECK(chordVoiceCents(*five, graph::VOICE_SEVENTH) == Approx(700.f));
        CHECK(chordVoiceCents(*dominant, graph::VOICE_SEVENTH) == Approx(1700.f));
    }
}

TEST_CASE("unknown chords are skipped when resolving", "[chords]") {
    Progression p;
    p.name = "broken";
    p.chords = {"I", "nope", "V"};
    CHECK(resolveProgression(p).size() == 2);
}

TEST_CASE("scheduler state transitions", "[scheduler]") {
    ChordScheduler scheduler;
    CHECK(scheduler.getStatus() == ChordScheduler::Status::DISABLED);

    scheduler.enable();
    CHECK(scheduler.getStatus() == ChordScheduler::Status::ARMED);

    std::unique_ptr<graph::SignalGraph> graph = graph::buildSignalGraph(graph::GraphOptions());
    CHECK(scheduler.check(*graph, 0.0));
    CHECK(scheduler.getStatus() == ChordScheduler::Status::SCHEDULED);
    CHECK(scheduler.getNextProgressionEndTime() > 0.0);

    scheduler.disable();
    CHECK(scheduler.getStatus() == ChordScheduler::Status::DISABLED);
    CHECK(scheduler.getNextProgressionEndTime() == 0.0);
    CHECK_FALSE(scheduler.check(*graph, 0.5));
}

TEST_CASE("chord duration is clamped", "[scheduler]") {
    ChordScheduler scheduler;
    scheduler.setChordDuration(0.01f);
    CHECK(scheduler.getChordDuration() == Approx(0.25f));
    scheduler.setChordDuration(60.f);
    CHECK(scheduler.getChordDuration() == Approx(10.f));
}

TEST_CASE("a four chord progression is written ahead of the clock", "[scheduler]") {
    SoundSettings settings;
    settings.chordDuration = 2.f;
    ChordScheduler scheduler(settings);
    scheduler.enable();
    std::unique_ptr<graph::SignalGraph> graph = graph::buildSignalGraph(graph::GraphOptions());

    scheduler.scheduleProgression(*graph, fourChords(), 0.0);

    const double decay = 2.0 * settings.gateDecayFraction;
    const double rest = 2.0 * settings.restFraction;
    const double chordSpan = 2.0 + decay + rest;
    CHECK(scheduler.getNextProgressionEndTime() == Approx(4 * chordSpan + 1.0));

    graph::AudioParam& gate = graph->gate->gain;
    std::vector<graph::AudioParam::Event> ramps = eventsOfType(gate, graph::AudioParam::EventType::LINEAR_RAMP);
    std::vector<graph::AudioParam::Event> decays = eventsOfType(gate, graph::AudioParam::EventType::SET_TARGET);
    REQUIRE(ramps.size() == 4);
    REQUIRE(decays.size() == 4);

    for (int c = 0; c < 4; c++) {
        CAPTURE(c);
        double start = c * chordSpan;
        CHECK(ramps[c].time == Approx(start + settings.gateAttackSeconds));
        CHECK(ramps[c].value == Approx(1.f));
        CHECK(decays[c].time == Approx(start + 2.0));
        CHECK(decays[c].value == Approx(0.f));
        CHECK(decays[c].timeConstant == Approx(decay / 4.0));
    }

    SECTION("detunes follow the chords") {
        // Second chord is V starting after one chord span
        double second = chordSpan;
        for (const graph::FrequencyVoice& voice : graph->voices) {
            float expected = chordVoiceCents(*findChord("V"), voice.role);
            for (graph::OscillatorNode* osc : voice.chain.oscillators) {
                CHECK(osc->detune.valueAt(second + 0.001) == Approx(expected));
            }
        }
        CHECK(graph->voices[graph::VOICE_THIRD].chain.oscillators[0]->detune.valueAt(0.5) == Approx(400.f));
    }

    SECTION("the gate is open while a chord sounds and nearly closed between chords") {
        CHECK(gate.valueAt(1.0) == Approx(1.f));
        CHECK(gate.valueAt(2.0 + decay + rest - 1e-6) < 0.01f);
        CHECK(gate.valueAt(chordSpan + 1.0) == Approx(1.f));
    }

    SECTION("the next progression starts after the tail") {
        // Nothing to do while the end is beyond the lookahead window
        double before = scheduler.getNextProgressionEndTime() - scheduler.getLookahead() - 1.0;
        CHECK(scheduler.check(*graph, before));
        CHECK(eventsOfType(gate, graph::AudioParam::EventType::LINEAR_RAMP).size() == 4);

        double due = scheduler.getNextProgressionEndTime() - scheduler.getLookahead();
        CHECK(scheduler.check(*graph, due));
        ramps = eventsOfType(gate, graph::AudioParam::EventType::LINEAR_RAMP);
        REQUIRE(ramps.size() >= 8);

        double fifthStart = ramps[4].time - settings.gateAttackSeconds;
        CHECK(fifthStart >= 4 * chordSpan + 1.0 - 1e-6);
        CHECK(scheduler.getNextProgressionEndTime() > fifthStart);
    }
}

TEST_CASE("short progressions are played twice", "[scheduler]") {
    ChordScheduler scheduler;
    scheduler.enable();
    std::unique_ptr<graph::SignalGraph> graph = graph::buildSignalGraph(graph::GraphOptions());

    Progression cadence;
    cadence.name = "cadence";
    cadence.chords = {"ii7", "V7", "Imaj7"};
    scheduler.scheduleProgression(*graph, cadence, 0.0);
    CHECK(eventsOfType(graph->gate->gain, graph::AudioParam::EventType::LINEAR_RAMP).size() == 6);
}

TEST_CASE("a late check starts from the current time", "[scheduler]") {
    ChordScheduler scheduler;
    scheduler.enable();
    std::unique_ptr<graph::SignalGraph> graph = graph::buildSignalGraph(graph::GraphOptions());

    scheduler.scheduleProgression(*graph, fourChords(), 0.0);
    double end = scheduler.getNextProgressionEndTime();
    double late = end + 5.0;
    scheduler.scheduleProgression(*graph, fourChords(), late);

    std::vector<graph::AudioParam::Event> ramps = eventsOfType(graph->gate->gain, graph::AudioParam::EventType::LINEAR_RAMP);
    REQUIRE(ramps.size() == 8);
    CHECK(ramps[4].time == Approx(late + 0.02));
    CHECK(scheduler.getNextProgressionEndTime() > late);
}

TEST_CASE("resetVoices cancels pending chords", "[scheduler]") {
    ChordScheduler scheduler;
    scheduler.enable();
    std::unique_ptr<graph::SignalGraph> graph = graph::buildSignalGraph(graph::GraphOptions());
    scheduler.scheduleProgression(*graph, fourChords(), 0.0);

    const double now = 3.0;
    ChordScheduler::resetVoices(*graph, now);

    CHECK(graph->gate->gain.valueAt(now) == Approx(1.f));
    CHECK(graph->gate->gain.valueAt(now + 20.0) == Approx(1.f));
    for (const graph::FrequencyVoice& voice : graph->voices) {
        for (graph::OscillatorNode* osc : voice.chain.oscillators) {
            for (const graph::AudioParam::Event& e : osc->detune.getEvents()) {
                CHECK(e.time <= now);
            }
            CHECK(osc->detune.valueAt(now) == Approx(voice.defaultDetuneCents()));
            CHECK(osc->detune.valueAt(now + 20.0) == Approx(voice.defaultDetuneCents()));
        }
    }
}

TEST_CASE("LookaheadTimer polls until the callback declines", "[scheduler][timer]") {
    LookaheadTimer timer;
    std::atomic<int> calls{0};
    timer.start(0.001, [&calls]() { return ++calls < 3; });

    for (int i = 0; i < 2000 && timer.isRunning(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK_FALSE(timer.isRunning());
    CHECK(calls.load() == 3);
    timer.stop();
}

TEST_CASE("LookaheadTimer stop interrupts the wait", "[scheduler][timer]") {
    LookaheadTimer timer;
    std::atomic<int> calls{0};
    timer.start(60.0, [&calls]() { ++calls; return true; });
    for (int i = 0; i < 2000 && calls.load() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto begin = std::chrono::steady_clock::now();
    timer.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    CHECK(elapsed < std::chrono::seconds(5));
    CHECK_FALSE(timer.isRunning());
    CHECK(calls.load() == 1);
}
