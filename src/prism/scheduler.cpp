// Prism: lookahead chord scheduling
#include <rack.hpp>
#include <algorithm>
#include <chrono>
#include "scheduler.hpp"

namespace chromatone { namespace prism {

LookaheadTimer::~LookaheadTimer() {
    stop();
}

void LookaheadTimer::start(double periodSeconds, Callback callback) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    stopWorker();
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = false;
    }
    running.store(true, std::memory_order_release);
    worker = std::thread([this, periodSeconds, callback]() { workerLoop(periodSeconds, callback); });
}

void LookaheadTimer::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
    stopWorker();
}

void LookaheadTimer::stopWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopRequested = true;
    }
    condition.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    running.store(false, std::memory_order_release);
}

void LookaheadTimer::workerLoop(double periodSeconds, Callback callback) {
    auto period = std::chrono::duration<double>(periodSeconds);
    while (true) {
        if (!callback()) {
            break;
        }
        std::unique_lock<std::mutex> lock(mutex);
        if (condition.wait_for(lock, period, [this]() { return stopRequested; })) {
            break;
        }
    }
    running.store(false, std::memory_order_release);
}

ChordScheduler::ChordScheduler(const SoundSettings& settings)
    : chordDuration(rack::math::clamp(settings.chordDuration, Limits::CHORD_DURATION_MIN, Limits::CHORD_DURATION_MAX)),
      lookahead(settings.lookaheadSeconds),
      decayFraction(settings.gateDecayFraction),
      restFraction(settings.restFraction),
      attackSeconds(settings.gateAttackSeconds),
      rng(rack::random::u32()) {
}

void ChordScheduler::enable() {
    if (status == Status::DISABLED) {
        status = Status::ARMED;
        INFO("Chromatone: chord progressions enabled");
    }
}

void ChordScheduler::disable() {
    if (status != Status::DISABLED) {
        INFO("Chromatone: chord progressions disabled");
    }
    status = Status::DISABLED;
    nextProgressionEndTime = 0.0;
}

void ChordScheduler::setChordDuration(float seconds) {
    chordDuration = rack::math::clamp(seconds, Limits::CHORD_DURATION_MIN, Limits::CHORD_DURATION_MAX);
}

bool ChordScheduler::check(graph::SignalGraph& graph, double now) {
    if (status == Status::DISABLED) {
        resetVoices(graph, now);
        return false;
    }

    if (nextProgressionEndTime - lookahead > now) {
        return true;
    }

    const std::vector<Progression>& progressions = progressionTable();
    std::uniform_int_distribution<size_t> pick(0, progressions.size() - 1);
    scheduleProgression(graph, progressions[pick(rng)], now);
    return true;
}

void ChordScheduler::scheduleProgression(graph::SignalGraph& graph, const Progression& progression, double now) {
    std::vector<const ChordDefinition*> chords = resolveProgression(progression);
    if (chords.empty()) {
        return;
    }
    // Short progressions loop too quickly on their own
    if (chords.size() <= 3) {
        std::vector<const ChordDefinition*> doubled(chords);
        chords.insert(chords.end(), doubled.begin(), doubled.end());
    }

    double time = std::max(nextProgressionEndTime, now);
    DEBUG("Chromatone: scheduling '%s' (%d chords) at %.3f s", progression.name.c_str(), (int)chords.size(), time);
    for (const ChordDefinition* chord : chords) {
        time = writeChord(graph, *chord, time);
    }
    time += chordDuration * 0.5f;

    nextProgressionEndTime = std::max(nextProgressionEndTime, time);
    status = Status::SCHEDULED;
}

double ChordScheduler::writeChord(graph::SignalGraph& graph, const ChordDefinition& chord, double start) {
    graph::AudioParam& gate = graph.gate->gain;

    // Reopen the gate from wherever the previous decay left it
    gate.setValueAtTime(gate.valueAt(start), start);
    gate.linearRampToValueAtTime(1.f, start + attackSeconds);

    for (const graph::FrequencyVoice& voice : graph.voices) {
        float cents = chordVoiceCents(chord, voice.role);
        for (graph::OscillatorNode* osc : voice.chain.oscillators) {
            osc->detune.setValueAtTime(cents, start);
        }
    }

    double decay = chordDuration * decayFraction;
    double rest = chordDuration * restFraction;
    double time = start + chordDuration;
    gate.setTargetAtTime(0.f, time, decay / 4.0);
    return time + decay + rest;
}

void ChordScheduler::resetVoices(graph::SignalGraph& graph, double now) {
    graph.forEachOscillator([now](const graph::FrequencyVoice& voice, graph::OscillatorNode* osc) {
        osc->detune.cancelScheduledValues(now);
        osc->detune.setValueAtTime(voice.defaultDetuneCents(), now);
    });
    graph.gate->gain.cancelScheduledValues(now);
    graph.gate->gain.setValueAtTime(1.f, now);
}

}} // namespace chromatone::prism
