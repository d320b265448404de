// Prism: sound engine facade
#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <vector>
#include "assets.hpp"
#include "mapping.hpp"
#include "scheduler.hpp"
#include "settings.hpp"
#include "../graph/builder.hpp"

namespace chromatone { namespace prism {

/**
 * Owns the signal graph, the chord scheduler and the loaded assets.
 *
 * Every setter is safe before play(): the value is stored and applied when the
 * graph is built. All graph writes and every render quantum run under one
 * mutex, and all automation uses absolute audio-clock timestamps.
 *
 * Mix setters take the internal 0-1 scale; colour setters take degrees and
 * percent. Non-finite values are ignored and the stored value is kept.
 */
class SoundManager {
public:
    explicit SoundManager(const SoundSettings& settings = SoundSettings());
    ~SoundManager();

    SoundManager(const SoundManager&) = delete;
    SoundManager& operator=(const SoundManager&) = delete;

    // Builds the graph on the first call, resumes rendering afterwards
    void play();
    // Suspends rendering; the graph and its automation are kept
    void pause();

    void changeHue(float hue);
    void changeSaturation(float saturation);
    void changeLightness(float lightness);

    void changeVolume(float volume);
    void changeReverbIntensity(float intensity);
    void changeLfoIntensity(float intensity);
    void changeLfoFrequency(float frequency);

    void changeChordProgression(bool enabled);
    // Affects chords written after the call only
    void changeChordDuration(float seconds);

    void setSampleRate(float sampleRate);

    // One output frame; 0 while paused
    float process();
    // Render one block regardless of the play state (silence without a graph)
    void renderQuantum(float* out);
    // One lookahead check; false once the scheduler has stopped
    bool pollScheduler();

    // Fire-and-forget; results are applied whenever they arrive
    void loadAssets(const AssetPaths& paths);
    void applyWaveTable(dsp::Waveform waveform, const WaveTable& table);
    void applyImpulseResponse(const ImpulseResponse& impulse);

    bool hasGraph() const;
    bool isPlaying() const { return playing.load(std::memory_order_acquire); }
    bool isReverbReady() const;
    double currentTime() const;
    SoundSettings getSettings() const;
    ChordScheduler::Status getSchedulerStatus() const;
    void seedScheduler(uint32_t seed);

    template <typename F>
    void withGraph(F fn) {
        std::lock_guard<std::mutex> lock(mutex);
        fn(graph.get());
    }

private:
    mutable std::mutex mutex;
    SoundSettings settings;
    float sampleRate = 44100.f;
    std::unique_ptr<graph::SignalGraph> graph;
    std::atomic<bool> playing{false};

    ChordScheduler scheduler;
    LookaheadTimer timer;

    std::shared_ptr<const dsp::PeriodicWave> squareWave;
    std::shared_ptr<const dsp::PeriodicWave> sawtoothWave;
    std::shared_ptr<const ImpulseResponse> impulse;
    std::shared_ptr<dsp::PartitionedConvolver> convolver;
    std::vector<std::future<void>> pendingLoads;

    // Engine-thread block cache for process()
    float quantum[graph::RENDER_QUANTUM] = {};
    int quantumIndex = graph::RENDER_QUANTUM;

    // Graph writers; the caller holds the mutex and the graph exists
    void applyHue(double now);
    void applySaturation(double now);
    void applyLightness(double now);
    void applyVolume(double now);
    void applyReverb(double now);
    void applyLfoIntensity(double now);
    void applyLfoFrequency(double now);
    void applyWaveTables();
    void applyAll(double now);

    void startScheduler();
    // Collect loads that have completed; the caller holds the mutex
    void reapFinishedLoads();
    void installConvolver(std::shared_ptr<dsp::PartitionedConvolver> next, float preparedRate);
    static std::shared_ptr<dsp::PartitionedConvolver> prepareConvolver(const ImpulseResponse& impulse, float rate);
};

}} // namespace chromatone::prism
