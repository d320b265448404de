// Prism: lookahead chord scheduling
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <thread>
#include "chords.hpp"
#include "settings.hpp"
#include "../graph/builder.hpp"

namespace chromatone { namespace prism {

/**
 * Coarse wall-clock timer for the lookahead pattern. The callback runs on a
 * worker thread right after start() and then once per period for as long as it
 * returns true.
 *
 * start() and stop() may be called from any thread; they are serialized by a
 * lifecycle lock the callback never takes. stop() joins the worker, so it must
 * never be called while holding a lock the callback takes.
 */
class LookaheadTimer {
public:
    using Callback = std::function<bool()>;

    LookaheadTimer() = default;
    ~LookaheadTimer();

    LookaheadTimer(const LookaheadTimer&) = delete;
    LookaheadTimer& operator=(const LookaheadTimer&) = delete;

    // Restarts the worker when one is already running
    void start(double periodSeconds, Callback callback);
    void stop();
    bool isRunning() const { return running.load(std::memory_order_acquire); }

private:
    void workerLoop(double periodSeconds, Callback callback);
    // Caller holds lifecycleMutex
    void stopWorker();

    std::thread worker;
    std::mutex lifecycleMutex;  // guards worker
    std::mutex mutex;           // guards stopRequested
    std::condition_variable condition;
    bool stopRequested = false;
    std::atomic<bool> running{false};
};

/**
 * Writes chord automation ahead of the audio clock.
 * Only detune and gate parameters are touched; gains and base frequencies
 * belong to the colour mapper.
 */
class ChordScheduler {
public:
    enum class Status {
        DISABLED,
        ARMED,      // enabled, nothing written yet
        SCHEDULED   // a progression has been written up to nextProgressionEndTime
    };

    explicit ChordScheduler(const SoundSettings& settings = SoundSettings());

    void enable();
    void disable();
    bool isEnabled() const { return status != Status::DISABLED; }
    Status getStatus() const { return status; }

    void setChordDuration(float seconds);
    float getChordDuration() const { return chordDuration; }
    double getNextProgressionEndTime() const { return nextProgressionEndTime; }
    double getLookahead() const { return lookahead; }

    void seed(uint32_t value) { rng.seed(value); }

    /**
     * One lookahead check at audio time `now`.
     * Disabled: resets every voice and returns false (stop polling).
     * Otherwise schedules a new progression when the current one ends inside the
     * lookahead window, and returns true.
     */
    bool check(graph::SignalGraph& graph, double now);

    // Writes a full progression from max(nextProgressionEndTime, now)
    void scheduleProgression(graph::SignalGraph& graph, const Progression& progression, double now);

    // Cancel pending chord automation, open the gate and restore default detunes
    static void resetVoices(graph::SignalGraph& graph, double now);

private:
    Status status = Status::DISABLED;
    double nextProgressionEndTime = 0.0;
    float chordDuration;
    double lookahead;
    float decayFraction;
    float restFraction;
    float attackSeconds;
    std::mt19937 rng;

    double writeChord(graph::SignalGraph& graph, const ChordDefinition& chord, double start);
};

}} // namespace chromatone::prism
