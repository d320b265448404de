// Prism: engine defaults and control ranges
#pragma once

namespace chromatone { namespace prism {

struct SoundSettings {
    // Mix defaults (0-1 internal scale)
    float volume = 0.1f;
    float reverbIntensity = 0.f;
    float lfoIntensity = 0.25f;
    float lfoFrequency = 15.f;

    // Colour defaults
    float hue = 0.f;
    float saturation = 50.f;
    float lightness = 50.f;

    // Lightness maps onto +/- this many semitones around A4
    float lightnessSemitoneBound = 25.f;

    // Chord scheduling
    float chordDuration = 2.f;
    double lookaheadSeconds = 0.25;   // also the polling period
    float gateDecayFraction = 0.2f;   // of the chord duration
    float restFraction = 0.05f;       // of the chord duration
    float gateAttackSeconds = 0.02f;

    // Poll the scheduler from a background timer; off to drive pollScheduler() by hand
    bool schedulerTimer = true;
};

// Accepted ranges; values outside are clamped
namespace Limits {
    constexpr float LFO_FREQUENCY_MIN = 1.f;
    constexpr float LFO_FREQUENCY_MAX = 30.f;
    constexpr float CHORD_DURATION_MIN = 0.25f;
    constexpr float CHORD_DURATION_MAX = 10.f;
    constexpr float CHORD_DURATION_STEP = 0.25f;
}

}} // namespace chromatone::prism
