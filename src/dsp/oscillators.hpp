#pragma once
#include <rack.hpp>
#include <cmath>
#include <vector>
#include <algorithm>

using namespace rack;

namespace chromatone {
namespace dsp {

// ============================================================================
// OSCILLATOR UTILITIES
// ============================================================================

enum class Waveform {
    SQUARE,
    SAWTOOTH,
    SINE
};

class OscillatorHelper {
public:
    static float sine(float phase) {
        return std::sin(2.f * M_PI * phase);
    }

    // Advance phase with frequency and sample rate
    static float advancePhase(float phase, float frequency, float sampleRate) {
        phase += frequency / sampleRate;
        return phase - std::floor(phase); // Wrap to [0, 1)
    }

    // Detune in cents applied on top of a base frequency
    static float detunedFrequency(float frequency, float detuneCents) {
        if (detuneCents == 0.f) {
            return frequency;
        }
        return frequency * std::pow(2.f, detuneCents / 1200.f);
    }

    // ========================================================================
    // ANTI-ALIASING UTILITIES
    // ========================================================================

    // PolyBLEP residual for a discontinuity at phase 0.
    // phase: oscillator phase [0, 1), dt: phase increment per sample
    static float polyBLEP(float phase, float dt) {
        if (dt <= 0.f) {
            return 0.f;
        }
        if (phase < dt) {
            float t = phase / dt;
            return t + t - t * t - 1.f;
        }
        if (phase > 1.f - dt) {
            float t = (phase - 1.f) / dt;
            return t * t + t + t + 1.f;
        }
        return 0.f;
    }

    // Band-limited sawtooth, rising from -1 to 1 over one period
    static float sawWithPolyBLEP(float phase, float freq, float sampleRate) {
        float dt = freq / sampleRate;
        return (2.f * phase - 1.f) - polyBLEP(phase, dt);
    }

    // Band-limited 50% square
    static float squareWithPolyBLEP(float phase, float freq, float sampleRate) {
        float dt = freq / sampleRate;
        float output = (phase < 0.5f) ? 1.f : -1.f;
        output += polyBLEP(phase, dt);
        float shifted = phase + 0.5f;
        shifted -= std::floor(shifted);
        output -= polyBLEP(shifted, dt);
        return output;
    }

    static float generate(Waveform waveform, float phase, float freq, float sampleRate) {
        switch (waveform) {
            case Waveform::SQUARE:   return squareWithPolyBLEP(phase, freq, sampleRate);
            case Waveform::SAWTOOTH: return sawWithPolyBLEP(phase, freq, sampleRate);
            case Waveform::SINE:
            default:                 return sine(phase);
        }
    }
};

/**
 * Single-cycle wave table built from Fourier coefficients.
 * real[k] scales cos(2*pi*k*x), imag[k] scales sin(2*pi*k*x); index 0 (DC) is ignored.
 * One table is kept per octave of harmonic count so high notes read a table
 * with fewer partials and stay below Nyquist.
 */
class PeriodicWave {
public:
    static constexpr int TABLE_SIZE = 2048;

    PeriodicWave(const std::vector<float>& real, const std::vector<float>& imag) {
        int harmonics = (int)std::min(real.size(), imag.size()) - 1;
        harmonics = rack::math::clamp(harmonics, 0, TABLE_SIZE / 2 - 1);
        maxHarmonic = harmonics;

        float peak = 0.f;
        for (int limit = harmonics; limit >= 1; limit /= 2) {
            std::vector<float> table(TABLE_SIZE + 1, 0.f);
            for (int n = 0; n < TABLE_SIZE; n++) {
                double x = (double)n / TABLE_SIZE;
                double sum = 0.0;
                for (int k = 1; k <= limit; k++) {
                    double angle = 2.0 * M_PI * k * x;
                    sum += real[k] * std::cos(angle) + imag[k] * std::sin(angle);
                }
                table[n] = (float)sum;
            }
            table[TABLE_SIZE] = table[0];
            if (limit == harmonics) {
                for (float v : table) peak = std::max(peak, std::fabs(v));
            }
            tables.push_back(std::move(table));
            harmonicCounts.push_back(limit);
        }

        // Normalize against the full table so every level keeps the same gain
        if (peak > 0.f) {
            float scale = 1.f / peak;
            for (std::vector<float>& table : tables) {
                for (float& v : table) v *= scale;
            }
        }
    }

    bool empty() const { return tables.empty(); }
    int harmonicCount() const { return maxHarmonic; }

    float sample(float phase, float freq, float sampleRate) const {
        if (tables.empty()) {
            return 0.f;
        }
        const std::vector<float>& table = tables[selectTable(freq, sampleRate)];
        float pos = phase * TABLE_SIZE;
        int i0 = (int)pos;
        i0 = rack::math::clamp(i0, 0, TABLE_SIZE - 1);
        float frac = pos - (float)i0;
        return table[i0] + frac * (table[i0 + 1] - table[i0]);
    }

private:
    std::vector<std::vector<float>> tables;
    std::vector<int> harmonicCounts;
    int maxHarmonic = 0;

    size_t selectTable(float freq, float sampleRate) const {
        float nyquist = sampleRate * 0.5f;
        for (size_t i = 0; i < tables.size(); i++) {
            if (harmonicCounts[i] * freq < nyquist) {
                return i;
            }
        }
        return tables.size() - 1;
    }
};

}} // namespace chromatone::dsp
