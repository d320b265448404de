#pragma once
#include <rack.hpp>
#include <cmath>

using namespace rack;

namespace chromatone {
namespace dsp {

// ============================================================================
// AUDIO PROCESSING UTILITIES
// ============================================================================

enum class CrossfadeCurve {
    LINEAR,
    EQUAL_POWER
};

class AudioProcessor {
public:
    // Gain of one side of a crossfade at the given amount (0 = silent, 1 = full)
    static float crossfadeGain(float amount, CrossfadeCurve curve) {
        amount = rack::math::clamp(amount, 0.f, 1.f);
        if (curve == CrossfadeCurve::EQUAL_POWER) {
            return std::sin(amount * (float)M_PI * 0.5f);
        }
        return amount;
    }

    static float softLimit(float input, float limit = 10.f) {
        if (limit <= 0.f) {
            return 0.f;
        }
        float scaled = input / limit;
        return limit * std::tanh(scaled);
    }

    // DC blocking filter
    static float processDCBlock(float input, float& lastInput, float& lastOutput,
                               float coefficient = 0.995f) {
        float output = input - lastInput + coefficient * lastOutput;
        lastInput = input;
        lastOutput = output;
        return output;
    }
};

}} // namespace chromatone::dsp
