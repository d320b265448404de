// Prism: colour to synthesis parameter mapping
#pragma once
#include "../dsp/oscillators.hpp"

namespace chromatone { namespace prism {

// Per-waveform gain weights derived from hue
struct WaveformWeights {
    float square = 0.f;
    float sawtooth = 0.f;
    float sine = 0.f;

    float get(dsp::Waveform w) const {
        switch (w) {
            case dsp::Waveform::SQUARE:   return square;
            case dsp::Waveform::SAWTOOTH: return sawtooth;
            case dsp::Waveform::SINE:
            default:                      return sine;
        }
    }
};

// Clamp value into [fromLow, fromHigh], then remap linearly onto [toLow, toHigh]
float scaleValue(float value, float fromLow, float fromHigh, float toLow, float toHigh);

// Wrap any hue into [0, 360)
float normalizeHue(float hue);

// Additive wheel: square at 0°, sawtooth at 120°, sine at 240°
WaveformWeights hueToWaveformWeights(float hue);

float lightnessToSemitones(float lightness, float semitoneBound);
// 440 Hz * 2^(semitones / 12)
float lightnessToFrequency(float lightness, float semitoneBound);

// Output gain of the third, fifth and seventh voices
float saturationToChordGain(float saturation);

// h in degrees, s and l in percent; outputs 0-1
void hslToRgb(float h, float s, float l, float& r, float& g, float& b);

/**
 * Slow automatic colour drift: every 200 ms the hue moves by 2 degrees and the
 * saturation by round(2 * cos(2 pi t / 30 s)).
 */
class ColorCycler {
public:
    static constexpr float STEP_SECONDS = 0.2f;
    static constexpr float HUE_STEP = 2.f;
    static constexpr float SATURATION_PERIOD = 30.f;

    // Returns true when the offsets changed
    bool step(float deltaSeconds);
    void reset();

    float getHueOffset() const { return hueOffset; }
    float getSaturationOffset() const { return saturationOffset; }
    float getWaveTime() const { return waveTime; }
    void restore(float hue, float saturation, float time);

private:
    float elapsed = 0.f;
    float waveTime = 0.f;
    float hueOffset = 0.f;
    float saturationOffset = 0.f;
};

}} // namespace chromatone::prism
