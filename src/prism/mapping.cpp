// Prism: colour to synthesis parameter mapping
#include <rack.hpp>
#include <algorithm>
#include <cmath>
#include "mapping.hpp"

namespace chromatone { namespace prism {

namespace {
const float PURE_SQUARE = 0.f;     // red
const float PURE_SAWTOOTH = 120.f; // green
const float PURE_SINE = 240.f;     // blue
const float PURE_SQUARE_WRAP = 360.f;
}

float scaleValue(float value, float fromLow, float fromHigh, float toLow, float toHigh) {
    if (fromHigh == fromLow) {
        return toLow;
    }
    float lo = std::min(fromLow, fromHigh);
    float hi = std::max(fromLow, fromHigh);
    float clamped = rack::math::clamp(value, lo, hi);
    return rack::math::rescale(clamped, fromLow, fromHigh, toLow, toHigh);
}

float normalizeHue(float hue) {
    if (!std::isfinite(hue)) {
        return 0.f;
    }
    float wrapped = std::fmod(hue, 360.f);
    if (wrapped < 0.f) {
        wrapped += 360.f;
    }
    // fmod of a tiny negative can round back up to 360
    return wrapped >= 360.f ? 0.f : wrapped;
}

WaveformWeights hueToWaveformWeights(float hue) {
    hue = normalizeHue(hue);
    WaveformWeights w;

    if (std::fmod(hue, 120.f) == 0.f) {
        if (hue == PURE_SAWTOOTH) w.sawtooth = 1.f;
        else if (hue == PURE_SINE) w.sine = 1.f;
        else w.square = 1.f;
        return w;
    }

    if (std::fmod(hue, 60.f) == 0.f) {
        if (hue == 60.f) {
            w.square = 0.5f;
            w.sawtooth = 0.5f;
        }
        else if (hue == 180.f) {
            w.sawtooth = 0.5f;
            w.sine = 0.5f;
        }
        else {
            w.sine = 0.5f;
            w.square = 0.5f;
        }
        return w;
    }

    // Interpolate inside the 120 degree sector: leaving channel 1 -> 0, entering 0 -> 1
    if (hue < PURE_SAWTOOTH) {
        w.square = scaleValue(hue, PURE_SQUARE, PURE_SAWTOOTH, 1.f, 0.f);
        w.sawtooth = scaleValue(hue, PURE_SQUARE, PURE_SAWTOOTH, 0.f, 1.f);
    }
    else if (hue < PURE_SINE) {
        w.sawtooth = scaleValue(hue, PURE_SAWTOOTH, PURE_SINE, 1.f, 0.f);
        w.sine = scaleValue(hue, PURE_SAWTOOTH, PURE_SINE, 0.f, 1.f);
    }
    else {
        w.sine = scaleValue(hue, PURE_SINE, PURE_SQUARE_WRAP, 1.f, 0.f);
        w.square = scaleValue(hue, PURE_SINE, PURE_SQUARE_WRAP, 0.f, 1.f);
    }
    return w;
}

float lightnessToSemitones(float lightness, float semitoneBound) {
    float l = rack::math::clamp(lightness, 0.f, 100.f);
    return scaleValue(l, 0.f, 100.f, -semitoneBound, semitoneBound);
}

float lightnessToFrequency(float lightness, float semitoneBound) {
    return 440.f * std::pow(2.f, lightnessToSemitones(lightness, semitoneBound) / 12.f);
}

float saturationToChordGain(float saturation) {
    return rack::math::clamp(saturation, 0.f, 100.f) / 100.f;
}

void hslToRgb(float h, float s, float l, float& r, float& g, float& b) {
    h = normalizeHue(h) / 60.f;
    s = rack::math::clamp(s, 0.f, 100.f) / 100.f;
    l = rack::math::clamp(l, 0.f, 100.f) / 100.f;

    float chroma = (1.f - std::fabs(2.f * l - 1.f)) * s;
    float x = chroma * (1.f - std::fabs(std::fmod(h, 2.f) - 1.f));
    float m = l - chroma * 0.5f;

    float r1 = 0.f, g1 = 0.f, b1 = 0.f;
    switch ((int)h) {
        case 0: r1 = chroma; g1 = x; break;
        case 1: r1 = x; g1 = chroma; break;
        case 2: g1 = chroma; b1 = x; break;
        case 3: g1 = x; b1 = chroma; break;
        case 4: r1 = x; b1 = chroma; break;
        default: r1 = chroma; b1 = x; break;
    }
    r = r1 + m;
    g = g1 + m;
    b = b1 + m;
}

bool ColorCycler::step(float deltaSeconds) {
    bool changed = false;
    elapsed += deltaSeconds;
    waveTime = std::fmod(waveTime + deltaSeconds, SATURATION_PERIOD);

    while (elapsed >= STEP_SECONDS) {
        elapsed -= STEP_SECONDS;
        hueOffset = normalizeHue(hueOffset + HUE_STEP);
        float segment = waveTime / SATURATION_PERIOD * 2.f * (float)M_PI;
        saturationOffset += std::round(std::cos(segment) * 2.f);
        saturationOffset = rack::math::clamp(saturationOffset, -100.f, 100.f);
        changed = true;
    }
    return changed;
}

void ColorCycler::reset() {
    elapsed = 0.f;
    waveTime = 0.f;
    hueOffset = 0.f;
    saturationOffset = 0.f;
}

void ColorCycler::restore(float hue, float saturation, float time) {
    hueOffset = normalizeHue(hue);
    saturationOffset = rack::math::clamp(saturation, -100.f, 100.f);
    waveTime = std::fmod(std::max(time, 0.f), SATURATION_PERIOD);
    elapsed = 0.f;
}

}} // namespace chromatone::prism
