// Prism: wave table and impulse response loading
#pragma once
#include <string>
#include <vector>

namespace chromatone { namespace prism {

// Fourier coefficients of one periodic waveform
struct WaveTable {
    std::vector<float> real;
    std::vector<float> imag;
};

// First channel of a decoded WAV file
struct ImpulseResponse {
    std::vector<float> samples;
    float sampleRate = 0.f;
    int channels = 0;
};

struct AssetPaths {
    std::string squareWave;
    std::string sawtoothWave;
    std::string impulseResponse;
};

// {"real": [...], "imag": [...]}; both arrays non-empty and the same length
bool loadWaveTableFromFile(const std::string& filepath, WaveTable& out);

// RIFF/WAVE, PCM 16/24/32-bit or 32-bit float
bool loadImpulseResponseFromFile(const std::string& filepath, ImpulseResponse& out);

std::vector<float> resampleLinear(const std::vector<float>& in, float fromRate, float toRate);

}} // namespace chromatone::prism
