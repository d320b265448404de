// Prism: wave table and impulse response loading
#include <rack.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include "assets.hpp"

namespace chromatone { namespace prism {

namespace {

// Impulse responses longer than this are not reverbs
const uint32_t MAX_CHUNK_BYTES = 64u * 1024u * 1024u;

uint16_t readLE16(const char* data) {
    return static_cast<uint16_t>(static_cast<unsigned char>(data[0]) |
                                 (static_cast<unsigned char>(data[1]) << 8));
}

uint32_t readLE32(const char* data) {
    return static_cast<uint32_t>(static_cast<unsigned char>(data[0])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[1])) << 8) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[2])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[3])) << 24);
}

bool readCoefficients(json_t* arrayJ, std::vector<float>& out) {
    if (!arrayJ || !json_is_array(arrayJ)) return false;
    out.clear();
    size_t index;
    json_t* valueJ;
    json_array_foreach(arrayJ, index, valueJ) {
        if (!json_is_number(valueJ)) return false;
        out.push_back((float)json_number_value(valueJ));
    }
    return !out.empty();
}

float decodeSample(const unsigned char* p, uint16_t format, uint16_t bits) {
    if (format == 3 && bits == 32) {
        float value;
        std::memcpy(&value, p, sizeof(float));
        return std::isfinite(value) ? rack::math::clamp(value, -1.f, 1.f) : 0.f;
    }
    switch (bits) {
        case 16: {
            int16_t value = (int16_t)(p[0] | (p[1] << 8));
            return value / 32768.f;
        }
        case 24: {
            int32_t value = (int32_t)p[0] | ((int32_t)p[1] << 8) | ((int32_t)p[2] << 16);
            if (value & 0x800000) value |= ~0xFFFFFF;
            return value / 8388608.f;
        }
        case 32: {
            int32_t value = (int32_t)readLE32((const char*)p);
            return (float)(value / 2147483648.0);
        }
        default:
            return 0.f;
    }
}

} // namespace

bool loadWaveTableFromFile(const std::string& filepath, WaveTable& out) {
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            WARN("Chromatone: cannot open wave table %s", filepath.c_str());
            return false;
        }
        std::stringstream ss;
        ss << file.rdbuf();
        std::string content = ss.str();
        if (content.empty()) return false;

        json_error_t error;
        json_t* rootJ = json_loads(content.c_str(), 0, &error);
        if (!rootJ) {
            WARN("Chromatone: wave table %s line %d: %s", filepath.c_str(), error.line, error.text);
            return false;
        }

        WaveTable table;
        bool ok = readCoefficients(json_object_get(rootJ, "real"), table.real)
            && readCoefficients(json_object_get(rootJ, "imag"), table.imag)
            && table.real.size() == table.imag.size();
        json_decref(rootJ);
        if (!ok) {
            WARN("Chromatone: wave table %s has malformed coefficients", filepath.c_str());
            return false;
        }

        out = std::move(table);
        return true;
    }
    catch (const std::exception& e) {
        WARN("Chromatone: failed to load wave table %s: %s", filepath.c_str(), e.what());
        return false;
    }
}

bool loadImpulseResponseFromFile(const std::string& filepath, ImpulseResponse& out) {
    try {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            WARN("Chromatone: cannot open impulse response %s", filepath.c_str());
            return false;
        }

        char header[12];
        file.read(header, 12);
        if (!file || std::strncmp(header, "RIFF", 4) != 0 || std::strncmp(header + 8, "WAVE", 4) != 0) {
            WARN("Chromatone: %s is not a RIFF/WAVE file", filepath.c_str());
            return false;
        }

        bool fmtFound = false;
        bool dataFound = false;
        uint16_t audioFormat = 0;
        uint16_t numChannels = 0;
        uint32_t sampleRate = 0;
        uint16_t bitsPerSample = 0;
        std::vector<char> raw;

        while (file && (!fmtFound || !dataFound)) {
            char chunkHeader[8];
            file.read(chunkHeader, 8);
            if (!file) break;
            uint32_t chunkSize = readLE32(chunkHeader + 4);

            if (std::strncmp(chunkHeader, "fmt ", 4) == 0) {
                if (chunkSize < 16 || chunkSize > 1024) return false;
                std::vector<char> fmt(chunkSize);
                file.read(fmt.data(), chunkSize);
                if (!file) return false;
                audioFormat = readLE16(fmt.data());
                numChannels = readLE16(fmt.data() + 2);
                sampleRate = readLE32(fmt.data() + 4);
                bitsPerSample = readLE16(fmt.data() + 14);
                // WAVE_FORMAT_EXTENSIBLE carries the real format in its sub-format GUID
                if (audioFormat == 0xFFFE && chunkSize >= 26) {
                    audioFormat = readLE16(fmt.data() + 24);
                }
                fmtFound = true;
            }
            else if (std::strncmp(chunkHeader, "data", 4) == 0) {
                if (chunkSize > MAX_CHUNK_BYTES) {
                    WARN("Chromatone: impulse response %s is too long", filepath.c_str());
                    return false;
                }
                raw.resize(chunkSize);
                file.read(raw.data(), chunkSize);
                if (!file) return false;
                dataFound = true;
            }
            else {
                file.seekg(chunkSize, std::ios::cur);
            }
            if (chunkSize % 2 != 0) {
                file.seekg(1, std::ios::cur);
            }
        }

        if (!fmtFound || !dataFound || numChannels == 0 || sampleRate == 0) {
            WARN("Chromatone: impulse response %s is missing fmt or data", filepath.c_str());
            return false;
        }
        bool supported = (audioFormat == 1 && (bitsPerSample == 16 || bitsPerSample == 24 || bitsPerSample == 32))
            || (audioFormat == 3 && bitsPerSample == 32);
        if (!supported) {
            WARN("Chromatone: impulse response %s uses unsupported format %d/%d bit", filepath.c_str(), audioFormat, bitsPerSample);
            return false;
        }

        size_t bytesPerSample = bitsPerSample / 8;
        size_t frameBytes = bytesPerSample * numChannels;
        size_t frames = raw.size() / frameBytes;
        if (frames == 0) return false;

        ImpulseResponse ir;
        ir.samples.resize(frames);
        ir.sampleRate = (float)sampleRate;
        ir.channels = numChannels;
        const unsigned char* bytes = reinterpret_cast<const unsigned char*>(raw.data());
        for (size_t i = 0; i < frames; i++) {
            ir.samples[i] = decodeSample(bytes + i * frameBytes, audioFormat, bitsPerSample);
        }

        out = std::move(ir);
        return true;
    }
    catch (const std::exception& e) {
        WARN("Chromatone: failed to load impulse response %s: %s", filepath.c_str(), e.what());
        return false;
    }
}

std::vector<float> resampleLinear(const std::vector<float>& in, float fromRate, float toRate) {
    if (in.empty() || fromRate <= 0.f || toRate <= 0.f || fromRate == toRate) {
        return in;
    }
    double ratio = (double)fromRate / toRate;
    size_t length = std::max<size_t>(1, (size_t)std::floor((in.size() - 1) / ratio) + 1);
    std::vector<float> out(length);
    for (size_t i = 0; i < length; i++) {
        double pos = i * ratio;
        size_t index = (size_t)pos;
        if (index + 1 >= in.size()) {
            out[i] = in.back();
            continue;
        }
        float frac = (float)(pos - index);
        out[i] = rack::math::crossfade(in[index], in[index + 1], frac);
    }
    return out;
}

}} // namespace chromatone::prism
