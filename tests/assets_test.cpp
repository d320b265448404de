// Wave table and impulse response loading

#include <catch2/catch.hpp>

#include "prism/assets.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace chromatone::prism;

namespace {

void writeText(const std::string& path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

void put16(std::vector<char>& out, uint16_t v) {
    out.push_back((char)(v & 0xFF));
    out.push_back((char)((v >> 8) & 0xFF));
}

void put32(std::vector<char>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) out.push_back((char)((v >> (8 * i)) & 0xFF));
}

void putTag(std::vector<char>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Minimal RIFF writer; an optional LIST chunk checks that unknown chunks are skipped
void writeWav(const std::string& path, uint16_t format, uint16_t bits, uint16_t channels,
              uint32_t sampleRate, const std::vector<char>& data, bool withList = false) {
    std::vector<char> body;
    putTag(body, "WAVE");
    putTag(body, "fmt ");
    put32(body, 16);
    put16(body, format);
    put16(body, channels);
    put32(body, sampleRate);
    put32(body, sampleRate * channels * bits / 8);
    put16(body, (uint16_t)(channels * bits / 8));
    put16(body, bits);
    if (withList) {
        putTag(body, "LIST");
        put32(body, 5);
        body.insert(body.end(), {'a', 'b', 'c', 'd', 'e', 0});
    }
    putTag(body, "data");
    put32(body, (uint32_t)data.size());
    body.insert(body.end(), data.begin(), data.end());

    std::vector<char> file;
    putTag(file, "RIFF");
    put32(file, (uint32_t)body.size());
    file.insert(file.end(), body.begin(), body.end());

    std::ofstream f(path, std::ios::binary);
    f.write(file.data(), (std::streamsize)file.size());
}

}

TEST_CASE("wave tables load from JSON", "[assets]") {
    const std::string path = "chromatone_test_wave.json";
    writeText(path, "{\"real\": [0, 0, 0], \"imag\": [0, 1.0, 0.5]}");

    WaveTable table;
    REQUIRE(loadWaveTableFromFile(path, table));
    REQUIRE(table.real.size() == 3);
    CHECK(table.imag[1] == Approx(1.f));
    CHECK(table.imag[2] == Approx(0.5f));
    std::remove(path.c_str());
}

TEST_CASE("malformed wave tables are rejected", "[assets]") {
    const std::string path = "chromatone_test_bad_wave.json";
    WaveTable table;
    table.real = {42.f};

    SECTION("missing file") {
        CHECK_FALSE(loadWaveTableFromFile("does/not/exist.json", table));
    }
    SECTION("not JSON") {
        writeText(path, "real: 1, 2, 3");
        CHECK_FALSE(loadWaveTableFromFile(path, table));
    }
    SECTION("mismatched lengths") {
        writeText(path, "{\"real\": [0, 1], \"imag\": [0]}");
        CHECK_FALSE(loadWaveTableFromFile(path, table));
    }
    SECTION("non numeric coefficients") {
        writeText(path, "{\"real\": [0, \"x\"], \"imag\": [0, 1]}");
        CHECK_FALSE(loadWaveTableFromFile(path, table));
    }

    // Failed loads leave the output untouched
    CHECK(table.real.size() == 1);
    std::remove(path.c_str());
}

TEST_CASE("16-bit PCM impulse responses decode", "[assets]") {
    const std::string path = "chromatone_test_ir16.wav";
    std::vector<char> data;
    // Stereo frames; only the left channel is kept
    const int16_t left[] = {16384, -16384, 0, 32767};
    for (int16_t v : left) {
        put16(data, (uint16_t)v);
        put16(data, 1000);
    }
    writeWav(path, 1, 16, 2, 22050, data, true);

    ImpulseResponse ir;
    REQUIRE(loadImpulseResponseFromFile(path, ir));
    CHECK(ir.channels == 2);
    CHECK(ir.sampleRate == Approx(22050.f));
    REQUIRE(ir.samples.size() == 4);
    CHECK(ir.samples[0] == Approx(0.5f));
    CHECK(ir.samples[1] == Approx(-0.5f));
    CHECK(ir.samples[2] == Approx(0.f));
    CHECK(ir.samples[3] == Approx(32767.f / 32768.f));
    std::remove(path.c_str());
}

TEST_CASE("24-bit and float impulse responses decode", "[assets]") {
    const std::string path = "chromatone_test_ir.wav";
    ImpulseResponse ir;

    SECTION("24-bit PCM") {
        std::vector<char> data = {
            0x00, 0x00, 0x40,                     // +0.5
            0x00, 0x00, (char)0xC0                // -0.5
        };
        writeWav(path, 1, 24, 1, 48000, data);
        REQUIRE(loadImpulseResponseFromFile(path, ir));
        REQUIRE(ir.samples.size() == 2);
        CHECK(ir.samples[0] == Approx(0.5f));
        CHECK(ir.samples[1] == Approx(-0.5f));
    }

    SECTION("32-bit float") {
        const float values[] = {0.25f, -0.75f, 2.f};
        std::vector<char> data(sizeof(values));
        std::memcpy(data.data(), values, sizeof(values));
        writeWav(path, 3, 32, 1, 44100, data);
        REQUIRE(loadImpulseResponseFromFile(path, ir));
        REQUIRE(ir.samples.size() == 3);
        CHECK(ir.samples[0] == Approx(0.25f));
        CHECK(ir.samples[1] == Approx(-0.75f));
        CHECK(ir.samples[2] == Approx(1.f));
    }
    std::remove(path.c_str());
}

TEST_CASE("unsupported or broken WAV files are rejected", "[assets]") {
    const std::string path = "chromatone_test_bad.wav";
    ImpulseResponse ir;

    SECTION("not RIFF") {
        writeText(path, "definitely not a wave file");
        CHECK_FALSE(loadImpulseResponseFromFile(path, ir));
    }
    SECTION("8-bit PCM") {
        writeWav(path, 1, 8, 1, 44100, std::vector<char>(16, 0));
        CHECK_FALSE(loadImpulseResponseFromFile(path, ir));
    }
    SECTION("missing file") {
        CHECK_FALSE(loadImpulseResponseFromFile("does/not/exist.wav", ir));
    }
    CHECK(ir.samples.empty());
    std::remove(path.c_str());
}

TEST_CASE("linear resampling", "[assets]") {
    std::vector<float> ramp = {0.f, 1.f, 2.f, 3.f, 4.f};

    SECTION("same rate is a copy") {
        CHECK(resampleLinear(ramp, 44100.f, 44100.f) == ramp);
    }
    SECTION("upsampling interpolates") {
        std::vector<float> up = resampleLinear(ramp, 22050.f, 44100.f);
        REQUIRE(up.size() == 9);
        CHECK(up[1] == Approx(0.5f));
        CHECK(up[8] == Approx(4.f));
    }
    SECTION("downsampling keeps every other sample") {
        std::vector<float> down = resampleLinear(ramp, 44100.f, 22050.f);
        REQUIRE(down.size() == 3);
        CHECK(down[1] == Approx(2.f));
        CHECK(down[2] == Approx(4.f));
    }
}
