#pragma once
#include <rack.hpp>
#include <pffft.h>
#include <cmath>
#include <cstring>
#include <algorithm>
#include <vector>

using namespace rack;

namespace chromatone {
namespace dsp {

// ============================================================================
// CONVOLUTION REVERB
// ============================================================================

// SIMD-aligned float array owned through pffft's allocator
class AlignedArray {
public:
    AlignedArray() {}
    explicit AlignedArray(int size) : length(size) {
        data = (float*)pffft_aligned_malloc(sizeof(float) * size);
        std::memset(data, 0, sizeof(float) * size);
    }
    AlignedArray(AlignedArray&& other) : data(other.data), length(other.length) {
        other.data = nullptr;
        other.length = 0;
    }
    AlignedArray& operator=(AlignedArray&& other) {
        if (this != &other) {
            release();
            data = other.data;
            length = other.length;
            other.data = nullptr;
            other.length = 0;
        }
        return *this;
    }
    AlignedArray(const AlignedArray&) = delete;
    AlignedArray& operator=(const AlignedArray&) = delete;
    ~AlignedArray() { release(); }

    float* get() { return data; }
    const float* get() const { return data; }
    int size() const { return length; }
    void clear() {
        if (data) std::memset(data, 0, sizeof(float) * length);
    }

private:
    float* data = nullptr;
    int length = 0;

    void release() {
        if (data) pffft_aligned_free(data);
        data = nullptr;
    }
};

/**
 * Uniformly partitioned overlap-add convolution.
 * The impulse response is cut into blockSize partitions, each transformed once
 * with a 2*blockSize real FFT. Every process() call consumes and produces one
 * block; latency is zero beyond the block itself.
 */
class PartitionedConvolver {
public:
    explicit PartitionedConvolver(int blockSize)
        : blockSize(blockSize), fftSize(blockSize * 2),
          timeBuffer(blockSize * 2), accumulator(blockSize * 2),
          work(blockSize * 2), overlap(blockSize, 0.f) {
        setup = pffft_new_setup(fftSize, PFFFT_REAL);
    }

    ~PartitionedConvolver() {
        if (setup) pffft_destroy_setup(setup);
    }

    PartitionedConvolver(const PartitionedConvolver&) = delete;
    PartitionedConvolver& operator=(const PartitionedConvolver&) = delete;

    // Partition and transform an impulse response. Scaled to unit energy.
    void setImpulse(const std::vector<float>& impulse) {
        irSpectra.clear();
        inputSpectra.clear();
        if (!setup || impulse.empty()) {
            return;
        }

        double energy = 0.0;
        for (float v : impulse) energy += (double)v * v;
        float scale = energy > 0.0 ? (float)(1.0 / std::sqrt(energy)) : 0.f;

        int partitions = ((int)impulse.size() + blockSize - 1) / blockSize;
        for (int p = 0; p < partitions; p++) {
            timeBuffer.clear();
            int offset = p * blockSize;
            int count = std::min(blockSize, (int)impulse.size() - offset);
            for (int i = 0; i < count; i++) {
                timeBuffer.get()[i] = impulse[offset + i] * scale;
            }
            AlignedArray spectrum(fftSize);
            pffft_transform(setup, timeBuffer.get(), spectrum.get(), work.get(), PFFFT_FORWARD);
            irSpectra.push_back(std::move(spectrum));
            inputSpectra.push_back(AlignedArray(fftSize));
        }
        cursor = 0;
        std::fill(overlap.begin(), overlap.end(), 0.f);
    }

    bool hasImpulse() const { return !irSpectra.empty(); }
    int partitionCount() const { return (int)irSpectra.size(); }

    void process(const float* input, float* output) {
        if (irSpectra.empty()) {
            std::fill(output, output + blockSize, 0.f);
            return;
        }

        int partitions = (int)irSpectra.size();
        cursor = (cursor + partitions - 1) % partitions;

        timeBuffer.clear();
        std::memcpy(timeBuffer.get(), input, sizeof(float) * blockSize);
        pffft_transform(setup, timeBuffer.get(), inputSpectra[cursor].get(), work.get(), PFFFT_FORWARD);

        // Y = sum over p of X[n - p] * H[p]
        accumulator.clear();
        float scaling = 1.f / (float)fftSize;
        for (int p = 0; p < partitions; p++) {
            int slot = (cursor + p) % partitions;
            pffft_zconvolve_accumulate(setup, inputSpectra[slot].get(), irSpectra[p].get(),
                                       accumulator.get(), scaling);
        }
        pffft_transform(setup, accumulator.get(), timeBuffer.get(), work.get(), PFFFT_BACKWARD);

        const float* result = timeBuffer.get();
        for (int i = 0; i < blockSize; i++) {
            output[i] = result[i] + overlap[i];
            overlap[i] = result[blockSize + i];
        }
    }

private:
    int blockSize;
    int fftSize;
    PFFFT_Setup* setup = nullptr;
    AlignedArray timeBuffer;
    AlignedArray accumulator;
    AlignedArray work;
    std::vector<AlignedArray> irSpectra;
    std::vector<AlignedArray> inputSpectra;
    std::vector<float> overlap;
    int cursor = 0;
};

}} // namespace chromatone::dsp
