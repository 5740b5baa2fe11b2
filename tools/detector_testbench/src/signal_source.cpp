// =============================================================================
// Signal Sources Implementation
// =============================================================================

#include "signal_source.h"

#include <phasor/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>
#include <utility>

namespace Testbench {

BufferedSource::BufferedSource(std::vector<float> samples, double sampleRate, size_t blockSize)
    : samples_(std::move(samples))
    , sampleRate_(sampleRate)
    , blockSize_(std::max<size_t>(blockSize, 1))
{
}

bool BufferedSource::nextBlock(Phasor::DSP::SampleBlock& block) noexcept {
    if (position_ >= samples_.size()) {
        return false;
    }
    const size_t count = std::min(blockSize_, samples_.size() - position_);
    block.samples = samples_.data() + position_;
    block.numSamples = count;
    block.startIndex = static_cast<int64_t>(position_);
    block.sampleRate = sampleRate_;
    position_ += count;
    return true;
}

bool loadSampleFile(const std::string& path, std::vector<float>& samples, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return false;
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        const char* begin = line.c_str() + first;
        char* end = nullptr;
        const float value = std::strtof(begin, &end);
        if (end == begin) {
            error = path + ":" + std::to_string(lineNumber) + ": not a number";
            return false;
        }
        samples.push_back(value);
    }
    return true;
}

std::vector<float> makeSinusoid(double frequency, double sampleRate, size_t numSamples,
                                double noiseAmplitude) {
    std::vector<float> samples(numSamples);
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> noise(-noiseAmplitude, noiseAmplitude);
    const double step = Phasor::DSP::kTwoPi * frequency / sampleRate;
    for (size_t i = 0; i < numSamples; ++i) {
        double value = std::cos(step * static_cast<double>(i));
        if (noiseAmplitude > 0.0) {
            value += noise(rng);
        }
        samples[i] = static_cast<float>(value);
    }
    return samples;
}

} // namespace Testbench
