// =============================================================================
// Signal Sources - Offline sample producers for the testbench
// =============================================================================
// Both sources hand out fixed-size blocks of an in-memory signal with
// consecutive sample indices, so replaying a recording and replaying a
// synthetic sinusoid exercise the detector identically.
// =============================================================================

#pragma once

#include <phasor/dsp/systems/i_sample_source.h>

#include <cstddef>
#include <string>
#include <vector>

namespace Testbench {

// =============================================================================
// BufferedSource - Serves a sample buffer in blocks
// =============================================================================
class BufferedSource : public Phasor::DSP::ISampleSource {
public:
    BufferedSource(std::vector<float> samples, double sampleRate, size_t blockSize);

    [[nodiscard]] double sampleRate() const noexcept override { return sampleRate_; }
    [[nodiscard]] bool nextBlock(Phasor::DSP::SampleBlock& block) noexcept override;

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }

private:
    std::vector<float> samples_;
    double sampleRate_;
    size_t blockSize_;
    size_t position_ = 0;
};

// Read one sample per line. Blank lines and lines starting with '#' are
// skipped. Returns false and fills error on unreadable files or bad lines.
[[nodiscard]] bool loadSampleFile(const std::string& path, std::vector<float>& samples,
                                  std::string& error);

// Unit-amplitude cosine
[[nodiscard]] std::vector<float> makeSinusoid(double frequency, double sampleRate,
                                              size_t numSamples, double noiseAmplitude = 0.0);

} // namespace Testbench
