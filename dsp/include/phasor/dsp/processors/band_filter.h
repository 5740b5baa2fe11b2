// ==============================================================================
// Layer 2: DSP Processor - Streaming Band Filter
// ==============================================================================
// Causal IIR band-pass isolating the oscillation band ahead of phase
// estimation. Designs Butterworth, Chebyshev I or elliptic sections from a
// DetectorConfig and runs them as a TDF2 cascade whose state persists across
// calls.
//
// Fault handling: a non-finite input sample or output sample aborts the call
// with NumericalFault. Samples written before the fault are valid; nothing
// non-finite is ever written to the output.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/filter_design.h>
#include <phasor/dsp/core/logging.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/primitives/biquad.h>

#include <complex>
#include <cstddef>
#include <vector>

namespace Phasor {
namespace DSP {

/// @brief Stateful band-pass filter for one channel.
///
/// @code
/// StreamingBandFilter filter;
/// if (filter.prepare(config) != DetectorError::None) { ... }
/// if (filter.process(in, out, n) == DetectorError::NumericalFault) { ... }
/// @endcode
class StreamingBandFilter {
public:
    StreamingBandFilter() = default;

    // Non-copyable, movable
    StreamingBandFilter(const StreamingBandFilter&) = delete;
    StreamingBandFilter& operator=(const StreamingBandFilter&) = delete;
    StreamingBandFilter(StreamingBandFilter&&) noexcept = default;
    StreamingBandFilter& operator=(StreamingBandFilter&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Design the filter for the configured band.
    /// @return Configuration if the band is invalid or the design unstable
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] DetectorError prepare(const DetectorConfig& config) {
        cascade_ = {};
        sampleRate_ = 0.0;

        const auto design = FilterDesign::designBandpass(
            config.filterFamily, config.filterOrder,
            config.targetLowcut, config.targetHighcut, config.samplingRate,
            config.passbandRippleDb, config.stopbandAttenuationDb);
        if (!design) {
            logMessage(LogLevel::Error, "band filter rejected (%s order %d, %.3f-%.3f Hz @ %.1f Hz): %s",
                       filterFamilyName(config.filterFamily), config.filterOrder,
                       config.targetLowcut, config.targetHighcut, config.samplingRate,
                       design.message);
            return DetectorError::Configuration;
        }
        if (!cascade_.setSections(design.sections)) {
            logMessage(LogLevel::Error, "band filter rejected: section fails the stability test");
            return DetectorError::Configuration;
        }

        sections_ = design.sections;
        maxPoleRadius_ = design.maxPoleRadius;
        sampleRate_ = config.samplingRate;
        return DetectorError::None;
    }

    /// @brief Clear the filter state, keep the design.
    void reset() noexcept {
        cascade_.reset();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Filter numSamples samples (input and output may alias).
    /// @return NumericalFault on a non-finite input or output sample
    [[nodiscard]] DetectorError process(const float* input, float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            const float x = input[i];
            if (!detail::isFiniteBits(x)) {
                return DetectorError::NumericalFault;
            }
            const double y = cascade_.process(static_cast<double>(x));
            const auto out = static_cast<float>(y);
            if (!detail::isFiniteBits(out)) {
                return DetectorError::NumericalFault;
            }
            output[i] = out;
        }
        return DetectorError::None;
    }

    /// @brief Filter a single sample.
    [[nodiscard]] DetectorError process(float input, float& output) noexcept {
        return process(&input, &output, 1);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool isPrepared() const noexcept { return !cascade_.empty(); }

    /// @brief Complex response at a frequency in Hz
    [[nodiscard]] std::complex<double> frequencyResponse(double frequency) const noexcept {
        if (sampleRate_ <= 0.0) {
            return {0.0, 0.0};
        }
        return cascade_.response(kTwoPi * frequency / sampleRate_);
    }

    /// @brief Magnitude response in dB at a frequency in Hz
    [[nodiscard]] double magnitudeDb(double frequency) const noexcept {
        return gainToDb(std::abs(frequencyResponse(frequency)));
    }

    [[nodiscard]] const BiquadCascade& cascade() const noexcept { return cascade_; }

    [[nodiscard]] const std::vector<FilterDesign::SosRow>& sections() const noexcept { return sections_; }

    [[nodiscard]] double maxPoleRadius() const noexcept { return maxPoleRadius_; }

private:
    BiquadCascade cascade_;
    std::vector<FilterDesign::SosRow> sections_;
    double maxPoleRadius_ = 0.0;
    double sampleRate_ = 0.0;
};

} // namespace DSP
} // namespace Phasor
