// ==============================================================================
// Layer 2: DSP Processor - Phase Mapping Estimator (PM)
// ==============================================================================
// Lightweight phase estimate from waveform landmarks instead of an analytic
// signal.
//
// Per filtered sample:
//   1. Slope of the last R samples by least-squares regression.
//   2. The phase advances by the current phase slope (rad/sample).
//   3. When the last W slope signs all oppose the current half cycle and
//      |slope| >= threshold, a landmark is registered:
//        rising -> falling : peak,   phase pi
//        falling -> rising : trough, phase 0
//   4. At a peak the phase slope becomes pi / (rising half-cycle samples);
//      at a trough 2pi * gradientFactor / (full-cycle samples).
//
// The regression centre lags the newest sample by (R - 1) / 2 and the sign
// run adds W more samples, so a landmark is seen late by D = (R - 1) / 2 + W
// samples. With compensation on, the landmark phase is advanced by D times
// the phase slope.
//
// Optional force reset registers a landmark after resetThreshold samples
// without one; optional lockdown ignores landmarks for lockdownSamples after a
// trough.
//
// Assumes a roughly stationary, near-sinusoidal band-limited waveform.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/core/phase_utils.h>
#include <phasor/dsp/primitives/sample_window.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Phasor {
namespace DSP {

/// @brief Landmark-based phase estimator.
class PhaseMappingEstimator {
public:
    PhaseMappingEstimator() = default;

    // Non-copyable, movable
    PhaseMappingEstimator(const PhaseMappingEstimator&) = delete;
    PhaseMappingEstimator& operator=(const PhaseMappingEstimator&) = delete;
    PhaseMappingEstimator(PhaseMappingEstimator&&) noexcept = default;
    PhaseMappingEstimator& operator=(PhaseMappingEstimator&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @param windowLength Samples needed before the first estimate
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] DetectorError prepare(size_t windowLength, const PhaseMappingParams& params) {
        if (params.regressionWindow < 2 || params.regressionWindow > windowLength ||
            params.signWaitCount < 1 || !(params.defaultSlope > 0.0) ||
            !(params.gradientFactor > 0.0)) {
            return DetectorError::Configuration;
        }

        params_ = params;
        windowLength_ = windowLength;
        regression_.prepare(params.regressionWindow);
        signs_.assign(params.signWaitCount, 0);

        // Centred abscissa: t = R - 1 - age runs forward in time, and
        // t - mean(t) = mean - age.
        const auto r = static_cast<double>(params.regressionWindow);
        const double mean = (r - 1.0) / 2.0;
        denominator_ = 0.0;
        for (size_t age = 0; age < params.regressionWindow; ++age) {
            const double t = mean - static_cast<double>(age);
            denominator_ += t * t;
        }

        detectionDelay_ = params.compensateDetectionDelay
            ? mean + static_cast<double>(params.signWaitCount)
            : 0.0;

        reset();
        return DetectorError::None;
    }

    /// @brief Return to the initial (unprimed) state.
    void reset() noexcept {
        regression_.reset();
        std::fill(signs_.begin(), signs_.end(), uint8_t{1});
        signIndex_ = 0;
        positiveSigns_ = signs_.size();
        rising_ = true;
        haveLandmark_ = false;
        phase_ = 0.0;
        slope_ = params_.defaultSlope;
        samplesSinceLandmark_ = 0;
        risingSamples_ = 0;
        lockRemaining_ = 0;
        samplesSeen_ = 0;
        lastDerivative_ = 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Run the landmark state machine over filtered samples.
    void push(const float* samples, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            processSample(samples[i]);
        }
    }

    /// @brief Current phase at the newest sample.
    /// @return InsufficientData until windowLength samples were pushed
    [[nodiscard]] PhaseEstimate estimate() const noexcept {
        if (!isPrimed()) {
            return {DetectorError::InsufficientData, 0.0, 0.0};
        }
        if (!detail::isFiniteBits(phase_) || !detail::isFiniteBits(slope_)) {
            return {DetectorError::NumericalFault, 0.0, 0.0};
        }
        return {DetectorError::None, wrapPhase(phase_), 0.0};
    }

    /// @brief Push, then estimate at the newest sample.
    [[nodiscard]] PhaseEstimate estimate(const float* samples, size_t numSamples) noexcept {
        push(samples, numSamples);
        return estimate();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool isPrimed() const noexcept { return samplesSeen_ >= windowLength_; }

    [[nodiscard]] size_t windowLength() const noexcept { return windowLength_; }

    /// @brief PM reads the band-filtered signal
    [[nodiscard]] bool expectsRawInput() const noexcept { return false; }

    /// @brief Current phase advance per sample (radians)
    [[nodiscard]] double phaseSlope() const noexcept { return slope_; }

    /// @brief Latest regression slope of the filtered signal
    [[nodiscard]] double derivative() const noexcept { return lastDerivative_; }

    /// @brief Samples by which landmark detection trails the landmark
    [[nodiscard]] double detectionDelay() const noexcept { return detectionDelay_; }

private:
    void processSample(float sample) noexcept {
        regression_.push(sample);
        ++samplesSeen_;
        if (!regression_.isFull()) {
            return;
        }

        const double derivative = regressionSlope();
        lastDerivative_ = derivative;

        if (lockRemaining_ > 0) {
            --lockRemaining_;
        }

        phase_ = wrapPhase(phase_ + slope_);
        ++samplesSinceLandmark_;

        const uint8_t sign = derivative > 0.0 ? 1 : 0;
        positiveSigns_ += sign;
        positiveSigns_ -= signs_[signIndex_];
        signs_[signIndex_] = sign;
        signIndex_ = (signIndex_ + 1) % signs_.size();

        const bool flipped = rising_ ? positiveSigns_ == 0 : positiveSigns_ == signs_.size();
        const bool flip = flipped && std::abs(derivative) >= params_.derivativeThreshold;
        const bool force = params_.forceReset && haveLandmark_ &&
                           samplesSinceLandmark_ >= params_.resetThreshold;

        if ((flip || force) && lockRemaining_ == 0) {
            registerLandmark();
        }
    }

    void registerLandmark() noexcept {
        const auto elapsed = static_cast<double>(samplesSinceLandmark_);

        if (rising_) {
            // Peak: the rising half cycle just ended
            if (haveLandmark_ && samplesSinceLandmark_ > 0) {
                slope_ = kPi / elapsed;
                risingSamples_ = samplesSinceLandmark_;
            }
            phase_ = wrapPhase(kPi + detectionDelay_ * slope_);
        } else {
            // Trough: a full cycle since the previous trough
            if (haveLandmark_ && samplesSinceLandmark_ > 0) {
                const auto cycle = static_cast<double>(risingSamples_ + samplesSinceLandmark_);
                slope_ = risingSamples_ > 0
                    ? kTwoPi * params_.gradientFactor / cycle
                    : kPi / elapsed;
            }
            phase_ = wrapPhase(detectionDelay_ * slope_);
            if (params_.lockdown) {
                lockRemaining_ = params_.lockdownSamples;
            }
        }

        haveLandmark_ = true;
        samplesSinceLandmark_ = 0;
        rising_ = !rising_;

        const uint8_t fill = rising_ ? 1 : 0;
        std::fill(signs_.begin(), signs_.end(), fill);
        positiveSigns_ = rising_ ? signs_.size() : 0;
    }

    [[nodiscard]] double regressionSlope() const noexcept {
        const size_t r = regression_.length();
        const double mean = (static_cast<double>(r) - 1.0) / 2.0;
        double numerator = 0.0;
        for (size_t age = 0; age < r; ++age) {
            numerator += (mean - static_cast<double>(age)) * regression_.fromNewest(age);
        }
        return numerator / denominator_;
    }

    PhaseMappingParams params_;
    SampleWindow regression_;
    std::vector<uint8_t> signs_;
    size_t signIndex_ = 0;
    size_t positiveSigns_ = 0;
    size_t windowLength_ = 0;
    size_t samplesSinceLandmark_ = 0;
    size_t risingSamples_ = 0;
    size_t lockRemaining_ = 0;
    uint64_t samplesSeen_ = 0;
    double denominator_ = 1.0;
    double detectionDelay_ = 0.0;
    double phase_ = 0.0;
    double slope_ = 0.012;
    double lastDerivative_ = 0.0;
    bool rising_ = true;
    bool haveLandmark_ = false;
};

} // namespace DSP
} // namespace Phasor
