// ==============================================================================
// Layer 2: DSP Processor - Selectable Phase Estimator
// ==============================================================================
// One estimator interface over the closed set of algorithms {ecHT, HT, PM}.
// The algorithm is chosen once in prepare(); dispatch goes through a
// std::variant, so every call is a direct call on the active alternative.
//
// Input: ecHT reads raw samples (its kernel carries the band filter), HT and
// PM read band-filtered samples. expectsRawInput() tells the caller which.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/primitives/biquad.h>
#include <phasor/dsp/processors/hilbert_phase_estimator.h>
#include <phasor/dsp/processors/phase_mapping_estimator.h>

#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

namespace Phasor {
namespace DSP {

/// @brief Phase estimator with the algorithm selected by configuration.
class PhaseEstimator {
public:
    PhaseEstimator() = default;

    // Non-copyable, movable
    PhaseEstimator(const PhaseEstimator&) = delete;
    PhaseEstimator& operator=(const PhaseEstimator&) = delete;
    PhaseEstimator(PhaseEstimator&&) noexcept = default;
    PhaseEstimator& operator=(PhaseEstimator&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Build the configured estimator.
    /// @param bandFilter Designed band filter (the ecHT weights use its response)
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] DetectorError prepare(const DetectorConfig& config, const BiquadCascade& bandFilter) {
        impl_.emplace<std::monostate>();
        variant_ = config.estimatorVariant;

        DetectorError error = DetectorError::Configuration;
        switch (config.estimatorVariant) {
            case EstimatorVariant::EndpointCorrectedHilbert:
            case EstimatorVariant::Hilbert: {
                HilbertPhaseEstimator hilbert;
                const bool corrected = config.estimatorVariant == EstimatorVariant::EndpointCorrectedHilbert;
                error = hilbert.prepare(config.windowLength, corrected, bandFilter);
                if (error == DetectorError::None) {
                    impl_.emplace<HilbertPhaseEstimator>(std::move(hilbert));
                }
                break;
            }
            case EstimatorVariant::PhaseMapping: {
                PhaseMappingEstimator mapping;
                error = mapping.prepare(config.windowLength, config.phaseMapping);
                if (error == DetectorError::None) {
                    impl_.emplace<PhaseMappingEstimator>(std::move(mapping));
                }
                break;
            }
        }
        return error;
    }

    void reset() noexcept {
        visitActive([](auto& estimator) { estimator.reset(); });
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Append samples (raw or filtered, see expectsRawInput()) without
    /// evaluating the phase.
    void push(const float* samples, size_t numSamples) noexcept {
        visitActive([&](auto& estimator) { estimator.push(samples, numSamples); });
    }

    /// @brief Phase at the newest pushed sample.
    [[nodiscard]] PhaseEstimate estimate() const noexcept {
        PhaseEstimate result{DetectorError::Configuration, 0.0, 0.0};
        visitActive([&](const auto& estimator) { result = estimator.estimate(); });
        return result;
    }

    /// @brief Push samples, then estimate at the newest one.
    [[nodiscard]] PhaseEstimate estimate(const float* samples, size_t numSamples) noexcept {
        push(samples, numSamples);
        return estimate();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool isPrepared() const noexcept {
        return !std::holds_alternative<std::monostate>(impl_);
    }

    [[nodiscard]] bool isPrimed() const noexcept {
        bool primed = false;
        visitActive([&](const auto& estimator) { primed = estimator.isPrimed(); });
        return primed;
    }

    [[nodiscard]] EstimatorVariant variant() const noexcept { return variant_; }

    /// @brief True when push() takes raw samples rather than band-filtered ones
    [[nodiscard]] bool expectsRawInput() const noexcept {
        bool raw = false;
        visitActive([&](const auto& estimator) { raw = estimator.expectsRawInput(); });
        return raw;
    }

    [[nodiscard]] size_t windowLength() const noexcept {
        size_t length = 0;
        visitActive([&](const auto& estimator) { length = estimator.windowLength(); });
        return length;
    }

private:
    template <typename Fn>
    void visitActive(Fn&& fn) noexcept {
        std::visit([&](auto& alternative) {
            if constexpr (!std::is_same_v<std::decay_t<decltype(alternative)>, std::monostate>) {
                fn(alternative);
            }
        }, impl_);
    }

    template <typename Fn>
    void visitActive(Fn&& fn) const noexcept {
        std::visit([&](const auto& alternative) {
            if constexpr (!std::is_same_v<std::decay_t<decltype(alternative)>, std::monostate>) {
                fn(alternative);
            }
        }, impl_);
    }

    std::variant<std::monostate, HilbertPhaseEstimator, PhaseMappingEstimator> impl_;
    EstimatorVariant variant_ = EstimatorVariant::EndpointCorrectedHilbert;
};

} // namespace DSP
} // namespace Phasor
