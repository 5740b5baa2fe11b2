// ==============================================================================
// Layer 0: Core Utility - Detector Types
// ==============================================================================
// Value types shared by every layer of the phase detector: the error taxonomy,
// the selectable filter and estimator kinds, sample blocks, phase estimates and
// trigger events.
//
// Errors are reported as values. Every fallible operation returns a
// DetectorError, or a small result struct carrying one.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Phasor {
namespace DSP {

// =============================================================================
// Error Taxonomy
// =============================================================================

/// @brief Error codes reported by detector components.
enum class DetectorError : uint8_t {
    None = 0,          ///< Success
    Configuration,     ///< Invalid or unstable configuration, rate mismatch. Fatal.
    InsufficientData,  ///< Estimator window not yet filled. Expected while priming.
    Discontinuity,     ///< Sample gap beyond the maximum silent interval. Recoverable.
    NumericalFault     ///< NaN/infinity or runtime instability. Fatal.
};

/// @brief Human-readable error name for logs and tools.
[[nodiscard]] constexpr const char* detectorErrorName(DetectorError error) noexcept {
    switch (error) {
        case DetectorError::None:             return "None";
        case DetectorError::Configuration:    return "ConfigurationError";
        case DetectorError::InsufficientData: return "InsufficientDataError";
        case DetectorError::Discontinuity:    return "DiscontinuityError";
        case DetectorError::NumericalFault:   return "NumericalFaultError";
    }
    return "Unknown";
}

// =============================================================================
// Selectable Components
// =============================================================================

/// @brief Band-pass coefficient design.
enum class FilterFamily : uint8_t {
    Butterworth = 0,  ///< Maximally flat passband
    Chebyshev1,       ///< Equiripple passband
    Elliptic          ///< Equiripple passband and stopband
};

/// @brief Phase estimation algorithm.
enum class EstimatorVariant : uint8_t {
    EndpointCorrectedHilbert = 0,  ///< ecHT: analytic signal with endpoint correction
    Hilbert,                       ///< HT: plain windowed analytic signal
    PhaseMapping                   ///< PM: landmark-based phase mapping
};

/// @brief Detector loop lifecycle.
enum class DetectorState : uint8_t {
    Uninitialized = 0,  ///< Constructed, no samples consumed
    Priming,            ///< Filling the estimator window
    Tracking,           ///< Estimating phase and deciding triggers
    Stopped,            ///< Terminal, state released
    Faulted             ///< Numerical fault, no further output
};

[[nodiscard]] constexpr const char* detectorStateName(DetectorState state) noexcept {
    switch (state) {
        case DetectorState::Uninitialized: return "Uninitialized";
        case DetectorState::Priming:       return "Priming";
        case DetectorState::Tracking:      return "Tracking";
        case DetectorState::Stopped:       return "Stopped";
        case DetectorState::Faulted:       return "Faulted";
    }
    return "Unknown";
}

// =============================================================================
// Data Model
// =============================================================================

/// @brief A contiguous run of raw samples from one channel.
///
/// Non-owning view: the producer keeps the samples alive until the detector
/// returns from processing the block.
struct SampleBlock {
    const float* samples = nullptr;  ///< Raw amplitudes, oldest first
    size_t numSamples = 0;           ///< Number of samples
    int64_t startIndex = 0;          ///< Sample index of samples[0]
    double sampleRate = 0.0;         ///< Declared sampling rate in Hz

    /// Index one past the last sample of the block
    [[nodiscard]] constexpr int64_t endIndex() const noexcept {
        return startIndex + static_cast<int64_t>(numSamples);
    }
};

/// @brief Output of one phase estimate.
struct PhaseEstimate {
    DetectorError error = DetectorError::None;
    double phase = 0.0;      ///< Wrapped phase at the newest sample, [0, 2pi)
    double amplitude = 0.0;  ///< Envelope estimate (0 when the variant has none)

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DetectorError::None;
    }
};

/// @brief Trigger decision of the trigger policy.
enum class TriggerDecision : uint8_t {
    Hold = 0,
    Fire
};

/// @brief Event delivered to the trigger sink.
struct TriggerEvent {
    int64_t sampleIndex = 0;  ///< Index of the sample the decision was made on
    double phase = 0.0;       ///< Estimated wrapped phase at fire time (audit)
    uint32_t channelId = 0;   ///< Recording channel
    uint32_t actionId = 0;    ///< Stimulation routine the sink should run
};

} // namespace DSP
} // namespace Phasor
