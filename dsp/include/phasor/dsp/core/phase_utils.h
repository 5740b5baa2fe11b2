// ==============================================================================
// Layer 0: Core Utility - Phase Utilities
// ==============================================================================
// Phase helpers shared by the estimators, the continuity tracker and the
// trigger policy.
//
// Design decisions:
// - Phase is an angle in radians. Wrapped phase lives in [0, 2pi): the trough
//   of a band-limited oscillation is 0, the rising zero crossing pi/2, the
//   peak pi (analytic-signal angle shifted by pi).
// - Signed phase differences use the principal range [-pi, pi).
// - Wrapping uses std::floor rather than repeated subtraction because the
//   inputs can be arbitrarily far from the range (unwrapped trajectories).
// ==============================================================================

#pragma once

#include <phasor/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Phasor {
namespace DSP {

// =============================================================================
// Phase Utility Functions
// =============================================================================

/// @brief Phase advance per sample, in radians, of a given frequency.
/// @return 0.0 if sampleRate is not positive (division-by-zero guard).
[[nodiscard]] inline double calculatePhaseIncrement(
    double frequency,
    double sampleRate
) noexcept {
    if (sampleRate <= 0.0) {
        return 0.0;
    }
    return kTwoPi * frequency / sampleRate;
}

/// @brief Wrap phase to [0, 2pi).
///
/// @example
/// @code
/// double a = wrapPhase(7.0);    // 7.0 - 2pi
/// double b = wrapPhase(-0.5);   // 2pi - 0.5
/// @endcode
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    double wrapped = phase - kTwoPi * std::floor(phase / kTwoPi);
    // Rounding can land exactly on 2pi for tiny negative inputs
    if (wrapped >= kTwoPi) {
        wrapped -= kTwoPi;
    }
    return wrapped < 0.0 ? 0.0 : wrapped;
}

/// @brief Wrap phase to the principal range [-pi, pi).
[[nodiscard]] inline double wrapToPi(double phase) noexcept {
    return wrapPhase(phase + kPi) - kPi;
}

/// @brief Signed shortest angular distance from `from` to `to`, in [-pi, pi).
[[nodiscard]] inline double phaseDifference(double to, double from) noexcept {
    return wrapToPi(to - from);
}

/// @brief Detect a cycle wrap between two raw (wrapped) phase values.
///
/// A wrap is registered when the raw phase decreases by more than pi relative
/// to the previous raw phase. Smaller backward steps are estimator jitter.
[[nodiscard]] constexpr bool detectPhaseWrap(
    double currentPhase,
    double previousPhase
) noexcept {
    return previousPhase - currentPhase > kPi;
}

/// @brief Index of the 2pi cycle an unwrapped phase lies in, relative to an
/// offset phase. Crossing the offset in the increasing direction increments
/// the index by one.
[[nodiscard]] inline std::int64_t cycleIndex(
    double unwrappedPhase,
    double offset = 0.0
) noexcept {
    return static_cast<std::int64_t>(std::floor((unwrappedPhase - offset) / kTwoPi));
}

} // namespace DSP
} // namespace Phasor
