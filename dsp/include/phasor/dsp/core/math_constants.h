// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for phase and filter calculations.
// All components should import these constants instead of defining locally.
//
// Phase bookkeeping runs in double precision: a detector tracks the unwrapped
// phase of a recording for hours, and float rounding of a growing angle would
// drift by whole samples over such spans.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Phasor {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for phase calculations
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

} // namespace DSP
} // namespace Phasor
