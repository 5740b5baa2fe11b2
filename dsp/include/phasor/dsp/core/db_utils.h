// ==============================================================================
// Layer 0: Core Utility - dB Conversion and Numeric Checks
// ==============================================================================
// dB/linear conversions used by filter design (ripple and attenuation specs)
// and bit-level floating-point checks used to detect numerical faults.
//
// The finiteness checks examine IEEE 754 bit patterns instead of calling
// std::isfinite: with -ffast-math the compiler may assume NaN and infinity
// never occur and fold std::isnan()/std::isfinite() to constants. Fault
// detection must keep working even if a host enables fast-math.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Phasor {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for zero gain in decibels.
inline constexpr double kSilenceFloorDb = -300.0;

namespace detail {

/// NaN check using the IEEE 754 bit pattern.
/// NaN: exponent = all 1s AND mantissa != 0
[[nodiscard]] constexpr bool isNaN(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return ((bits & 0x7FF0000000000000ull) == 0x7FF0000000000000ull) &&
           ((bits & 0x000FFFFFFFFFFFFFull) != 0);
}

/// Finite check (neither NaN nor infinity) using the IEEE 754 bit pattern.
[[nodiscard]] constexpr bool isFiniteBits(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & 0x7FF0000000000000ull) != 0x7FF0000000000000ull;
}

/// Float overload for raw input samples.
[[nodiscard]] constexpr bool isFiniteBits(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// Flush denormals to zero. Recursive filter state decaying towards zero
/// would otherwise run through the slow denormal path on x86.
[[nodiscard]] constexpr double flushDenormal(double x) noexcept {
    constexpr double kDenormalThreshold = 1e-300;
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0 : x;
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert decibels to linear amplitude gain: gain = 10^(dB/20).
/// NaN input returns 0.0.
[[nodiscard]] inline double dbToGain(double dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0;
    }
    return std::pow(10.0, dB / 20.0);
}

/// Convert linear amplitude gain to decibels: dB = 20 * log10(gain).
/// Zero, negative or NaN input returns kSilenceFloorDb.
[[nodiscard]] inline double gainToDb(double gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0) {
        return kSilenceFloorDb;
    }
    const double result = 20.0 * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Phasor
