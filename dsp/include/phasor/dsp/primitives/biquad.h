// ==============================================================================
// Layer 1: DSP Primitive - Biquad Cascade
// ==============================================================================
// Transposed Direct Form II second-order sections in double precision, and a
// runtime-sized cascade of them for designed band-pass filters.
//
// State and coefficients are double: narrow low-frequency band-pass designs
// (a few Hz wide at kHz sample rates) put poles within 1e-2 of the unit
// circle, where float coefficient rounding visibly moves the passband.
//
// Reference: Transposed Direct Form II, Oppenheim & Schafer ch. 6
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/filter_design.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Phasor {
namespace DSP {

// =============================================================================
// Forward Declarations
// =============================================================================

struct BiquadCoefficients;
class Biquad;
class BiquadCascade;

// =============================================================================
// BiquadCoefficients
// =============================================================================

/// @brief Normalized biquad coefficients (a0 == 1).
struct BiquadCoefficients {
    double b0 = 1.0;  ///< Feedforward coefficient 0
    double b1 = 0.0;  ///< Feedforward coefficient 1
    double b2 = 0.0;  ///< Feedforward coefficient 2
    double a1 = 0.0;  ///< Feedback coefficient 1 (negated in difference equation)
    double a2 = 0.0;  ///< Feedback coefficient 2 (negated in difference equation)

    /// Build from a designed section row {b0, b1, b2, a0, a1, a2}.
    /// Coefficients are normalized by a0.
    [[nodiscard]] static BiquadCoefficients fromSosRow(const FilterDesign::SosRow& row) noexcept {
        const double a0 = row[3];
        return {row[0] / a0, row[1] / a0, row[2] / a0, row[4] / a0, row[5] / a0};
    }

    /// Check if coefficients represent a stable filter
    /// @return true if both poles lie strictly inside the unit circle
    [[nodiscard]] bool isStable() const noexcept {
        // Jury stability criterion for second-order IIR filter:
        // 1. |a2| < 1
        // 2. |a1| < 1 + a2
        return std::abs(a2) < 1.0 && std::abs(a1) < 1.0 + a2;
    }

    /// Complex response at normalized angular frequency omega (rad/sample)
    [[nodiscard]] std::complex<double> response(double omega) const noexcept {
        const std::complex<double> zInv = std::polar(1.0, -omega);
        const std::complex<double> zInv2 = zInv * zInv;
        return (b0 + b1 * zInv + b2 * zInv2) / (1.0 + a1 * zInv + a2 * zInv2);
    }
};

// =============================================================================
// Biquad Filter Class
// =============================================================================

/// @brief Transposed Direct Form II biquad filter.
///
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    explicit Biquad(const BiquadCoefficients& coeffs) noexcept
        : coeffs_(coeffs) {}

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample
    [[nodiscard]] double process(double input) noexcept {
        const double output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        z1_ = detail::flushDenormal(z1_);
        z2_ = detail::flushDenormal(z2_);
        return output;
    }

    /// Clear filter state
    void reset() noexcept {
        z1_ = 0.0;
        z2_ = 0.0;
    }

private:
    BiquadCoefficients coeffs_;
    double z1_ = 0.0;
    double z2_ = 0.0;
};

// =============================================================================
// BiquadCascade
// =============================================================================

/// @brief Series of biquads with a section count fixed at configure time.
class BiquadCascade {
public:
    BiquadCascade() = default;

    /// Replace all sections. Allocates; call from setup code only.
    /// @return false (and leaves the cascade empty) if any section is unstable
    [[nodiscard]] bool setSections(const std::vector<FilterDesign::SosRow>& rows) {
        stages_.clear();
        stages_.reserve(rows.size());
        for (const auto& row : rows) {
            const auto coeffs = BiquadCoefficients::fromSosRow(row);
            if (!coeffs.isStable()) {
                stages_.clear();
                return false;
            }
            stages_.emplace_back(coeffs);
        }
        return true;
    }

    /// Process single sample through all stages
    [[nodiscard]] double process(double input) noexcept {
        double x = input;
        for (auto& stage : stages_) {
            x = stage.process(x);
        }
        return x;
    }

    /// Clear all stages
    void reset() noexcept {
        for (auto& stage : stages_) {
            stage.reset();
        }
    }

    /// Complex response of the whole cascade at omega (rad/sample)
    [[nodiscard]] std::complex<double> response(double omega) const noexcept {
        std::complex<double> h(1.0, 0.0);
        for (const auto& stage : stages_) {
            h *= stage.coefficients().response(omega);
        }
        return h;
    }

    /// Access individual stage (const)
    [[nodiscard]] const Biquad& stage(size_t index) const noexcept {
        return stages_[index];
    }

    /// Number of stages in cascade
    [[nodiscard]] size_t numStages() const noexcept { return stages_.size(); }

    /// Total filter order (2 * numStages poles)
    [[nodiscard]] size_t order() const noexcept { return 2 * stages_.size(); }

    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }

private:
    std::vector<Biquad> stages_;
};

} // namespace DSP
} // namespace Phasor
