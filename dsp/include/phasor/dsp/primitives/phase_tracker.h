// ==============================================================================
// Layer 1: DSP Primitive - Phase Continuity Tracker
// ==============================================================================
// Stitches successive wrapped phase estimates into a continuous, monotonically
// non-decreasing phase trajectory and counts cycle wraps.
//
// Unwrapping rule:
//   step        = principal difference of raw phase to the previous raw phase
//   continuous  = max(continuous + step, unwrapped - pi)
//   unwrapped   = max(unwrapped, continuous)
//
// Backward steps and forward jumps larger than pi (which alias to backward
// principal steps) never move the unwrapped phase backwards. The floor on the
// continuous accumulator bounds how far a backward excursion can lag, so the
// trajectory resumes as soon as the estimate moves forward again.
//
// A wrap is registered when the raw phase drops by more than pi.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/core/phase_utils.h>

#include <algorithm>
#include <cstdint>

namespace Phasor {
namespace DSP {

/// @brief Continuity state of one tracked oscillation.
struct PhaseTrajectory {
    double unwrappedPhase = 0.0;  ///< Continuous phase, radians
    int64_t cycleCount = 0;       ///< Wraps registered since the last reset
    double lastRawPhase = 0.0;    ///< Last raw (wrapped) phase, [0, 2pi)
};

/// @brief Result of PhaseTracker::update().
struct PhaseTrackerResult {
    DetectorError error = DetectorError::None;
    double unwrappedPhase = 0.0;

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DetectorError::None;
    }
};

/// @brief Unwraps per-estimate phase values across block boundaries.
///
/// Each update carries the sample index of the estimate. Updates at or before
/// the previous index are duplicates and are ignored. Updates are expected one
/// estimation interval apart; when more than maxSilentInterval samples are
/// missing between two updates (index distance minus the interval) the update
/// is a discontinuity: the tracker reports it and leaves its state untouched so
/// the caller can decide to reset.
class PhaseTracker {
public:
    PhaseTracker() noexcept = default;

    /// @param maxSilentInterval Most samples that may go missing between
    ///        consecutive updates (>= 0)
    /// @param estimationInterval Regular index distance between updates (>= 1)
    void prepare(int64_t maxSilentInterval, int64_t estimationInterval = 1) noexcept {
        maxSilentInterval_ = std::max<int64_t>(maxSilentInterval, 0);
        estimationInterval_ = std::max<int64_t>(estimationInterval, 1);
        reset();
    }

    /// @brief Forget the trajectory. The next update starts a new one.
    void reset() noexcept {
        trajectory_ = {};
        continuous_ = 0.0;
        lastSampleIndex_ = 0;
        hasHistory_ = false;
    }

    /// @brief Incorporate one raw phase estimate taken at sampleIndex.
    [[nodiscard]] PhaseTrackerResult update(double rawPhase, int64_t sampleIndex) noexcept {
        if (!detail::isFiniteBits(rawPhase)) {
            return {DetectorError::NumericalFault, trajectory_.unwrappedPhase};
        }
        const double raw = wrapPhase(rawPhase);

        if (!hasHistory_) {
            trajectory_ = {raw, 0, raw};
            continuous_ = raw;
            lastSampleIndex_ = sampleIndex;
            hasHistory_ = true;
            return {DetectorError::None, raw};
        }

        if (sampleIndex <= lastSampleIndex_) {
            return {DetectorError::None, trajectory_.unwrappedPhase};
        }
        if (missingSamples(sampleIndex) > maxSilentInterval_) {
            return {DetectorError::Discontinuity, trajectory_.unwrappedPhase};
        }

        const double step = phaseDifference(raw, trajectory_.lastRawPhase);
        continuous_ = std::max(continuous_ + step, trajectory_.unwrappedPhase - kPi);
        trajectory_.unwrappedPhase = std::max(trajectory_.unwrappedPhase, continuous_);

        if (detectPhaseWrap(raw, trajectory_.lastRawPhase)) {
            ++trajectory_.cycleCount;
        }
        trajectory_.lastRawPhase = raw;
        lastSampleIndex_ = sampleIndex;

        return {DetectorError::None, trajectory_.unwrappedPhase};
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const PhaseTrajectory& trajectory() const noexcept { return trajectory_; }

    /// @brief True once the first estimate after a reset was accepted
    [[nodiscard]] bool hasHistory() const noexcept { return hasHistory_; }

    [[nodiscard]] int64_t lastSampleIndex() const noexcept { return lastSampleIndex_; }

    [[nodiscard]] int64_t maxSilentInterval() const noexcept { return maxSilentInterval_; }

    [[nodiscard]] int64_t estimationInterval() const noexcept { return estimationInterval_; }

    /// @brief Samples that did not arrive between the last update and an
    /// update at sampleIndex (0 on a regular hop)
    [[nodiscard]] int64_t missingSamples(int64_t sampleIndex) const noexcept {
        return std::max<int64_t>(sampleIndex - lastSampleIndex_ - estimationInterval_, 0);
    }

private:
    PhaseTrajectory trajectory_;
    double continuous_ = 0.0;
    int64_t lastSampleIndex_ = 0;
    int64_t maxSilentInterval_ = 1;
    int64_t estimationInterval_ = 1;
    bool hasHistory_ = false;
};

} // namespace DSP
} // namespace Phasor
