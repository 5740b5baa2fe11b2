// ==============================================================================
// Layer 1: DSP Primitive - Trigger Policy
// ==============================================================================
// Decides when the tracked phase crosses the target phase.
//
// A crossing is counted on the unwrapped trajectory: the crossing index
//   c = floor((unwrapped - target) / 2pi)
// increases by one each time the phase passes target (mod 2pi) going up.
// Working on the unwrapped phase makes the decision independent of how
// estimates are grouped into blocks: a crossing straddled by two blocks is
// seen once, by whichever estimate first lands past the target.
//
// A crossing fires only if
//   - the crossing index advanced since the previous decision,
//   - this cycle has not fired yet, and
//   - more than `refractory` samples passed since the last fire.
// A crossing suppressed by the refractory rule is consumed; it never fires
// late at a wrong phase.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/phase_utils.h>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace Phasor {
namespace DSP {

/// @brief Target-crossing trigger decision with a refractory period.
class TriggerPolicy {
public:
    TriggerPolicy() noexcept = default;

    /// @param targetPhase Target in radians, taken modulo 2pi
    /// @param refractoryPeriod Spacing two fires must exceed, samples (>= 0)
    void prepare(double targetPhase, int64_t refractoryPeriod) noexcept {
        targetPhase_ = wrapPhase(targetPhase);
        refractoryPeriod_ = std::max<int64_t>(refractoryPeriod, 0);
        reset();
    }

    /// @brief Full reset, including the refractory history.
    void reset() noexcept {
        resetContinuity();
        hasFired_ = false;
        lastTriggerIndex_ = 0;
    }

    /// @brief Forget crossing bookkeeping after a continuity reset. The last
    /// fire index is kept so the refractory period still holds.
    void resetContinuity() noexcept {
        hasReference_ = false;
        previousCycle_ = 0;
        firedCycle_ = std::numeric_limits<int64_t>::min();
    }

    /// @brief Decide on one tracked phase value.
    /// @param unwrappedPhase Output of the continuity tracker
    /// @param sampleIndex Index of the sample the estimate belongs to
    [[nodiscard]] TriggerDecision decide(double unwrappedPhase, int64_t sampleIndex) noexcept {
        const int64_t cycle = cycleIndex(unwrappedPhase, targetPhase_);

        if (!hasReference_) {
            hasReference_ = true;
            previousCycle_ = cycle;
            return TriggerDecision::Hold;
        }

        const bool crossed = cycle > previousCycle_;
        previousCycle_ = std::max(previousCycle_, cycle);

        if (!crossed || cycle <= firedCycle_) {
            return TriggerDecision::Hold;
        }
        if (!isArmed(sampleIndex)) {
            return TriggerDecision::Hold;
        }

        hasFired_ = true;
        lastTriggerIndex_ = sampleIndex;
        firedCycle_ = cycle;
        return TriggerDecision::Fire;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief False while cooling down after a fire.
    [[nodiscard]] bool isArmed(int64_t sampleIndex) const noexcept {
        return !hasFired_ || sampleIndex - lastTriggerIndex_ > refractoryPeriod_;
    }

    [[nodiscard]] bool hasFired() const noexcept { return hasFired_; }

    [[nodiscard]] int64_t lastTriggerIndex() const noexcept { return lastTriggerIndex_; }

    [[nodiscard]] double targetPhase() const noexcept { return targetPhase_; }

    [[nodiscard]] int64_t refractoryPeriod() const noexcept { return refractoryPeriod_; }

private:
    double targetPhase_ = 0.0;
    int64_t refractoryPeriod_ = 0;
    int64_t previousCycle_ = 0;
    int64_t firedCycle_ = std::numeric_limits<int64_t>::min();
    int64_t lastTriggerIndex_ = 0;
    bool hasReference_ = false;
    bool hasFired_ = false;
};

} // namespace DSP
} // namespace Phasor
