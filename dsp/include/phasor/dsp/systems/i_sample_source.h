// ==============================================================================
// ISampleSource - Interface for Sample Block Producers
// ==============================================================================
// Layer 3: DSP Systems (Interface)
//
// Abstract producer of raw sample blocks for one recording channel. Hardware
// acquisition, file replay and synthetic generators implement it; the detector
// loop only pulls from it.
//
// Contract for implementations:
// - Blocks arrive in strictly increasing, gapless sample-index order
// - Every block carries the same declared sampling rate
// - The samples of a returned block stay valid until the next nextBlock() call
// ==============================================================================
#pragma once

#include <phasor/dsp/core/detector_types.h>

namespace Phasor::DSP {

/// @brief Interface for producers of sample blocks
class ISampleSource {
public:
    virtual ~ISampleSource() = default;

    /// @brief Declared sampling rate in Hz
    [[nodiscard]] virtual double sampleRate() const noexcept = 0;

    /// @brief Wait for and return the next block.
    /// @param block Receives the block view
    /// @return false at end of stream
    /// @note The only suspension point of the detector loop
    [[nodiscard]] virtual bool nextBlock(SampleBlock& block) noexcept = 0;
};

} // namespace Phasor::DSP
