// ==============================================================================
// ITriggerSink - Interface for Trigger Event Consumers
// ==============================================================================
// Layer 3: DSP Systems (Interface)
//
// Receives the trigger events of one detector. Delivery is fire-and-forget:
// the detector does not wait for an acknowledgement, so implementations must
// return quickly (hand the event to a command queue, do not block on I/O).
// ==============================================================================
#pragma once

#include <phasor/dsp/core/detector_types.h>

namespace Phasor::DSP {

/// @brief Interface for consumers of trigger events
class ITriggerSink {
public:
    virtual ~ITriggerSink() = default;

    /// @brief Called once per fired trigger, on the detector's thread
    virtual void onTrigger(const TriggerEvent& event) noexcept = 0;
};

} // namespace Phasor::DSP
