// =============================================================================
// Trigger Logger - Records and prints trigger events in the testbench
// =============================================================================

#pragma once

#include <phasor/dsp/systems/i_trigger_sink.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>

namespace Testbench {

// Maximum number of events kept for the summary
constexpr size_t kMaxLogEntries = 4096;

// =============================================================================
// TriggerLogger - Console sink for trigger events
// =============================================================================
class TriggerLogger : public Phasor::DSP::ITriggerSink {
public:
    explicit TriggerLogger(double sampleRate, std::FILE* out = stdout);

    void onTrigger(const Phasor::DSP::TriggerEvent& event) noexcept override;

    // Total events received, including ones dropped from the history
    [[nodiscard]] uint64_t count() const;

    // Mean spacing between consecutive retained events, in samples (0 if < 2)
    [[nodiscard]] double meanSpacing() const;

    void clear();

private:
    std::deque<Phasor::DSP::TriggerEvent> entries_;
    mutable std::mutex mutex_;
    uint64_t count_ = 0;
    double sampleRate_;
    std::FILE* out_;
};

} // namespace Testbench
