// =============================================================================
// Trigger Logger Implementation
// =============================================================================

#include "trigger_logger.h"

#include <phasor/dsp/core/phase_utils.h>

namespace Testbench {

TriggerLogger::TriggerLogger(double sampleRate, std::FILE* out)
    : sampleRate_(sampleRate)
    , out_(out)
{
}

void TriggerLogger::onTrigger(const Phasor::DSP::TriggerEvent& event) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(event);
        if (entries_.size() > kMaxLogEntries) {
            entries_.pop_front();
        }
        ++count_;
    }

    // Format: [channel/action] index  time  phase
    const double seconds = static_cast<double>(event.sampleIndex) / sampleRate_;
    std::fprintf(out_, "[%u/%u] %10lld  %10.4f s  phase %.4f rad\n",
        event.channelId, event.actionId,
        static_cast<long long>(event.sampleIndex), seconds,
        Phasor::DSP::wrapPhase(event.phase));
}

uint64_t TriggerLogger::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double TriggerLogger::meanSpacing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() < 2) {
        return 0.0;
    }
    const auto span = entries_.back().sampleIndex - entries_.front().sampleIndex;
    return static_cast<double>(span) / static_cast<double>(entries_.size() - 1);
}

void TriggerLogger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    count_ = 0;
}

} // namespace Testbench
