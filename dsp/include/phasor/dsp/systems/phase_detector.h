// ==============================================================================
// Layer 3: DSP System - Phase Detector
// ==============================================================================
// Single-channel closed-loop phase detector: consumes raw sample blocks,
// tracks the instantaneous phase of the configured band, and emits a trigger
// event each time the phase crosses the target phase.
//
// Pipeline per sample hop:
//   raw -> StreamingBandFilter -> PhaseEstimator -> PhaseTracker
//       -> TriggerPolicy -> ITriggerSink
// The endpoint-corrected Hilbert estimator folds the band filter into its
// kernel and reads the raw samples instead; the filter still runs so that
// non-finite input faults identically for every variant.
//
// State machine:
//   Uninitialized --first block--> Priming --window full--> Tracking
//   Tracking --gap beyond max silent interval--> Priming (reported)
//   any --NaN/infinity--> Faulted (terminal until prepare())
//   any --stop--> Stopped (terminal until prepare())
//
// Threading: one instance belongs to one thread. requestStop() is the only
// member that may be called from another thread; it is honoured between
// blocks, never inside one.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/logging.h>
#include <phasor/dsp/primitives/phase_tracker.h>
#include <phasor/dsp/primitives/trigger_policy.h>
#include <phasor/dsp/processors/band_filter.h>
#include <phasor/dsp/processors/phase_estimator.h>
#include <phasor/dsp/systems/i_sample_source.h>
#include <phasor/dsp/systems/i_trigger_sink.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Phasor {
namespace DSP {

/// @brief Outcome of processing one SampleBlock.
struct BlockResult {
    DetectorError error = DetectorError::None;  ///< Most severe error of the block
    size_t triggersEmitted = 0;                 ///< Events delivered to the sink
    bool deadlineMissed = false;                ///< Took longer than the block's duration

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DetectorError::None;
    }
};

/// @brief Phase-tracking and trigger-decision engine for one channel.
///
/// @code
/// PhaseDetector detector;
/// if (detector.prepare(config) != DetectorError::None) { ... }
/// detector.setTriggerSink(&sink);
/// for (const auto& block : blocks) {
///     const auto result = detector.processBlock(block);
///     if (result.error == DetectorError::NumericalFault) break;
/// }
/// @endcode
class PhaseDetector {
public:
    PhaseDetector() = default;
    ~PhaseDetector() = default;

    // Non-copyable, non-movable (owns an atomic stop flag)
    PhaseDetector(const PhaseDetector&) = delete;
    PhaseDetector& operator=(const PhaseDetector&) = delete;
    PhaseDetector(PhaseDetector&&) = delete;
    PhaseDetector& operator=(PhaseDetector&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Validate the config, design the filter and allocate all state.
    ///
    /// Any previous state is discarded. On success the detector is
    /// Uninitialized and ready for its first block; on failure it stays
    /// unprepared and every block is rejected.
    ///
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] DetectorError prepare(const DetectorConfig& config) {
        releaseState();
        state_ = DetectorState::Uninitialized;
        stopRequested_.store(false, std::memory_order_release);

        const auto validation = validateConfig(config);
        if (!validation) {
            logMessage(LogLevel::Error, "channel %u: configuration rejected: %s",
                       config.channelId, validation.message);
            return validation.error;
        }

        if (const auto error = filter_.prepare(config); error != DetectorError::None) {
            return error;
        }
        if (const auto error = estimator_.prepare(config, filter_.cascade());
            error != DetectorError::None) {
            logMessage(LogLevel::Error, "channel %u: %s estimator rejected the configuration",
                       config.channelId, estimatorVariantName(config.estimatorVariant));
            releaseState();
            return error;
        }

        config_ = config;
        maxSilentInterval_ = resolveMaxSilentInterval(config);
        hop_ = config.estimationInterval;
        tracker_.prepare(maxSilentInterval_, static_cast<int64_t>(hop_));
        trigger_.prepare(config.targetPhase, resolveRefractoryPeriod(config));
        rawInput_ = estimator_.expectsRawInput();
        scratch_.assign(hop_, 0.0f);

        resetCounters();
        prepared_ = true;

        logMessage(LogLevel::Info,
                   "channel %u: %s order %d %.3f-%.3f Hz @ %.1f Hz, %s window %zu, "
                   "target %.4f rad, refractory %lld, max silent %lld",
                   config.channelId, filterFamilyName(config.filterFamily), config.filterOrder,
                   config.targetLowcut, config.targetHighcut, config.samplingRate,
                   estimatorVariantName(config.estimatorVariant), config.windowLength,
                   config.targetPhase, static_cast<long long>(trigger_.refractoryPeriod()),
                   static_cast<long long>(maxSilentInterval_));
        return DetectorError::None;
    }

    /// @brief Sink receiving trigger events (may be null: events are counted only).
    void setTriggerSink(ITriggerSink* sink) noexcept { sink_ = sink; }

    /// @brief Ask the detector to stop at the next block boundary.
    /// @note Thread-safe
    void requestStop() noexcept {
        stopRequested_.store(true, std::memory_order_release);
    }

    /// @brief Stop now: enter Stopped and release all per-channel state.
    void stop() noexcept {
        if (state_ != DetectorState::Stopped) {
            logMessage(LogLevel::Info, "channel %u: stopped after %llu triggers",
                       config_.channelId, static_cast<unsigned long long>(triggerCount_));
        }
        releaseState();
        state_ = DetectorState::Stopped;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Consume one block: filter, estimate, unwrap, decide, emit.
    [[nodiscard]] BlockResult processBlock(const SampleBlock& block) noexcept {
        BlockResult result;

        if (stopRequested_.load(std::memory_order_acquire) && state_ != DetectorState::Stopped) {
            stop();
        }
        if (state_ == DetectorState::Stopped) {
            return result;
        }
        if (state_ == DetectorState::Faulted) {
            result.error = DetectorError::NumericalFault;
            return result;
        }
        if (!prepared_) {
            result.error = DetectorError::Configuration;
            return result;
        }
        if (!matchesSampleRate(block.sampleRate)) {
            logMessage(LogLevel::Error, "channel %u: block declares %.3f Hz, configured %.3f Hz",
                       config_.channelId, block.sampleRate, config_.samplingRate);
            result.error = DetectorError::Configuration;
            return result;
        }
        if (block.samples == nullptr || block.numSamples == 0) {
            return result;
        }

        const auto started = std::chrono::steady_clock::now();

        if (state_ == DetectorState::Uninitialized) {
            state_ = DetectorState::Priming;
            nextIndex_ = block.startIndex;
        }

        size_t offset = 0;
        int64_t firstIndex = block.startIndex;
        if (firstIndex < nextIndex_) {
            // Duplicate or overlapping block: skip what was already consumed
            const int64_t overlap = nextIndex_ - firstIndex;
            if (overlap >= static_cast<int64_t>(block.numSamples)) {
                logMessage(LogLevel::Debug, "channel %u: duplicate block at %lld ignored",
                           config_.channelId, static_cast<long long>(block.startIndex));
                return result;
            }
            offset = static_cast<size_t>(overlap);
            firstIndex = nextIndex_;
        } else if (firstIndex > nextIndex_ && state_ == DetectorState::Priming &&
                   firstIndex - nextIndex_ > maxSilentInterval_) {
            logMessage(LogLevel::Debug, "channel %u: gap of %lld samples while priming, restarting",
                       config_.channelId, static_cast<long long>(firstIndex - nextIndex_));
            resetContinuity();
        }

        processSamples(block.samples + offset, block.numSamples - offset, firstIndex, result);
        nextIndex_ = block.endIndex();

        if (config_.monitorDeadline) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            const double deadline = static_cast<double>(block.numSamples) / config_.samplingRate;
            if (elapsed.count() > deadline) {
                result.deadlineMissed = true;
                ++overrunCount_;
                logMessage(LogLevel::Warning,
                           "channel %u: block at %lld took %.3f ms, deadline %.3f ms (overrun %llu)",
                           config_.channelId, static_cast<long long>(block.startIndex),
                           elapsed.count() * 1000.0, deadline * 1000.0,
                           static_cast<unsigned long long>(overrunCount_));
            }
        }

        return result;
    }

    /// @brief Pull blocks from the source until it ends, a stop is requested,
    /// or the detector faults.
    /// @return Configuration on rate mismatch (nothing consumed),
    ///         NumericalFault if the loop faulted, None otherwise
    [[nodiscard]] DetectorError run(ISampleSource& source, ITriggerSink& sink) noexcept {
        if (!prepared_) {
            return DetectorError::Configuration;
        }
        if (!matchesSampleRate(source.sampleRate())) {
            logMessage(LogLevel::Error, "channel %u: source rate %.3f Hz does not match configured %.3f Hz",
                       config_.channelId, source.sampleRate(), config_.samplingRate);
            return DetectorError::Configuration;
        }

        setTriggerSink(&sink);
        DetectorError outcome = DetectorError::None;
        SampleBlock block;
        while (!stopRequested_.load(std::memory_order_acquire)) {
            if (!source.nextBlock(block)) {
                break;
            }
            const auto result = processBlock(block);
            if (result.error == DetectorError::NumericalFault ||
                result.error == DetectorError::Configuration) {
                outcome = result.error;
                break;
            }
        }

        if (stopRequested_.load(std::memory_order_acquire)) {
            stop();
        }
        setTriggerSink(nullptr);
        return outcome;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] DetectorState state() const noexcept { return state_; }

    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

    [[nodiscard]] const DetectorConfig& config() const noexcept { return config_; }

    /// @brief Continuous tracked phase (radians)
    [[nodiscard]] double unwrappedPhase() const noexcept {
        return tracker_.trajectory().unwrappedPhase;
    }

    /// @brief Most recent wrapped phase estimate (radians, [0, 2pi))
    [[nodiscard]] double currentPhase() const noexcept { return lastEstimate_.phase; }

    /// @brief Wraps registered since the last (re)priming
    [[nodiscard]] int64_t cycleCount() const noexcept { return tracker_.trajectory().cycleCount; }

    [[nodiscard]] uint64_t triggerCount() const noexcept { return triggerCount_; }

    [[nodiscard]] uint64_t discontinuityCount() const noexcept { return discontinuityCount_; }

    [[nodiscard]] uint64_t overrunCount() const noexcept { return overrunCount_; }

    [[nodiscard]] int64_t refractoryPeriod() const noexcept { return trigger_.refractoryPeriod(); }

    [[nodiscard]] int64_t maxSilentInterval() const noexcept { return maxSilentInterval_; }

    /// @brief Index of the next sample the detector expects
    [[nodiscard]] int64_t nextSampleIndex() const noexcept { return nextIndex_; }

private:
    void processSamples(const float* samples, size_t numSamples, int64_t firstIndex,
                        BlockResult& result) noexcept {
        size_t i = 0;
        while (i < numSamples && isRunning()) {
            const size_t chunk = std::min(hop_ - samplesSinceEstimate_, numSamples - i);

            if (filter_.process(samples + i, scratch_.data(), chunk) != DetectorError::None) {
                enterFault("non-finite sample in band filter", firstIndex + static_cast<int64_t>(i), result);
                return;
            }
            estimator_.push(rawInput_ ? samples + i : scratch_.data(), chunk);

            i += chunk;
            samplesSinceEstimate_ += chunk;
            if (samplesSinceEstimate_ == hop_) {
                samplesSinceEstimate_ = 0;
                handleEstimate(firstIndex + static_cast<int64_t>(i) - 1, result);
            }
        }
    }

    void handleEstimate(int64_t sampleIndex, BlockResult& result) noexcept {
        const PhaseEstimate estimate = estimator_.estimate();
        if (estimate.error == DetectorError::InsufficientData) {
            return;
        }
        if (estimate.error != DetectorError::None) {
            enterFault("non-finite phase estimate", sampleIndex, result);
            return;
        }

        lastEstimate_ = estimate;
        if (state_ == DetectorState::Priming) {
            state_ = DetectorState::Tracking;
            logMessage(LogLevel::Info, "channel %u: priming complete at sample %lld",
                       config_.channelId, static_cast<long long>(sampleIndex));
        }

        const auto tracked = tracker_.update(estimate.phase, sampleIndex);
        if (tracked.error == DetectorError::Discontinuity) {
            ++discontinuityCount_;
            logMessage(LogLevel::Warning,
                       "channel %u: %lld samples missing before %lld (max %lld), re-priming",
                       config_.channelId,
                       static_cast<long long>(tracker_.missingSamples(sampleIndex)),
                       static_cast<long long>(sampleIndex),
                       static_cast<long long>(maxSilentInterval_));
            resetContinuity();
            if (result.error == DetectorError::None) {
                result.error = DetectorError::Discontinuity;
            }
            return;
        }
        if (tracked.error != DetectorError::None) {
            enterFault("non-finite tracked phase", sampleIndex, result);
            return;
        }

        if (trigger_.decide(tracked.unwrappedPhase, sampleIndex) == TriggerDecision::Fire) {
            const TriggerEvent event{sampleIndex, estimate.phase, config_.channelId, config_.actionId};
            ++triggerCount_;
            ++result.triggersEmitted;
            if (sink_ != nullptr) {
                sink_->onTrigger(event);
            }
            logMessage(LogLevel::Debug, "channel %u: trigger at %lld, phase %.4f rad",
                       config_.channelId, static_cast<long long>(sampleIndex), estimate.phase);
        }
    }

    /// Discard filter, estimator and continuity state and prime again.
    void resetContinuity() noexcept {
        filter_.reset();
        estimator_.reset();
        tracker_.reset();
        trigger_.resetContinuity();
        samplesSinceEstimate_ = 0;
        state_ = DetectorState::Priming;
    }

    void enterFault(const char* what, int64_t sampleIndex, BlockResult& result) noexcept {
        state_ = DetectorState::Faulted;
        result.error = DetectorError::NumericalFault;
        logMessage(LogLevel::Error, "channel %u: %s at sample %lld, detector faulted",
                   config_.channelId, what, static_cast<long long>(sampleIndex));
    }

    [[nodiscard]] bool isRunning() const noexcept {
        return state_ == DetectorState::Priming || state_ == DetectorState::Tracking;
    }

    [[nodiscard]] bool matchesSampleRate(double sampleRate) const noexcept {
        return std::abs(sampleRate - config_.samplingRate) <= 1e-9 * config_.samplingRate;
    }

    void resetCounters() noexcept {
        nextIndex_ = 0;
        samplesSinceEstimate_ = 0;
        triggerCount_ = 0;
        discontinuityCount_ = 0;
        overrunCount_ = 0;
        lastEstimate_ = {};
    }

    void releaseState() noexcept {
        prepared_ = false;
        filter_ = StreamingBandFilter{};
        estimator_ = PhaseEstimator{};
        tracker_.reset();
        trigger_.reset();
        scratch_ = std::vector<float>{};
        rawInput_ = false;
    }

    DetectorConfig config_;
    StreamingBandFilter filter_;
    PhaseEstimator estimator_;
    PhaseTracker tracker_;
    TriggerPolicy trigger_;
    std::vector<float> scratch_;
    ITriggerSink* sink_ = nullptr;

    DetectorState state_ = DetectorState::Uninitialized;
    bool prepared_ = false;
    int64_t nextIndex_ = 0;
    int64_t maxSilentInterval_ = 1;
    size_t hop_ = 1;
    bool rawInput_ = false;
    size_t samplesSinceEstimate_ = 0;
    PhaseEstimate lastEstimate_;

    uint64_t triggerCount_ = 0;
    uint64_t discontinuityCount_ = 0;
    uint64_t overrunCount_ = 0;

    std::atomic<bool> stopRequested_{false};
};

} // namespace DSP
} // namespace Phasor
