// ==============================================================================
// Layer 1: DSP Primitive - SampleWindow
// ==============================================================================
// Fixed-length rolling window over the most recent samples of a stream.
// Backed by a power-of-2 circular buffer sized once in prepare(), so pushes
// and reads never allocate or move data.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Phasor {
namespace DSP {

/// @brief Compute next power of 2 greater than or equal to n.
/// @param n Input value
/// @return Next power of 2, or n if already power of 2
inline constexpr size_t nextPowerOf2(size_t n) noexcept {
    if (n == 0) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

/// @brief Rolling window holding the last `length` samples pushed.
///
/// Samples are addressed by age: age 0 is the newest sample, age length-1 the
/// oldest one still in the window.
///
/// @code
/// SampleWindow window;
/// window.prepare(400);
///
/// window.push(block, numSamples);
/// if (window.isFull()) {
///     float newest = window.fromNewest(0);
/// }
/// @endcode
class SampleWindow {
public:
    SampleWindow() noexcept = default;
    ~SampleWindow() = default;

    // Non-copyable, movable
    SampleWindow(const SampleWindow&) = delete;
    SampleWindow& operator=(const SampleWindow&) = delete;
    SampleWindow(SampleWindow&&) noexcept = default;
    SampleWindow& operator=(SampleWindow&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Allocate storage for a window of `length` samples.
    /// @note NOT real-time safe (allocates memory)
    void prepare(size_t length) {
        length_ = length;
        buffer_.assign(nextPowerOf2(std::max<size_t>(length, 1)), 0.0f);
        mask_ = buffer_.size() - 1;
        reset();
    }

    /// @brief Forget all samples, keep the allocation.
    void reset() noexcept {
        std::fill(buffer_.begin(), buffer_.end(), 0.0f);
        writeIndex_ = 0;
        totalPushed_ = 0;
    }

    // =========================================================================
    // Writing
    // =========================================================================

    /// @brief Append one sample, evicting the oldest once full.
    void push(float sample) noexcept {
        buffer_[writeIndex_] = sample;
        writeIndex_ = (writeIndex_ + 1) & mask_;
        ++totalPushed_;
    }

    /// @brief Append a run of samples, oldest first.
    void push(const float* samples, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            push(samples[i]);
        }
    }

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Sample by age (0 = newest). Ages at or beyond size() read 0.
    [[nodiscard]] float fromNewest(size_t age) const noexcept {
        if (age >= size()) {
            return 0.0f;
        }
        return buffer_[(writeIndex_ + mask_ - age) & mask_];
    }

    /// @brief Copy the held samples oldest-first into dest (size() floats).
    void copyChronological(float* dest) const noexcept {
        const size_t n = size();
        for (size_t i = 0; i < n; ++i) {
            dest[i] = fromNewest(n - 1 - i);
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief Configured window length
    [[nodiscard]] size_t length() const noexcept { return length_; }

    /// @brief Number of samples currently held (at most length())
    [[nodiscard]] size_t size() const noexcept {
        return totalPushed_ < length_ ? static_cast<size_t>(totalPushed_) : length_;
    }

    /// @brief True once length() samples have been pushed since reset
    [[nodiscard]] bool isFull() const noexcept {
        return length_ > 0 && totalPushed_ >= length_;
    }

    /// @brief Samples pushed since the last reset
    [[nodiscard]] uint64_t totalPushed() const noexcept { return totalPushed_; }

private:
    std::vector<float> buffer_;
    size_t length_ = 0;
    size_t mask_ = 0;
    size_t writeIndex_ = 0;
    uint64_t totalPushed_ = 0;
};

} // namespace DSP
} // namespace Phasor
