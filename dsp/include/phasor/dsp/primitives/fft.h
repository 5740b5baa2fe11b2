// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated complex FFT via pffft (Pretty Fast FFT).
// Provides forward and inverse complex-to-complex transforms in natural bin
// order. Uses SSE on x86/x64, NEON on ARM, with scalar fallback.
//
// pffft complex transforms accept sizes N = 16 * 2^a * 3^b * 5^c. Callers with
// arbitrary lengths check isSupportedSize() and fall back to a direct DFT.
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <memory>

#include <pffft.h>

namespace Phasor {
namespace DSP {

// =============================================================================
// Forward Declarations
// =============================================================================

struct Complex;
class FFT;

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft complex SIMD granularity)
inline constexpr size_t kMinFFTSize = 16;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 8192;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note POD type, layout-compatible with pffft's interleaved format
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    /// @brief Get phase angle in radians
    [[nodiscard]] float phase() const noexcept {
        return std::atan2(imag, real);
    }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

/// Allocate a SIMD-aligned float buffer via pffft
inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Complex Fast Fourier Transform (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Size Queries
    // -------------------------------------------------------------------------

    /// @brief True if pffft can run a complex transform of this size
    [[nodiscard]] static constexpr bool isSupportedSize(size_t fftSize) noexcept {
        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || fftSize % 16 != 0) {
            return false;
        }
        size_t n = fftSize;
        for (size_t factor : {size_t{2}, size_t{3}, size_t{5}}) {
            while (n % factor == 0) {
                n /= factor;
            }
        }
        return n == 1;
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Size accepted by isSupportedSize()
    /// @note NOT real-time safe (allocates memory). Leaves the FFT unprepared
    ///       for unsupported sizes.
    void prepare(size_t fftSize) noexcept {
        size_ = 0;
        setup_.reset();

        if (!isSupportedSize(fftSize)) {
            return;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_COMPLEX));
        if (!setup_) {
            return;
        }

        // Interleaved complex: two floats per bin
        buf1_ = detail::makeAlignedBuffer(2 * fftSize);
        buf2_ = detail::makeAlignedBuffer(2 * fftSize);
        work_ = detail::makeAlignedBuffer(2 * fftSize);
        if (!buf1_ || !buf2_ || !work_) {
            setup_.reset();
            return;
        }
        size_ = fftSize;
    }

    /// @brief Reset internal work buffers
    void reset() noexcept {
        if (buf1_) std::fill_n(buf1_.get(), 2 * size_, 0.0f);
        if (buf2_) std::fill_n(buf2_.get(), 2 * size_, 0.0f);
        if (work_) std::fill_n(work_.get(), 2 * size_, 0.0f);
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward transform X[k] = sum x[n] e^{-2 pi i k n / N} (unscaled)
    /// @param input N complex samples
    /// @param output N complex bins, natural order (DC first)
    void forward(const Complex* input, Complex* output) noexcept {
        transform(input, output, PFFFT_FORWARD, 1.0f);
    }

    /// @brief Inverse transform x[n] = (1/N) sum X[k] e^{+2 pi i k n / N}
    /// @param input N complex bins, natural order
    /// @param output N complex samples
    void inverse(const Complex* input, Complex* output) noexcept {
        transform(input, output, PFFFT_BACKWARD, 1.0f / static_cast<float>(size_));
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Check if prepare() succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    void transform(const Complex* input, Complex* output,
                   pffft_direction_t direction, float scale) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        float* in = buf1_.get();
        for (size_t k = 0; k < N; ++k) {
            in[2 * k] = input[k].real;
            in[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), in, buf2_.get(), work_.get(), direction);

        const float* out = buf2_.get();
        for (size_t k = 0; k < N; ++k) {
            output[k] = {out[2 * k] * scale, out[2 * k + 1] * scale};
        }
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf1_;  // Input staging
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf2_;  // Output staging
    std::unique_ptr<float, detail::PffftAlignedDeleter> work_;  // pffft work buffer
};

} // namespace DSP
} // namespace Phasor
