// ==============================================================================
// Layer 2: DSP Processor - Windowed Hilbert Phase Estimator (ecHT / HT)
// ==============================================================================
// Causal instantaneous phase from the analytic signal of the last N samples,
// read at the newest sample.
//
// Standard construction: DFT of the window, keep DC (and Nyquist for even N),
// double the positive bins, zero the negative bins, inverse DFT, read the last
// sample. HT runs on band-filtered samples. The endpoint-corrected variant
// (ecHT) runs on RAW samples and instead weights each bin by the complex
// response of the band-pass filter, which band-limits the window and
// suppresses the Gibbs-type distortion the finite window produces at its
// edge. Feeding ecHT filtered samples would apply the filter's phase twice.
//
// Phase convention: angle of the analytic sample plus pi, in [0, 2pi).
// For a cosine the trough reads 0, the rising zero crossing pi/2, the peak pi
// and the falling zero crossing 3pi/2.
//
// Only the last analytic sample is ever needed, so the whole chain collapses
// into a fixed complex kernel g = IDFT(W) applied to the window:
//   z[newest] = sum over age m of x[newest - m] * g[m]
// The kernel is built once in prepare() (pffft when the window length is an
// FFT-friendly size, direct DFT otherwise); each estimate costs O(N).
// pffft transforms in single precision: its kernel matches the direct
// double-precision one to roughly 1e-6 relative (1e-5 worst case), which shows
// up as phase differences of the same order between window lengths that take
// different paths.
//
// Reference: Schreglmann et al., "Non-invasive suppression of essential tremor
// via phase-locked disruption of its temporal coherence", Nat. Commun. 2021
// (endpoint-corrected Hilbert transform)
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/core/phase_utils.h>
#include <phasor/dsp/primitives/biquad.h>
#include <phasor/dsp/primitives/fft.h>
#include <phasor/dsp/primitives/sample_window.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Phasor {
namespace DSP {

namespace detail {

/// Spectral weighting of the discrete analytic signal: 1 at DC, 1 at Nyquist
/// (even N), 2 on positive bins, 0 on negative bins.
[[nodiscard]] inline double analyticMask(size_t bin, size_t n) noexcept {
    if (bin == 0) {
        return 1.0;
    }
    if (n % 2 == 0 && bin == n / 2) {
        return 1.0;
    }
    return (bin < (n + 1) / 2) ? 2.0 : 0.0;
}

/// Inverse DFT by direct summation with a twiddle table, O(N^2).
[[nodiscard]] inline std::vector<std::complex<double>> inverseDftDirect(
    const std::vector<std::complex<double>>& spectrum
) {
    const size_t n = spectrum.size();
    std::vector<std::complex<double>> twiddle(n);
    for (size_t j = 0; j < n; ++j) {
        twiddle[j] = std::polar(1.0, kTwoPi * static_cast<double>(j) / static_cast<double>(n));
    }

    std::vector<std::complex<double>> result(n);
    for (size_t m = 0; m < n; ++m) {
        std::complex<double> sum(0.0, 0.0);
        size_t index = 0;
        for (size_t k = 0; k < n; ++k) {
            if (spectrum[k] != std::complex<double>(0.0, 0.0)) {
                sum += spectrum[k] * twiddle[index];
            }
            index += m;
            if (index >= n) {
                index %= n;
            }
        }
        result[m] = sum / static_cast<double>(n);
    }
    return result;
}

/// Inverse DFT through pffft. Returns an empty vector if pffft does not
/// support the length.
/// @note The spectrum is rounded to float for the transform, so the result
///       carries single-precision error (about 1e-6 relative to
///       inverseDftDirect()).
[[nodiscard]] inline std::vector<std::complex<double>> inverseDftFFT(
    const std::vector<std::complex<double>>& spectrum
) {
    const size_t n = spectrum.size();
    FFT fft;
    fft.prepare(n);
    if (!fft.isPrepared()) {
        return {};
    }

    std::vector<Complex> bins(n);
    for (size_t k = 0; k < n; ++k) {
        bins[k] = {static_cast<float>(spectrum[k].real()), static_cast<float>(spectrum[k].imag())};
    }
    std::vector<Complex> samples(n);
    fft.inverse(bins.data(), samples.data());

    std::vector<std::complex<double>> result(n);
    for (size_t m = 0; m < n; ++m) {
        result[m] = {samples[m].real, samples[m].imag};
    }
    return result;
}

} // namespace detail

/// @brief ecHT / HT phase estimator over a fixed trailing window.
class HilbertPhaseEstimator {
public:
    HilbertPhaseEstimator() = default;

    // Non-copyable, movable
    HilbertPhaseEstimator(const HilbertPhaseEstimator&) = delete;
    HilbertPhaseEstimator& operator=(const HilbertPhaseEstimator&) = delete;
    HilbertPhaseEstimator(HilbertPhaseEstimator&&) noexcept = default;
    HilbertPhaseEstimator& operator=(HilbertPhaseEstimator&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Build the endpoint kernel and allocate the window.
    /// @param windowLength Samples per analysis window
    /// @param endpointCorrection true for ecHT, false for HT
    /// @param bandFilter Designed band filter, its response weights the bins (ecHT)
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] DetectorError prepare(
        size_t windowLength,
        bool endpointCorrection,
        const BiquadCascade& bandFilter
    ) {
        kernel_.clear();
        if (windowLength < 2 || (endpointCorrection && bandFilter.empty())) {
            return DetectorError::Configuration;
        }

        endpointCorrection_ = endpointCorrection;
        kernel_ = buildKernel(spectralWeights(windowLength, endpointCorrection, bandFilter));
        for (const auto& tap : kernel_) {
            if (!detail::isFiniteBits(tap.real()) || !detail::isFiniteBits(tap.imag())) {
                kernel_.clear();
                return DetectorError::Configuration;
            }
        }

        window_.prepare(windowLength);
        return DetectorError::None;
    }

    /// @brief Empty the window (the kernel is kept).
    void reset() noexcept {
        window_.reset();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Append samples, oldest first: raw for ecHT, band-filtered for HT.
    void push(const float* samples, size_t numSamples) noexcept {
        window_.push(samples, numSamples);
    }

    /// @brief Phase at the newest sample in the window (trough 0, peak pi).
    /// @return InsufficientData until one full window was pushed
    [[nodiscard]] PhaseEstimate estimate() const noexcept {
        if (!window_.isFull()) {
            return {DetectorError::InsufficientData, 0.0, 0.0};
        }

        double re = 0.0;
        double im = 0.0;
        const size_t n = kernel_.size();
        for (size_t age = 0; age < n; ++age) {
            const double x = window_.fromNewest(age);
            re += x * kernel_[age].real();
            im += x * kernel_[age].imag();
        }

        const double phase = std::atan2(im, re);
        if (!detail::isFiniteBits(phase)) {
            return {DetectorError::NumericalFault, 0.0, 0.0};
        }
        return {DetectorError::None, wrapPhase(phase + kPi), std::hypot(re, im)};
    }

    /// @brief Push, then estimate at the newest sample.
    [[nodiscard]] PhaseEstimate estimate(const float* samples, size_t numSamples) noexcept {
        push(samples, numSamples);
        return estimate();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool isPrimed() const noexcept { return window_.isFull(); }

    [[nodiscard]] size_t windowLength() const noexcept { return window_.length(); }

    [[nodiscard]] bool isEndpointCorrected() const noexcept { return endpointCorrection_; }

    /// @brief ecHT filters through its kernel and takes raw samples
    [[nodiscard]] bool expectsRawInput() const noexcept { return endpointCorrection_; }

    /// @brief Kernel taps, index = sample age (0 = newest)
    [[nodiscard]] const std::vector<std::complex<double>>& kernel() const noexcept { return kernel_; }

    // =========================================================================
    // Kernel Construction
    // =========================================================================

    /// @brief Bin weights W[k] of the analytic-signal construction.
    [[nodiscard]] static std::vector<std::complex<double>> spectralWeights(
        size_t windowLength,
        bool endpointCorrection,
        const BiquadCascade& bandFilter
    ) {
        std::vector<std::complex<double>> weights(windowLength);
        const double n = static_cast<double>(windowLength);
        for (size_t k = 0; k < windowLength; ++k) {
            const double mask = detail::analyticMask(k, windowLength);
            if (mask == 0.0) {
                continue;
            }
            std::complex<double> weight(mask, 0.0);
            if (endpointCorrection) {
                weight *= bandFilter.response(kTwoPi * static_cast<double>(k) / n);
            }
            weights[k] = weight;
        }
        return weights;
    }

    /// @brief Endpoint kernel g = IDFT(weights).
    /// @param allowFFT Use pffft when it supports the length
    [[nodiscard]] static std::vector<std::complex<double>> buildKernel(
        const std::vector<std::complex<double>>& weights,
        bool allowFFT = true
    ) {
        if (allowFFT && FFT::isSupportedSize(weights.size())) {
            auto kernel = detail::inverseDftFFT(weights);
            if (!kernel.empty()) {
                return kernel;
            }
        }
        return detail::inverseDftDirect(weights);
    }

private:
    SampleWindow window_;
    std::vector<std::complex<double>> kernel_;
    bool endpointCorrection_ = true;
};

} // namespace DSP
} // namespace Phasor
