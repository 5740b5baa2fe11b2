// ==============================================================================
// Layer 1: DSP Primitive Tests - Fast Fourier Transform
// ==============================================================================
// Tests for: dsp/include/phasor/dsp/primitives/fft.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/primitives/fft.h>

#include <cmath>
#include <vector>

using namespace Phasor::DSP;
using Catch::Approx;

// ==============================================================================
// Size Support
// ==============================================================================

TEST_CASE("FFT size support follows pffft's complex constraints", "[fft][size]") {
    STATIC_REQUIRE(FFT::isSupportedSize(16));
    STATIC_REQUIRE(FFT::isSupportedSize(480));   // 2^5 * 3 * 5
    STATIC_REQUIRE(FFT::isSupportedSize(512));
    STATIC_REQUIRE(FFT::isSupportedSize(8192));

    STATIC_REQUIRE_FALSE(FFT::isSupportedSize(8));     // below minimum
    STATIC_REQUIRE_FALSE(FFT::isSupportedSize(250));   // not a multiple of 16
    STATIC_REQUIRE_FALSE(FFT::isSupportedSize(16 * 7)); // factor 7
    STATIC_REQUIRE_FALSE(FFT::isSupportedSize(16384)); // above maximum
}

TEST_CASE("FFT prepare leaves unsupported sizes unprepared", "[fft][lifecycle]") {
    FFT fft;
    fft.prepare(250);
    REQUIRE_FALSE(fft.isPrepared());
    REQUIRE(fft.size() == 0);

    fft.prepare(256);
    REQUIRE(fft.isPrepared());
    REQUIRE(fft.size() == 256);
}

// ==============================================================================
// Transforms
// ==============================================================================

TEST_CASE("FFT forward puts a complex exponential in a single bin", "[fft][forward]") {
    constexpr size_t N = 64;
    constexpr size_t kBin = 5;
    FFT fft;
    fft.prepare(N);
    REQUIRE(fft.isPrepared());

    std::vector<Complex> input(N);
    for (size_t n = 0; n < N; ++n) {
        const double angle = kTwoPi * static_cast<double>(kBin * n) / static_cast<double>(N);
        input[n] = {static_cast<float>(std::cos(angle)), static_cast<float>(std::sin(angle))};
    }
    std::vector<Complex> output(N);
    fft.forward(input.data(), output.data());

    for (size_t k = 0; k < N; ++k) {
        const float expected = (k == kBin) ? static_cast<float>(N) : 0.0f;
        REQUIRE(output[k].real == Approx(expected).margin(1e-3));
        REQUIRE(output[k].imag == Approx(0.0f).margin(1e-3));
    }
}

TEST_CASE("FFT inverse undoes forward", "[fft][inverse]") {
    const size_t N = GENERATE(size_t{16}, size_t{240}, size_t{512});
    FFT fft;
    fft.prepare(N);
    REQUIRE(fft.isPrepared());

    std::vector<Complex> input(N);
    for (size_t n = 0; n < N; ++n) {
        input[n] = {std::sin(0.37f * static_cast<float>(n)), std::cos(1.3f * static_cast<float>(n))};
    }
    std::vector<Complex> spectrum(N);
    std::vector<Complex> restored(N);
    fft.forward(input.data(), spectrum.data());
    fft.inverse(spectrum.data(), restored.data());

    for (size_t n = 0; n < N; ++n) {
        REQUIRE(restored[n].real == Approx(input[n].real).margin(1e-4));
        REQUIRE(restored[n].imag == Approx(input[n].imag).margin(1e-4));
    }
}

TEST_CASE("FFT inverse of a unit bin is a scaled complex exponential", "[fft][inverse]") {
    constexpr size_t N = 32;
    FFT fft;
    fft.prepare(N);

    std::vector<Complex> spectrum(N);
    spectrum[3] = {1.0f, 0.0f};
    std::vector<Complex> samples(N);
    fft.inverse(spectrum.data(), samples.data());

    for (size_t n = 0; n < N; ++n) {
        REQUIRE(samples[n].magnitude() == Approx(1.0f / N).margin(1e-6));
    }
    REQUIRE(samples[1].phase() == Approx(kTwoPi * 3.0 / N).margin(1e-4));
}
