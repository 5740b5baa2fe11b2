// ==============================================================================
// Layer 2: DSP Processor Tests - Phase Estimators (ecHT / HT / PM)
// ==============================================================================
// Tests for: dsp/include/phasor/dsp/processors/hilbert_phase_estimator.h
//            dsp/include/phasor/dsp/processors/phase_mapping_estimator.h
//            dsp/include/phasor/dsp/processors/phase_estimator.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/filter_design.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/primitives/fft.h>
#include <phasor/dsp/processors/band_filter.h>
#include <phasor/dsp/processors/hilbert_phase_estimator.h>
#include <phasor/dsp/processors/phase_estimator.h>
#include <phasor/dsp/processors/phase_mapping_estimator.h>

#include <test_signals.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>

using namespace Phasor::DSP;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 1000.0;

DetectorConfig estimatorConfig(EstimatorVariant variant, size_t windowLength) {
    DetectorConfig config;
    config.samplingRate = kSampleRate;
    config.targetLowcut = 8.0;
    config.targetHighcut = 12.0;
    config.filterFamily = FilterFamily::Butterworth;
    config.filterOrder = 2;
    config.estimatorVariant = variant;
    config.windowLength = windowLength;
    return config;
}

// Accuracy bounds for a cosine at the band centre with a 512-sample window
constexpr double kEchtTolerance = 0.02;
constexpr double kHilbertTolerance = 0.2;
constexpr double kPhaseMappingTolerance = 0.3;

struct ErrorStats {
    double maxError = 0.0;
    double meanError = 0.0;
};

/// Run a cosine through the detector's front end sample by sample (ecHT reads
/// the raw samples, HT and PM the filtered ones) and compare every estimate
/// from sample 1000 on against the input phase shifted by truthShift.
ErrorStats measurePhaseError(EstimatorVariant variant, size_t windowLength, double initialPhase,
                             double frequency, double truthShift = 0.0) {
    const auto config = estimatorConfig(variant, windowLength);
    StreamingBandFilter filter;
    PhaseEstimator estimator;
    REQUIRE(filter.prepare(config) == DetectorError::None);
    REQUIRE(estimator.prepare(config, filter.cascade()) == DetectorError::None);

    const auto input = TestHelpers::generateCosine(2500, frequency, kSampleRate, 1.0, initialPhase);

    ErrorStats stats;
    size_t count = 0;
    for (size_t n = 0; n < input.size(); ++n) {
        float y = 0.0f;
        REQUIRE(filter.process(input[n], y) == DetectorError::None);
        const auto estimate = estimator.estimate(estimator.expectsRawInput() ? &input[n] : &y, 1);
        if (n <= 1000) {
            continue;
        }
        REQUIRE(estimate);
        const double truth = TestHelpers::cosinePhaseAt(n, frequency, kSampleRate, initialPhase + truthShift);
        const double error = TestHelpers::circularDistance(estimate.phase, truth);
        stats.maxError = std::max(stats.maxError, error);
        stats.meanError += error;
        ++count;
    }
    stats.meanError /= static_cast<double>(count);
    return stats;
}

double bandCentre() {
    return FilterDesign::bandCenterFrequency(8.0, 12.0, kSampleRate);
}

/// Phase the band filter adds at a frequency
double filterPhaseAt(double frequency) {
    StreamingBandFilter filter;
    REQUIRE(filter.prepare(estimatorConfig(EstimatorVariant::Hilbert, 250)) == DetectorError::None);
    return std::arg(filter.cascade().response(kTwoPi * frequency / kSampleRate));
}

} // namespace

// ==============================================================================
// Kernel Construction
// ==============================================================================

TEST_CASE("Analytic mask keeps DC and Nyquist, doubles positive bins", "[processors][hilbert]") {
    REQUIRE(detail::analyticMask(0, 8) == 1.0);
    REQUIRE(detail::analyticMask(1, 8) == 2.0);
    REQUIRE(detail::analyticMask(3, 8) == 2.0);
    REQUIRE(detail::analyticMask(4, 8) == 1.0);
    REQUIRE(detail::analyticMask(5, 8) == 0.0);

    SECTION("odd length has no Nyquist bin") {
        REQUIRE(detail::analyticMask(3, 7) == 2.0);
        REQUIRE(detail::analyticMask(4, 7) == 0.0);
    }
}

TEST_CASE("FFT-built kernel matches the direct DFT kernel", "[processors][hilbert]") {
    constexpr size_t N = 480;
    REQUIRE(FFT::isSupportedSize(N));

    StreamingBandFilter filter;
    REQUIRE(filter.prepare(estimatorConfig(EstimatorVariant::EndpointCorrectedHilbert, N)) ==
            DetectorError::None);

    const auto weights = HilbertPhaseEstimator::spectralWeights(N, true, filter.cascade());
    const auto viaFFT = HilbertPhaseEstimator::buildKernel(weights, true);
    const auto direct = HilbertPhaseEstimator::buildKernel(weights, false);
    REQUIRE(viaFFT.size() == N);
    REQUIRE(direct.size() == N);

    double largest = 0.0;
    for (const auto& tap : direct) {
        largest = std::max(largest, std::abs(tap));
    }
    // pffft runs in single precision
    for (size_t m = 0; m < N; ++m) {
        REQUIRE(std::abs(viaFFT[m] - direct[m]) <= 1e-5 * largest);
    }

    SECTION("phase read through either kernel agrees") {
        const auto input = TestHelpers::generateCosine(N, bandCentre(), kSampleRate, 1.0, 0.4);
        std::complex<double> zFFT(0.0, 0.0);
        std::complex<double> zDirect(0.0, 0.0);
        for (size_t age = 0; age < N; ++age) {
            const double x = input[N - 1 - age];
            zFFT += x * viaFFT[age];
            zDirect += x * direct[age];
        }
        REQUIRE(std::abs(std::arg(zFFT / zDirect)) < 1e-4);
    }
}

TEST_CASE("Plain Hilbert kernel recovers the phase of a bin-centred cosine", "[processors][hilbert]") {
    constexpr size_t N = 250;
    constexpr double kBin = 5.0;
    const double frequency = kBin * kSampleRate / static_cast<double>(N);

    HilbertPhaseEstimator estimator;
    REQUIRE(estimator.prepare(N, false, BiquadCascade{}) == DetectorError::None);
    REQUIRE_FALSE(estimator.isEndpointCorrected());

    const auto input = TestHelpers::generateCosine(600, frequency, kSampleRate, 2.0, 0.7);
    for (size_t n = 0; n < input.size(); ++n) {
        const auto estimate = estimator.estimate(&input[n], 1);
        if (n + 1 < N) {
            REQUIRE(estimate.error == DetectorError::InsufficientData);
            continue;
        }
        REQUIRE(estimate);
        const double truth = TestHelpers::cosinePhaseAt(n, frequency, kSampleRate, 0.7);
        REQUIRE(TestHelpers::circularDistance(estimate.phase, truth) < 1e-4);
        REQUIRE(estimate.amplitude == Approx(2.0).epsilon(1e-4));
    }
}

TEST_CASE("Endpoint correction needs a designed band filter", "[processors][hilbert]") {
    HilbertPhaseEstimator estimator;
    REQUIRE(estimator.prepare(256, true, BiquadCascade{}) == DetectorError::Configuration);
}

TEST_CASE("Hilbert phase reads 0 at the trough and pi at the peak", "[processors][hilbert]") {
    constexpr size_t N = 200;
    constexpr double kFrequency = 10.0;  // 20 whole cycles in the window

    HilbertPhaseEstimator estimator;
    REQUIRE(estimator.prepare(N, false, BiquadCascade{}) == DetectorError::None);

    // Cosine starting at its peak: every 100th sample is a peak, every 50th
    // in between a trough
    const auto input = TestHelpers::generateCosine(400, kFrequency, kSampleRate);
    estimator.push(input.data(), 300);
    const auto peak = estimator.estimate(input.data() + 300, 1);
    REQUIRE(peak);
    REQUIRE(TestHelpers::circularDistance(peak.phase, kPi) < 1e-3);

    estimator.push(input.data() + 301, 49);
    const auto trough = estimator.estimate(input.data() + 350, 1);
    REQUIRE(trough);
    REQUIRE(TestHelpers::circularDistance(trough.phase, 0.0) < 1e-3);

    estimator.push(input.data() + 351, 24);
    const auto rising = estimator.estimate(input.data() + 375, 1);
    REQUIRE(rising);
    REQUIRE(TestHelpers::circularDistance(rising.phase, kPi / 2.0) < 1e-3);
}

TEST_CASE("Only the endpoint-corrected estimator reads raw samples", "[processors][hilbert]") {
    StreamingBandFilter filter;
    REQUIRE(filter.prepare(estimatorConfig(EstimatorVariant::EndpointCorrectedHilbert, 256)) ==
            DetectorError::None);

    HilbertPhaseEstimator corrected;
    REQUIRE(corrected.prepare(256, true, filter.cascade()) == DetectorError::None);
    REQUIRE(corrected.expectsRawInput());

    HilbertPhaseEstimator plain;
    REQUIRE(plain.prepare(256, false, filter.cascade()) == DetectorError::None);
    REQUIRE_FALSE(plain.expectsRawInput());

    PhaseMappingEstimator mapping;
    REQUIRE(mapping.prepare(256, PhaseMappingParams{}) == DetectorError::None);
    REQUIRE_FALSE(mapping.expectsRawInput());
}

// ==============================================================================
// Accuracy
// ==============================================================================

TEST_CASE("Accuracy bounds are ordered ecHT, HT, PM", "[processors][phase_estimator][accuracy]") {
    STATIC_REQUIRE(kEchtTolerance <= kHilbertTolerance);
    STATIC_REQUIRE(kHilbertTolerance <= kPhaseMappingTolerance);
}

TEST_CASE("Estimator accuracy on a cosine at the band centre", "[processors][phase_estimator][accuracy]") {
    const double initialPhase = GENERATE(0.3, 1.7);
    constexpr size_t N = 512;

    const auto echt = measurePhaseError(EstimatorVariant::EndpointCorrectedHilbert, N, initialPhase, bandCentre());
    const auto ht = measurePhaseError(EstimatorVariant::Hilbert, N, initialPhase, bandCentre());
    const auto pm = measurePhaseError(EstimatorVariant::PhaseMapping, N, initialPhase, bandCentre());

    INFO("ecHT max " << echt.maxError << ", HT max " << ht.maxError << ", PM max " << pm.maxError);
    REQUIRE(echt.maxError < kEchtTolerance);
    REQUIRE(ht.maxError < kHilbertTolerance);
    REQUIRE(pm.maxError < kPhaseMappingTolerance);

    SECTION("endpoint correction beats the plain Hilbert transform") {
        REQUIRE(echt.maxError < ht.maxError);
        REQUIRE(echt.meanError < ht.meanError);
    }
}

TEST_CASE("Short window: plain Hilbert diverges, ecHT stays bounded", "[processors][phase_estimator][accuracy]") {
    // 250 samples hold about 2.45 cycles of the centre frequency. The plain
    // transform's edge distortion then reaches a full half cycle; the
    // band-limited ecHT kernel keeps a small steady offset.
    const double initialPhase = GENERATE(0.3, 1.7);
    constexpr size_t N = 250;

    const auto echt = measurePhaseError(EstimatorVariant::EndpointCorrectedHilbert, N, initialPhase, bandCentre());
    const auto ht = measurePhaseError(EstimatorVariant::Hilbert, N, initialPhase, bandCentre());
    const auto pm = measurePhaseError(EstimatorVariant::PhaseMapping, N, initialPhase, bandCentre());

    INFO("ecHT max " << echt.maxError << " mean " << echt.meanError
         << ", HT max " << ht.maxError << " mean " << ht.meanError);
    REQUIRE(echt.maxError < 0.2);
    REQUIRE(echt.meanError < ht.meanError);
    REQUIRE(echt.maxError < ht.maxError);
    REQUIRE(ht.maxError > 1.0);

    // PM does not depend on the window length
    REQUIRE(pm.maxError < kPhaseMappingTolerance);
}

TEST_CASE("ecHT off the band centre tracks the band-filtered phase", "[processors][phase_estimator][accuracy]") {
    // Away from the centre the filter shifts the phase by arg H(f). ecHT reports
    // the phase of the filtered oscillation, so its error against the input is
    // arg H(f) once; filtering before the estimator would count it twice.
    const double frequency = GENERATE(9.0, 11.0);
    const size_t N = GENERATE(size_t{250}, size_t{512});
    const double shift = filterPhaseAt(frequency);
    REQUIRE(std::abs(shift) > 0.5);

    const auto filtered = measurePhaseError(EstimatorVariant::EndpointCorrectedHilbert, N, 0.3, frequency, shift);
    const auto input = measurePhaseError(EstimatorVariant::EndpointCorrectedHilbert, N, 0.3, frequency);

    INFO(frequency << " Hz, N " << N << ", arg H " << shift << ", error vs filtered " << filtered.maxError
         << ", vs input " << input.meanError);
    REQUIRE(filtered.maxError < 0.2);
    REQUIRE(input.meanError == Approx(std::abs(shift)).margin(0.15));
    REQUIRE(input.meanError < 1.5 * std::abs(shift));
}

// ==============================================================================
// Phase Mapping
// ==============================================================================

TEST_CASE("Phase mapping learns the oscillation period", "[processors][phase_mapping]") {
    const auto config = estimatorConfig(EstimatorVariant::PhaseMapping, 250);
    StreamingBandFilter filter;
    REQUIRE(filter.prepare(config) == DetectorError::None);

    PhaseMappingEstimator estimator;
    REQUIRE(estimator.prepare(config.windowLength, config.phaseMapping) == DetectorError::None);
    REQUIRE(estimator.phaseSlope() == Approx(config.phaseMapping.defaultSlope));
    REQUIRE(estimator.detectionDelay() == Approx(24.5 + 10.0));

    const auto input = TestHelpers::generateSine(3000, 10.0, kSampleRate);
    std::vector<float> filtered(input.size());
    REQUIRE(filter.process(input.data(), filtered.data(), input.size()) == DetectorError::None);
    estimator.push(filtered.data(), filtered.size());

    REQUIRE(estimator.isPrimed());
    REQUIRE(estimator.phaseSlope() == Approx(kTwoPi * 10.0 / kSampleRate).epsilon(0.05));
}

TEST_CASE("Phase mapping without compensation has no detection delay", "[processors][phase_mapping]") {
    PhaseMappingParams params;
    params.compensateDetectionDelay = false;

    PhaseMappingEstimator estimator;
    REQUIRE(estimator.prepare(100, params) == DetectorError::None);
    REQUIRE(estimator.detectionDelay() == 0.0);
}

TEST_CASE("Phase mapping rejects a regression longer than the window", "[processors][phase_mapping]") {
    PhaseMappingParams params;
    params.regressionWindow = 200;

    PhaseMappingEstimator estimator;
    REQUIRE(estimator.prepare(100, params) == DetectorError::Configuration);
}

// ==============================================================================
// Selectable Estimator
// ==============================================================================

TEST_CASE("PhaseEstimator primes for one window before estimating", "[processors][phase_estimator]") {
    const auto variant = GENERATE(EstimatorVariant::EndpointCorrectedHilbert, EstimatorVariant::Hilbert,
                                  EstimatorVariant::PhaseMapping);
    const auto config = estimatorConfig(variant, 100);

    StreamingBandFilter filter;
    PhaseEstimator estimator;
    REQUIRE(filter.prepare(config) == DetectorError::None);
    REQUIRE(estimator.prepare(config, filter.cascade()) == DetectorError::None);

    REQUIRE(estimator.isPrepared());
    REQUIRE(estimator.variant() == variant);
    REQUIRE(estimator.windowLength() == 100);
    REQUIRE(estimator.expectsRawInput() == (variant == EstimatorVariant::EndpointCorrectedHilbert));

    const auto input = TestHelpers::generateSine(100, 10.0, kSampleRate);
    estimator.push(input.data(), 99);
    REQUIRE_FALSE(estimator.isPrimed());
    REQUIRE(estimator.estimate().error == DetectorError::InsufficientData);

    const auto estimate = estimator.estimate(input.data() + 99, 1);
    REQUIRE(estimator.isPrimed());
    REQUIRE(estimate);
    REQUIRE(estimate.phase >= 0.0);
    REQUIRE(estimate.phase < kTwoPi);

    SECTION("reset returns to priming") {
        estimator.reset();
        REQUIRE_FALSE(estimator.isPrimed());
        REQUIRE(estimator.estimate().error == DetectorError::InsufficientData);
    }
}

TEST_CASE("Unprepared PhaseEstimator reports a configuration error", "[processors][phase_estimator]") {
    PhaseEstimator estimator;
    REQUIRE_FALSE(estimator.isPrepared());
    REQUIRE(estimator.estimate().error == DetectorError::Configuration);
}
