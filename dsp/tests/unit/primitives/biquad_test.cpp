// ==============================================================================
// Layer 1: DSP Primitive Tests - Biquad / BiquadCascade
// ==============================================================================
// Tests for: dsp/include/phasor/dsp/primitives/biquad.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <phasor/dsp/core/filter_design.h>
#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/primitives/biquad.h>

#include <cmath>
#include <vector>

using namespace Phasor::DSP;
using Catch::Approx;

// ==============================================================================
// BiquadCoefficients
// ==============================================================================

TEST_CASE("BiquadCoefficients normalizes by a0", "[primitives][biquad]") {
    const FilterDesign::SosRow row{2.0, 4.0, 2.0, 2.0, -1.0, 0.5};
    const auto c = BiquadCoefficients::fromSosRow(row);

    REQUIRE(c.b0 == Approx(1.0));
    REQUIRE(c.b1 == Approx(2.0));
    REQUIRE(c.b2 == Approx(1.0));
    REQUIRE(c.a1 == Approx(-0.5));
    REQUIRE(c.a2 == Approx(0.25));
}

TEST_CASE("BiquadCoefficients stability follows the Jury criterion", "[primitives][biquad]") {
    SECTION("poles inside the unit circle") {
        BiquadCoefficients c;
        c.a1 = -1.8;
        c.a2 = 0.81;  // double pole at 0.9
        REQUIRE(c.isStable());
    }

    SECTION("pole on the unit circle is rejected") {
        BiquadCoefficients c;
        c.a1 = -2.0;
        c.a2 = 1.0;
        REQUIRE_FALSE(c.isStable());
    }

    SECTION("pole outside the unit circle is rejected") {
        BiquadCoefficients c;
        c.a1 = -2.2;
        c.a2 = 1.21;
        REQUIRE_FALSE(c.isStable());
    }
}

// ==============================================================================
// Biquad
// ==============================================================================

TEST_CASE("Biquad impulse response matches the difference equation", "[primitives][biquad]") {
    BiquadCoefficients c;
    c.b0 = 0.5;
    c.b1 = 0.25;
    c.b2 = 0.125;
    c.a1 = -0.5;
    c.a2 = 0.1;
    Biquad biquad(c);

    // Direct form I reference
    double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;
    for (int n = 0; n < 32; ++n) {
        const double x = (n == 0) ? 1.0 : 0.0;
        const double expected = c.b0 * x + c.b1 * x1 + c.b2 * x2 - c.a1 * y1 - c.a2 * y2;
        x2 = x1;
        x1 = x;
        y2 = y1;
        y1 = expected;

        REQUIRE(biquad.process(x) == Approx(expected).margin(1e-12));
    }
}

TEST_CASE("Biquad reset clears the state", "[primitives][biquad]") {
    BiquadCoefficients c;
    c.b1 = 1.0;
    Biquad biquad(c);

    (void)biquad.process(1.0);
    biquad.reset();
    REQUIRE(biquad.process(0.0) == 0.0);
}

// ==============================================================================
// BiquadCascade
// ==============================================================================

TEST_CASE("BiquadCascade runs designed band-pass sections", "[primitives][biquad]") {
    const auto design = FilterDesign::designBandpass(FilterFamily::Butterworth, 2, 8.0, 12.0, 1000.0);
    REQUIRE(design);

    BiquadCascade cascade;
    REQUIRE(cascade.setSections(design.sections));
    REQUIRE(cascade.numStages() == 2);
    REQUIRE(cascade.order() == 4);

    SECTION("steady-state gain matches the complex response") {
        const double f = 10.0;
        const double omega = kTwoPi * f / 1000.0;
        double peak = 0.0;
        for (int n = 0; n < 6000; ++n) {
            const double y = cascade.process(std::cos(omega * n));
            if (n >= 5000) {
                peak = std::max(peak, std::abs(y));
            }
        }
        REQUIRE(peak == Approx(std::abs(cascade.response(omega))).epsilon(0.01));
    }

    SECTION("DC is rejected") {
        double y = 0.0;
        for (int n = 0; n < 20000; ++n) {
            y = cascade.process(1.0);
        }
        REQUIRE(std::abs(y) < 1e-6);
    }
}

TEST_CASE("BiquadCascade refuses unstable sections", "[primitives][biquad]") {
    const std::vector<FilterDesign::SosRow> rows{
        {1.0, 0.0, -1.0, 1.0, -1.0, 0.5},
        {1.0, 0.0, -1.0, 1.0, -2.0, 1.0},
    };

    BiquadCascade cascade;
    REQUIRE_FALSE(cascade.setSections(rows));
    REQUIRE(cascade.empty());
}
