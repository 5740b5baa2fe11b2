// ==============================================================================
// Layer 1: DSP Primitive Tests - Phase Continuity Tracker
// ==============================================================================
// Tests for: dsp/include/phasor/dsp/primitives/phase_tracker.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <phasor/dsp/core/math_constants.h>
#include <phasor/dsp/core/phase_utils.h>
#include <phasor/dsp/primitives/phase_tracker.h>

#include <cmath>
#include <limits>
#include <random>

using namespace Phasor::DSP;
using Catch::Approx;

TEST_CASE("PhaseTracker starts its trajectory at the first estimate", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(50);
    REQUIRE_FALSE(tracker.hasHistory());

    const auto result = tracker.update(1.25, 100);
    REQUIRE(result);
    REQUIRE(result.unwrappedPhase == Approx(1.25));
    REQUIRE(tracker.hasHistory());
    REQUIRE(tracker.trajectory().cycleCount == 0);
    REQUIRE(tracker.lastSampleIndex() == 100);
}

TEST_CASE("PhaseTracker unwraps a steadily advancing phase", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(10);

    const double step = kTwoPi / 100.0;
    for (int n = 0; n < 1000; ++n) {
        const auto result = tracker.update(wrapPhase(0.3 + step * n), n);
        REQUIRE(result);
        REQUIRE(result.unwrappedPhase == Approx(0.3 + step * n).margin(1e-9));
    }
    REQUIRE(tracker.trajectory().cycleCount == 10);
}

TEST_CASE("PhaseTracker never moves backwards", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(10);

    std::mt19937 rng(7);
    std::uniform_real_distribution<double> jitter(-0.3, 0.3);

    double previous = -std::numeric_limits<double>::infinity();
    const double step = kTwoPi / 50.0;
    for (int n = 0; n < 2000; ++n) {
        const auto result = tracker.update(wrapPhase(1.0 + step * n + jitter(rng)), n);
        REQUIRE(result);
        REQUIRE(result.unwrappedPhase >= previous);
        previous = result.unwrappedPhase;
    }

    SECTION("jitter does not lose or add cycles") {
        REQUIRE(previous == Approx(1.0 + step * 1999).margin(0.7));
    }
}

TEST_CASE("PhaseTracker holds through backward excursions", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(10);

    REQUIRE(tracker.update(2.0, 0));
    REQUIRE(tracker.update(2.5, 1).unwrappedPhase == Approx(2.5));

    SECTION("small step back holds the trajectory") {
        REQUIRE(tracker.update(2.2, 2).unwrappedPhase == Approx(2.5));
        REQUIRE(tracker.update(2.6, 3).unwrappedPhase == Approx(2.6));
    }

    SECTION("forward jump beyond pi is treated as a step back") {
        REQUIRE(tracker.update(2.5 + 3.5, 2).unwrappedPhase == Approx(2.5));
    }
}

TEST_CASE("PhaseTracker counts a wrap on a large raw drop", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(10);

    REQUIRE(tracker.update(6.1, 0));
    const auto result = tracker.update(0.1, 1);
    REQUIRE(result);
    REQUIRE(tracker.trajectory().cycleCount == 1);
    REQUIRE(result.unwrappedPhase == Approx(kTwoPi + 0.1));
}

TEST_CASE("PhaseTracker reports gaps beyond the silent interval", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(20);

    REQUIRE(tracker.update(1.0, 100));

    SECTION("20 missing samples are accepted") {
        REQUIRE(tracker.missingSamples(121) == 20);
        REQUIRE(tracker.update(1.2, 121));
    }

    SECTION("21 missing samples are a discontinuity and leave the state untouched") {
        REQUIRE(tracker.missingSamples(122) == 21);
        const auto result = tracker.update(1.2, 122);
        REQUIRE(result.error == DetectorError::Discontinuity);
        REQUIRE(tracker.lastSampleIndex() == 100);
        REQUIRE(tracker.trajectory().unwrappedPhase == Approx(1.0));
    }

    SECTION("reset starts a fresh trajectory after a gap") {
        REQUIRE(tracker.update(1.2, 500).error == DetectorError::Discontinuity);
        tracker.reset();
        const auto result = tracker.update(4.0, 500);
        REQUIRE(result);
        REQUIRE(result.unwrappedPhase == Approx(4.0));
    }
}

TEST_CASE("PhaseTracker counts missing samples beyond the estimation interval", "[primitives][phase_tracker]") {
    PhaseTracker tracker;

    SECTION("interval 10: the regular hop misses nothing") {
        tracker.prepare(20, 10);
        REQUIRE(tracker.estimationInterval() == 10);
        REQUIRE(tracker.update(1.0, 100));
        REQUIRE(tracker.missingSamples(110) == 0);
        REQUIRE(tracker.update(1.1, 110));
        REQUIRE(tracker.update(1.3, 130));
        REQUIRE(tracker.update(1.5, 160));
        REQUIRE(tracker.update(1.7, 191).error == DetectorError::Discontinuity);
    }

    SECTION("interval larger than the silent interval") {
        tracker.prepare(5, 41);
        REQUIRE(tracker.update(1.0, 40));
        REQUIRE(tracker.update(1.1, 81));
        REQUIRE(tracker.update(1.2, 127));
        REQUIRE(tracker.update(1.3, 174).error == DetectorError::Discontinuity);
    }

    SECTION("zero silent interval accepts only regular hops") {
        tracker.prepare(0, 1);
        REQUIRE(tracker.maxSilentInterval() == 0);
        REQUIRE(tracker.update(1.0, 10));
        REQUIRE(tracker.update(1.1, 11));
        REQUIRE(tracker.update(1.2, 13).error == DetectorError::Discontinuity);
    }
}

TEST_CASE("PhaseTracker ignores duplicate indices", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(20);

    REQUIRE(tracker.update(1.0, 10));
    REQUIRE(tracker.update(1.5, 11));
    const auto duplicate = tracker.update(3.0, 11);
    REQUIRE(duplicate);
    REQUIRE(duplicate.unwrappedPhase == Approx(1.5));
}

TEST_CASE("PhaseTracker rejects non-finite phases", "[primitives][phase_tracker]") {
    PhaseTracker tracker;
    tracker.prepare(20);

    REQUIRE(tracker.update(std::numeric_limits<double>::quiet_NaN(), 0).error ==
            DetectorError::NumericalFault);
    REQUIRE_FALSE(tracker.hasHistory());
}
