// ==============================================================================
// Layer 0: Core Utility - Band-Pass Filter Design
// ==============================================================================
// IIR band-pass design in zero/pole/gain form, converted to second-order
// sections for a Transposed Direct Form II cascade.
//
// Pipeline (double precision throughout):
//   analog low-pass prototype (Butterworth / Chebyshev I / Elliptic)
//   -> pre-warped band edges
//   -> low-pass to band-pass transform
//   -> bilinear transform
//   -> second-order sections (poles nearest the unit circle run last)
//
// The prototype order N yields a band-pass with 2N poles, realized as N
// sections. Elliptic prototypes use complete elliptic integrals (AGM), Jacobi
// elliptic functions (descending Landen) and the nome series for the elliptic
// degree equation.
//
// References:
//   Abramowitz & Stegun, ch. 16-17 (Jacobi functions, AGM)
//   Orfanidis, "Lecture Notes on Elliptic Filter Design" (2006)
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/math_constants.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Phasor {
namespace DSP {

/// @brief Band-pass filter design utilities.
namespace FilterDesign {

using ComplexD = std::complex<double>;

/// One second-order section: {b0, b1, b2, a0, a1, a2} with a0 == 1.
using SosRow = std::array<double, 6>;

/// Poles may not come closer to the unit circle than this
inline constexpr double kStabilityMargin = 1e-12;

/// Imaginary parts below this (relative to the magnitude) count as real
inline constexpr double kRealTolerance = 1e-10;

// =============================================================================
// Types
// =============================================================================

/// @brief Filter in zero/pole/gain form (analog or digital).
struct ZpkDesign {
    std::vector<ComplexD> zeros;
    std::vector<ComplexD> poles;
    double gain = 1.0;
};

/// @brief Result of designBandpass().
struct BandpassDesign {
    std::vector<SosRow> sections;
    double maxPoleRadius = 0.0;  ///< Largest digital pole magnitude
    DetectorError error = DetectorError::None;
    const char* message = "";

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DetectorError::None;
    }
};

/// @brief Jacobi elliptic functions sn, cn, dn at one argument.
struct JacobiElliptic {
    double sn = 0.0;
    double cn = 1.0;
    double dn = 1.0;
};

// =============================================================================
// Frequency Helpers
// =============================================================================

/// @brief Prewarp frequency for bilinear transform compensation.
///
/// @formula f_prewarped = (sampleRate / pi) * tan(pi * freq / sampleRate)
///
/// @note Returns freq unchanged if sampleRate <= 0 or freq <= 0
[[nodiscard]] inline double prewarpFrequency(double freq, double sampleRate) noexcept {
    if (sampleRate <= 0.0 || freq <= 0.0) {
        return freq;
    }
    return (sampleRate / kPi) * std::tan(kPi * freq / sampleRate);
}

/// @brief Digital centre frequency of a bilinear band-pass design.
///
/// The analog centre sqrt(w1 * w2) maps back to this frequency. The designed
/// filter has zero phase shift there.
[[nodiscard]] inline double bandCenterFrequency(
    double lowcut,
    double highcut,
    double sampleRate
) noexcept {
    const double t1 = std::tan(kPi * lowcut / sampleRate);
    const double t2 = std::tan(kPi * highcut / sampleRate);
    return (sampleRate / kPi) * std::atan(std::sqrt(t1 * t2));
}

// =============================================================================
// Elliptic Functions
// =============================================================================

namespace detail {

[[nodiscard]] inline double arithmeticGeometricMean(double a, double b) noexcept {
    for (int i = 0; i < 64; ++i) {
        if (std::abs(a - b) <= 1e-15 * a) {
            break;
        }
        const double nextA = 0.5 * (a + b);
        b = std::sqrt(a * b);
        a = nextA;
    }
    return a;
}

} // namespace detail

/// @brief Complete elliptic integral of the first kind K(m), parameter m = k^2.
[[nodiscard]] inline double ellipticK(double m) noexcept {
    return kPi / (2.0 * detail::arithmeticGeometricMean(1.0, std::sqrt(1.0 - m)));
}

/// @brief K(1 - p), accurate for small p.
[[nodiscard]] inline double ellipticKm1(double p) noexcept {
    return kPi / (2.0 * detail::arithmeticGeometricMean(1.0, std::sqrt(p)));
}

/// @brief Jacobi elliptic functions by descending Landen / AGM (A&S 16.4).
[[nodiscard]] inline JacobiElliptic jacobiElliptic(double u, double m) noexcept {
    if (m < 1e-9) {
        return {std::sin(u), std::cos(u), 1.0};
    }
    if (m > 1.0 - 1e-9) {
        const double sech = 1.0 / std::cosh(u);
        return {std::tanh(u), sech, sech};
    }

    constexpr int kMaxSteps = 16;
    std::array<double, kMaxSteps + 1> a{};
    std::array<double, kMaxSteps + 1> c{};
    a[0] = 1.0;
    c[0] = std::sqrt(m);
    double b = std::sqrt(1.0 - m);

    int n = 0;
    while (std::abs(c[n]) > 1e-15 && n < kMaxSteps) {
        a[n + 1] = 0.5 * (a[n] + b);
        c[n + 1] = 0.5 * (a[n] - b);
        b = std::sqrt(a[n] * b);
        ++n;
    }
    if (n == 0) {
        return {std::sin(u), std::cos(u), 1.0};
    }

    double phi = std::ldexp(a[n] * u, n);
    double phi1 = phi;
    for (int i = n; i >= 1; --i) {
        const double previous = phi;
        phi = 0.5 * (phi + std::asin(c[i] / a[i] * std::sin(phi)));
        if (i == 1) {
            phi1 = previous;
        }
    }

    const double cn = std::cos(phi);
    return {std::sin(phi), cn, cn / std::cos(phi1 - phi)};
}

/// @brief Solve the degree equation: the elliptic parameter m for which an
/// order-n elliptic filter realizes the selectivity parameter m1.
[[nodiscard]] inline double ellipticDegree(int n, double m1) noexcept {
    const double k1 = ellipticK(m1);
    const double k1p = ellipticKm1(m1);
    const double q1 = std::exp(-kPi * k1p / k1);
    const double q = std::pow(q1, 1.0 / static_cast<double>(n));

    double num = 0.0;
    for (int i = 0; i < 8; ++i) {
        num += std::pow(q, static_cast<double>(i * (i + 1)));
    }
    double den = 1.0;
    for (int i = 1; i <= 8; ++i) {
        den += 2.0 * std::pow(q, static_cast<double>(i * i));
    }
    const double ratio = num / den;
    return 16.0 * q * ratio * ratio * ratio * ratio;
}

namespace detail {

/// Inverse Jacobi sn for complex argument, by descending Landen transforms.
[[nodiscard]] inline ComplexD inverseJacobiSn(ComplexD w, double m) noexcept {
    constexpr int kMaxSteps = 10;
    std::array<double, kMaxSteps + 1> ks{};
    ks[0] = std::sqrt(m);
    int count = 1;
    while (count <= kMaxSteps && ks[count - 1] != 0.0) {
        const double k = ks[count - 1];
        const double kp = std::sqrt((1.0 - k) * (1.0 + k));
        ks[count] = (1.0 - kp) / (1.0 + kp);
        ++count;
    }

    double capK = kHalfPi;
    for (int i = 1; i < count; ++i) {
        capK *= 1.0 + ks[i];
    }

    ComplexD wn = w;
    for (int i = 0; i + 1 < count; ++i) {
        const ComplexD kw = ks[i] * wn;
        wn = 2.0 * wn / ((1.0 + ks[i + 1]) * (1.0 + std::sqrt((1.0 - kw) * (1.0 + kw))));
    }

    return capK * (2.0 / kPi) * std::asin(wn);
}

/// Real inverse of the Jacobi sc function: sc(u, m) = w.
[[nodiscard]] inline double inverseJacobiSc1(double w, double m) noexcept {
    return inverseJacobiSn(ComplexD(0.0, w), m).imag();
}

[[nodiscard]] inline ComplexD productOfNegated(const std::vector<ComplexD>& roots) noexcept {
    ComplexD product(1.0, 0.0);
    for (const auto& r : roots) {
        product *= -r;
    }
    return product;
}

[[nodiscard]] inline bool isReal(const ComplexD& value) noexcept {
    return std::abs(value.imag()) <= kRealTolerance * std::max(1.0, std::abs(value));
}

} // namespace detail

// =============================================================================
// Analog Low-Pass Prototypes (cutoff 1 rad/s)
// =============================================================================

/// @brief Butterworth prototype: N poles evenly spaced on the left unit
/// half-circle, -3 dB at the cutoff.
[[nodiscard]] inline ZpkDesign butterworthPrototype(int order) {
    ZpkDesign zpk;
    for (int k = 0; k < order; ++k) {
        const double angle = kPi * static_cast<double>(2 * k + order + 1) /
                             static_cast<double>(2 * order);
        ComplexD pole = std::polar(1.0, angle);
        if (2 * k + 1 == order) {
            pole = ComplexD(-1.0, 0.0);
        }
        zpk.poles.push_back(pole);
    }
    zpk.gain = 1.0;
    return zpk;
}

/// @brief Chebyshev Type I prototype with `rippleDb` equiripple passband.
/// The response at the cutoff is -rippleDb.
[[nodiscard]] inline ZpkDesign chebyshev1Prototype(int order, double rippleDb) {
    ZpkDesign zpk;
    const double eps = std::sqrt(std::pow(10.0, 0.1 * rippleDb) - 1.0);
    const double mu = std::asinh(1.0 / eps) / static_cast<double>(order);

    for (int m = -order + 1; m < order; m += 2) {
        const double theta = kPi * static_cast<double>(m) / static_cast<double>(2 * order);
        zpk.poles.push_back(-std::sinh(ComplexD(mu, theta)));
    }

    zpk.gain = detail::productOfNegated(zpk.poles).real();
    if (order % 2 == 0) {
        zpk.gain /= std::sqrt(1.0 + eps * eps);
    }
    return zpk;
}

/// @brief Elliptic (Cauer) prototype: `rippleDb` passband ripple and
/// `attenuationDb` minimum stopband attenuation.
[[nodiscard]] inline ZpkDesign ellipticPrototype(int order, double rippleDb, double attenuationDb) {
    ZpkDesign zpk;

    if (order == 1) {
        const double pole = -std::sqrt(1.0 / (std::pow(10.0, 0.1 * rippleDb) - 1.0));
        zpk.poles.push_back(ComplexD(pole, 0.0));
        zpk.gain = -pole;
        return zpk;
    }

    const double epsSq = std::pow(10.0, 0.1 * rippleDb) - 1.0;
    const double eps = std::sqrt(epsSq);
    const double ck1Sq = epsSq / (std::pow(10.0, 0.1 * attenuationDb) - 1.0);
    const double val0 = ellipticK(ck1Sq);
    const double m = ellipticDegree(order, ck1Sq);
    const double capK = ellipticK(m);

    std::vector<JacobiElliptic> sv;
    for (int j = 1 - order % 2; j < order; j += 2) {
        sv.push_back(jacobiElliptic(static_cast<double>(j) * capK / static_cast<double>(order), m));
    }

    for (const auto& v : sv) {
        if (std::abs(v.sn) > 1e-14) {
            zpk.zeros.push_back(ComplexD(0.0, 1.0 / (std::sqrt(m) * v.sn)));
        }
    }
    const size_t upperZeros = zpk.zeros.size();
    for (size_t i = 0; i < upperZeros; ++i) {
        zpk.zeros.push_back(std::conj(zpk.zeros[i]));
    }

    const double r = detail::inverseJacobiSc1(1.0 / eps, ck1Sq);
    const double v0 = capK * r / (static_cast<double>(order) * val0);
    const JacobiElliptic shifted = jacobiElliptic(v0, 1.0 - m);

    for (const auto& v : sv) {
        const double ds = v.dn * shifted.sn;
        const ComplexD numerator(v.cn * v.dn * shifted.sn * shifted.cn, v.sn * shifted.dn);
        ComplexD pole = -numerator / (1.0 - ds * ds);
        if (std::abs(v.sn) <= 1e-14) {
            pole = ComplexD(pole.real(), 0.0);
        }
        zpk.poles.push_back(pole);
    }
    const size_t basePoles = zpk.poles.size();
    for (size_t i = 0; i < basePoles; ++i) {
        if (zpk.poles[i].imag() != 0.0) {
            zpk.poles.push_back(std::conj(zpk.poles[i]));
        }
    }

    zpk.gain = (detail::productOfNegated(zpk.poles) / detail::productOfNegated(zpk.zeros)).real();
    if (order % 2 == 0) {
        zpk.gain /= std::sqrt(1.0 + epsSq);
    }
    return zpk;
}

// =============================================================================
// Transforms
// =============================================================================

/// @brief Low-pass to band-pass transform between angular edges w1 < w2 (rad/s).
[[nodiscard]] inline ZpkDesign lowpassToBandpass(const ZpkDesign& prototype, double w1, double w2) {
    const double wo = std::sqrt(w1 * w2);
    const double bw = w2 - w1;

    auto transform = [&](const ComplexD& root, std::vector<ComplexD>& out) {
        const ComplexD scaled = root * (bw / 2.0);
        const ComplexD offset = std::sqrt(scaled * scaled - wo * wo);
        out.push_back(scaled + offset);
        out.push_back(scaled - offset);
    };

    ZpkDesign bandpass;
    for (const auto& z : prototype.zeros) {
        transform(z, bandpass.zeros);
    }
    for (const auto& p : prototype.poles) {
        transform(p, bandpass.poles);
    }

    const size_t degree = prototype.poles.size() - prototype.zeros.size();
    bandpass.zeros.insert(bandpass.zeros.end(), degree, ComplexD(0.0, 0.0));
    bandpass.gain = prototype.gain * std::pow(bw, static_cast<double>(degree));
    return bandpass;
}

/// @brief Bilinear transform s -> z at the given sample rate. Zeros at
/// infinity map to z = -1.
[[nodiscard]] inline ZpkDesign bilinearTransform(const ZpkDesign& analog, double sampleRate) {
    const double fs2 = 2.0 * sampleRate;

    ZpkDesign digital;
    ComplexD numerator(1.0, 0.0);
    ComplexD denominator(1.0, 0.0);
    for (const auto& z : analog.zeros) {
        digital.zeros.push_back((fs2 + z) / (fs2 - z));
        numerator *= fs2 - z;
    }
    for (const auto& p : analog.poles) {
        digital.poles.push_back((fs2 + p) / (fs2 - p));
        denominator *= fs2 - p;
    }
    digital.zeros.insert(digital.zeros.end(),
                         analog.poles.size() - analog.zeros.size(),
                         ComplexD(-1.0, 0.0));
    digital.gain = analog.gain * (numerator / denominator).real();
    return digital;
}

/// @brief Group a digital band-pass zpk into second-order sections.
///
/// Pole pairs are taken closest-to-the-unit-circle first and each is matched
/// with the nearest remaining complex zero pair, or with the {+1, -1} zero
/// pair once complex zeros run out. Sections are then reversed so the most
/// resonant one runs last, and the overall gain is applied to the first.
///
/// @return Empty vector if the roots cannot be grouped into real sections.
[[nodiscard]] inline std::vector<SosRow> zpkToSections(const ZpkDesign& digital) {
    struct PolePair {
        ComplexD first;
        ComplexD second;
        double radius;
    };

    std::vector<PolePair> pairs;
    std::vector<ComplexD> realPoles;
    for (const auto& p : digital.poles) {
        if (detail::isReal(p)) {
            realPoles.push_back(ComplexD(p.real(), 0.0));
        } else if (p.imag() > 0.0) {
            pairs.push_back({p, std::conj(p), std::abs(p)});
        }
    }
    if (realPoles.size() % 2 != 0 || pairs.size() * 2 + realPoles.size() != digital.poles.size()) {
        return {};
    }
    std::sort(realPoles.begin(), realPoles.end(),
              [](const ComplexD& a, const ComplexD& b) { return std::abs(a) > std::abs(b); });
    for (size_t i = 0; i < realPoles.size(); i += 2) {
        pairs.push_back({realPoles[i], realPoles[i + 1], std::abs(realPoles[i])});
    }
    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const PolePair& a, const PolePair& b) { return a.radius > b.radius; });

    std::vector<ComplexD> complexZeros;
    size_t realZeros = 0;
    for (const auto& z : digital.zeros) {
        if (detail::isReal(z)) {
            ++realZeros;
        } else if (z.imag() > 0.0) {
            complexZeros.push_back(z);
        }
    }
    if (realZeros % 2 != 0 || complexZeros.size() + realZeros / 2 != pairs.size()) {
        return {};
    }

    std::vector<SosRow> sections;
    sections.reserve(pairs.size());
    for (const auto& pair : pairs) {
        SosRow row{1.0, 0.0, -1.0, 1.0, 0.0, 0.0};
        if (!complexZeros.empty()) {
            auto nearest = std::min_element(
                complexZeros.begin(), complexZeros.end(),
                [&](const ComplexD& a, const ComplexD& b) {
                    return std::abs(a - pair.first) < std::abs(b - pair.first);
                });
            row[1] = -2.0 * nearest->real();
            row[2] = std::norm(*nearest);
            complexZeros.erase(nearest);
        }
        row[4] = -(pair.first + pair.second).real();
        row[5] = (pair.first * pair.second).real();
        sections.push_back(row);
    }

    std::reverse(sections.begin(), sections.end());
    for (size_t i = 0; i < 3; ++i) {
        sections.front()[i] *= digital.gain;
    }
    return sections;
}

/// @brief Complex response of a digital zpk at normalized angular frequency
/// omega (radians/sample).
[[nodiscard]] inline ComplexD zpkResponse(const ZpkDesign& digital, double omega) noexcept {
    const ComplexD z = std::polar(1.0, omega);
    ComplexD response(digital.gain, 0.0);
    for (const auto& zero : digital.zeros) {
        response *= z - zero;
    }
    for (const auto& pole : digital.poles) {
        response /= z - pole;
    }
    return response;
}

// =============================================================================
// Complete Design
// =============================================================================

/// @brief Digital band-pass zpk for the given family and prototype order.
[[nodiscard]] inline ZpkDesign designBandpassZpk(
    FilterFamily family,
    int order,
    double lowcut,
    double highcut,
    double sampleRate,
    double rippleDb,
    double attenuationDb
) {
    ZpkDesign prototype;
    switch (family) {
        case FilterFamily::Butterworth:
            prototype = butterworthPrototype(order);
            break;
        case FilterFamily::Chebyshev1:
            prototype = chebyshev1Prototype(order, rippleDb);
            break;
        case FilterFamily::Elliptic:
            prototype = ellipticPrototype(order, rippleDb, attenuationDb);
            break;
    }

    const double w1 = kTwoPi * prewarpFrequency(lowcut, sampleRate);
    const double w2 = kTwoPi * prewarpFrequency(highcut, sampleRate);
    return bilinearTransform(lowpassToBandpass(prototype, w1, w2), sampleRate);
}

/// @brief Design a band-pass filter as second-order sections.
///
/// Rejects designs with non-finite coefficients or a pole on or outside the
/// unit circle (within kStabilityMargin).
[[nodiscard]] inline BandpassDesign designBandpass(
    FilterFamily family,
    int order,
    double lowcut,
    double highcut,
    double sampleRate,
    double rippleDb = 1.0,
    double attenuationDb = 40.0
) {
    BandpassDesign design;
    auto reject = [&](const char* message) {
        design.sections.clear();
        design.error = DetectorError::Configuration;
        design.message = message;
        return design;
    };

    if (order < 1 || sampleRate <= 0.0 || lowcut <= 0.0 || lowcut >= highcut ||
        highcut >= sampleRate / 2.0) {
        return reject("band edges or order out of range");
    }

    const ZpkDesign digital = designBandpassZpk(
        family, order, lowcut, highcut, sampleRate, rippleDb, attenuationDb);

    for (const auto& p : digital.poles) {
        design.maxPoleRadius = std::max(design.maxPoleRadius, std::abs(p));
    }
    if (!::Phasor::DSP::detail::isFiniteBits(design.maxPoleRadius) ||
        design.maxPoleRadius >= 1.0 - kStabilityMargin) {
        return reject("unstable design: pole on or outside the unit circle");
    }

    design.sections = zpkToSections(digital);
    if (design.sections.size() != static_cast<size_t>(order)) {
        return reject("design could not be factored into second-order sections");
    }
    for (const auto& row : design.sections) {
        for (double c : row) {
            if (!::Phasor::DSP::detail::isFiniteBits(c)) {
                return reject("non-finite filter coefficient");
            }
        }
    }
    return design;
}

} // namespace FilterDesign

} // namespace DSP
} // namespace Phasor
