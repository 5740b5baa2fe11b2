// ==============================================================================
// Layer 0: Core Utility - Detector Configuration
// ==============================================================================
// DetectorConfig aggregate, validation, derived defaults and the string
// mappings used by external configuration loaders.
//
// Architecture:
// - The config is a plain value. A detector copies it in prepare() and never
//   mutates it afterwards.
// - Zero-valued refractoryPeriod / maxSilentInterval mean "derive from the
//   band": use resolveRefractoryPeriod() / resolveMaxSilentInterval().
// - setConfigOption() maps one textual key/value pair onto the config, so a
//   JSON or key=value loader can populate it without the DSP layer owning a
//   file format.
// ==============================================================================

#pragma once

#include <phasor/dsp/core/db_utils.h>
#include <phasor/dsp/core/detector_types.h>
#include <phasor/dsp/core/math_constants.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace Phasor {
namespace DSP {

// =============================================================================
// Limits
// =============================================================================

/// Highest supported prototype order (the band-pass has twice as many poles)
inline constexpr int kMaxFilterOrder = 8;

/// Shortest estimator window
inline constexpr size_t kMinWindowLength = 16;

/// Longest estimator window
inline constexpr size_t kMaxWindowLength = 8192;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Tuning of the phase-mapping estimator.
struct PhaseMappingParams {
    size_t regressionWindow = 50;       ///< Samples in the slope regression
    size_t signWaitCount = 10;          ///< Agreeing slope signs needed for a landmark
    double derivativeThreshold = 0.01;  ///< Minimum |slope| at a landmark
    double defaultSlope = 0.012;        ///< Phase advance (rad/sample) before the first cycle
    double gradientFactor = 1.0;        ///< Scale of the slope derived at troughs
    bool forceReset = false;            ///< Register a landmark after resetThreshold samples
    size_t resetThreshold = 250;        ///< Samples without landmark before a forced one
    bool lockdown = false;              ///< Ignore landmarks for a while after a trough
    size_t lockdownSamples = 50;        ///< Length of the lockdown
    bool compensateDetectionDelay = true; ///< Advance landmark phase by the detection lag
};

/// @brief Complete configuration of one single-channel detector.
struct DetectorConfig {
    double samplingRate = 1500.0;           ///< Hz
    double targetLowcut = 6.0;              ///< Lower band edge, Hz
    double targetHighcut = 9.0;             ///< Upper band edge, Hz
    FilterFamily filterFamily = FilterFamily::Butterworth;
    int filterOrder = 2;                    ///< Prototype order
    double passbandRippleDb = 1.0;          ///< Chebyshev I and elliptic
    double stopbandAttenuationDb = 40.0;    ///< Elliptic
    EstimatorVariant estimatorVariant = EstimatorVariant::EndpointCorrectedHilbert;
    size_t windowLength = 400;              ///< Estimator window, samples
    double targetPhase = kPi;               ///< Radians, [0, 2pi], 0 trough, pi peak
    int64_t refractoryPeriod = 0;           ///< Samples, 0 = half a period at targetHighcut
    size_t estimationInterval = 1;          ///< Samples between phase estimates
    int64_t maxSilentInterval = 0;          ///< Samples, 0 = half a period at targetHighcut
    uint32_t channelId = 0;
    uint32_t actionId = 0;
    bool monitorDeadline = true;            ///< Measure per-block processing time
    PhaseMappingParams phaseMapping;
};

/// @brief Result of validateConfig().
struct ConfigValidation {
    DetectorError error = DetectorError::None;
    const char* message = "";               ///< Static string, never null

    [[nodiscard]] explicit operator bool() const noexcept {
        return error == DetectorError::None;
    }
};

// =============================================================================
// Derived Defaults
// =============================================================================

/// @brief Samples in half a period of the upper band edge (at least 1).
[[nodiscard]] inline int64_t halfPeriodSamples(const DetectorConfig& config) noexcept {
    if (config.targetHighcut <= 0.0 || config.samplingRate <= 0.0) {
        return 1;
    }
    const auto samples = static_cast<int64_t>(
        std::floor(config.samplingRate / (2.0 * config.targetHighcut)));
    return std::max<int64_t>(samples, 1);
}

/// @brief Effective refractory period in samples.
[[nodiscard]] inline int64_t resolveRefractoryPeriod(const DetectorConfig& config) noexcept {
    return config.refractoryPeriod > 0 ? config.refractoryPeriod : halfPeriodSamples(config);
}

/// @brief Effective maximum silent interval in samples.
[[nodiscard]] inline int64_t resolveMaxSilentInterval(const DetectorConfig& config) noexcept {
    if (config.maxSilentInterval > 0) {
        return config.maxSilentInterval;
    }
    return std::max(halfPeriodSamples(config),
                    static_cast<int64_t>(config.estimationInterval));
}

// =============================================================================
// Validation
// =============================================================================

/// @brief Check a configuration for consistency. Filter stability is checked
/// separately when the filter is designed.
[[nodiscard]] inline ConfigValidation validateConfig(const DetectorConfig& config) noexcept {
    auto reject = [](const char* message) {
        return ConfigValidation{DetectorError::Configuration, message};
    };

    if (!detail::isFiniteBits(config.samplingRate) || config.samplingRate <= 0.0) {
        return reject("sampling_rate must be positive and finite");
    }
    if (!detail::isFiniteBits(config.targetLowcut) || !detail::isFiniteBits(config.targetHighcut)) {
        return reject("band edges must be finite");
    }
    if (config.targetLowcut <= 0.0) {
        return reject("target_lowcut must be positive");
    }
    if (config.targetLowcut >= config.targetHighcut) {
        return reject("target_lowcut must be below target_highcut");
    }
    if (config.targetHighcut >= config.samplingRate / 2.0) {
        return reject("target_highcut must be below the Nyquist frequency");
    }
    if (config.filterOrder < 1 || config.filterOrder > kMaxFilterOrder) {
        return reject("filter_order out of range [1, 8]");
    }
    if (config.filterFamily != FilterFamily::Butterworth &&
        !(config.passbandRippleDb > 0.0)) {
        return reject("passband_ripple_db must be positive");
    }
    if (config.filterFamily == FilterFamily::Elliptic &&
        !(config.stopbandAttenuationDb > config.passbandRippleDb)) {
        return reject("stopband_attenuation_db must exceed passband_ripple_db");
    }
    if (config.windowLength < kMinWindowLength || config.windowLength > kMaxWindowLength) {
        return reject("window_length out of range [16, 8192]");
    }
    if (!detail::isFiniteBits(config.targetPhase) ||
        config.targetPhase < 0.0 || config.targetPhase > kTwoPi) {
        return reject("target_phase must lie in [0, 2pi]");
    }
    if (config.refractoryPeriod < 0) {
        return reject("refractory_period must not be negative");
    }
    if (config.estimationInterval < 1 || config.estimationInterval > config.windowLength) {
        return reject("estimation_interval must lie in [1, window_length]");
    }
    if (config.maxSilentInterval < 0) {
        return reject("max_silent_interval must not be negative");
    }
    if (resolveMaxSilentInterval(config) < static_cast<int64_t>(config.estimationInterval)) {
        return reject("max_silent_interval must be at least estimation_interval");
    }

    if (config.estimatorVariant == EstimatorVariant::PhaseMapping) {
        const auto& pm = config.phaseMapping;
        if (pm.regressionWindow < 2 || pm.regressionWindow > config.windowLength) {
            return reject("pm_regression_window must lie in [2, window_length]");
        }
        if (pm.signWaitCount < 1 || pm.signWaitCount > config.windowLength) {
            return reject("pm_sign_wait_count must lie in [1, window_length]");
        }
        if (!(pm.derivativeThreshold >= 0.0) || !detail::isFiniteBits(pm.derivativeThreshold)) {
            return reject("pm_derivative_threshold must be finite and non-negative");
        }
        if (!(pm.defaultSlope > 0.0) || pm.defaultSlope >= kPi) {
            return reject("pm_default_slope must lie in (0, pi)");
        }
        if (!(pm.gradientFactor > 0.0) || !detail::isFiniteBits(pm.gradientFactor)) {
            return reject("pm_gradient_factor must be positive");
        }
        if (pm.forceReset && pm.resetThreshold < 1) {
            return reject("pm_reset_threshold must be positive");
        }
    }

    return {};
}

// =============================================================================
// String Mappings
// =============================================================================

namespace detail {

[[nodiscard]] inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] inline std::optional<double> parseNumber(std::string_view text) {
    const std::string buffer(text);
    if (buffer.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size() || !isFiniteBits(value)) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] inline std::optional<int64_t> parseInteger(std::string_view text) {
    const auto value = parseNumber(text);
    if (!value || *value != std::floor(*value) || std::abs(*value) > 9.0e15) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*value);
}

[[nodiscard]] inline std::optional<bool> parseFlag(std::string_view text) noexcept {
    if (equalsIgnoreCase(text, "true") || equalsIgnoreCase(text, "on") || text == "1") {
        return true;
    }
    if (equalsIgnoreCase(text, "false") || equalsIgnoreCase(text, "off") || text == "0") {
        return false;
    }
    return std::nullopt;
}

} // namespace detail

/// @brief Parse a filter family name (butterworth/butter, chebyshev1/cheby1,
/// elliptic/ellip; case-insensitive).
[[nodiscard]] inline std::optional<FilterFamily> parseFilterFamily(std::string_view name) noexcept {
    using detail::equalsIgnoreCase;
    if (equalsIgnoreCase(name, "butterworth") || equalsIgnoreCase(name, "butter")) {
        return FilterFamily::Butterworth;
    }
    if (equalsIgnoreCase(name, "chebyshev1") || equalsIgnoreCase(name, "cheby1")) {
        return FilterFamily::Chebyshev1;
    }
    if (equalsIgnoreCase(name, "elliptic") || equalsIgnoreCase(name, "ellip")) {
        return FilterFamily::Elliptic;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr const char* filterFamilyName(FilterFamily family) noexcept {
    switch (family) {
        case FilterFamily::Butterworth: return "butterworth";
        case FilterFamily::Chebyshev1:  return "chebyshev1";
        case FilterFamily::Elliptic:    return "elliptic";
    }
    return "unknown";
}

/// @brief Parse an estimator variant name (ecHT, HT, PM; case-insensitive).
[[nodiscard]] inline std::optional<EstimatorVariant> parseEstimatorVariant(
    std::string_view name
) noexcept {
    using detail::equalsIgnoreCase;
    if (equalsIgnoreCase(name, "ecHT")) {
        return EstimatorVariant::EndpointCorrectedHilbert;
    }
    if (equalsIgnoreCase(name, "HT")) {
        return EstimatorVariant::Hilbert;
    }
    if (equalsIgnoreCase(name, "PM")) {
        return EstimatorVariant::PhaseMapping;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr const char* estimatorVariantName(EstimatorVariant variant) noexcept {
    switch (variant) {
        case EstimatorVariant::EndpointCorrectedHilbert: return "ecHT";
        case EstimatorVariant::Hilbert:                  return "HT";
        case EstimatorVariant::PhaseMapping:             return "PM";
    }
    return "unknown";
}

/// @brief Apply one textual option to a config.
/// @return false if the key is unknown or the value does not parse. The
///         config is left untouched in that case.
/// @note Range checks are left to validateConfig().
[[nodiscard]] inline bool setConfigOption(
    DetectorConfig& config,
    std::string_view key,
    std::string_view value
) {
    auto setReal = [&](double& field) {
        const auto parsed = detail::parseNumber(value);
        if (parsed) field = *parsed;
        return parsed.has_value();
    };
    auto setInt64 = [&](int64_t& field) {
        const auto parsed = detail::parseInteger(value);
        if (parsed) field = *parsed;
        return parsed.has_value();
    };
    auto setCount = [&](size_t& field) {
        const auto parsed = detail::parseInteger(value);
        if (!parsed || *parsed < 0) return false;
        field = static_cast<size_t>(*parsed);
        return true;
    };
    auto setId = [&](uint32_t& field) {
        const auto parsed = detail::parseInteger(value);
        if (!parsed || *parsed < 0 || *parsed > 0xFFFFFFFFll) return false;
        field = static_cast<uint32_t>(*parsed);
        return true;
    };
    auto setFlag = [&](bool& field) {
        const auto parsed = detail::parseFlag(value);
        if (parsed) field = *parsed;
        return parsed.has_value();
    };

    auto& pm = config.phaseMapping;

    if (key == "sampling_rate") return setReal(config.samplingRate);
    if (key == "target_lowcut") return setReal(config.targetLowcut);
    if (key == "target_highcut") return setReal(config.targetHighcut);
    if (key == "filter_type") {
        const auto family = parseFilterFamily(value);
        if (family) config.filterFamily = *family;
        return family.has_value();
    }
    if (key == "filter_order") {
        const auto parsed = detail::parseInteger(value);
        if (!parsed || *parsed < 0 || *parsed > 1000) return false;
        config.filterOrder = static_cast<int>(*parsed);
        return true;
    }
    if (key == "estimator_variant") {
        const auto variant = parseEstimatorVariant(value);
        if (variant) config.estimatorVariant = *variant;
        return variant.has_value();
    }
    if (key == "window_length") return setCount(config.windowLength);
    if (key == "target_phase") return setReal(config.targetPhase);
    if (key == "refractory_period") return setInt64(config.refractoryPeriod);
    if (key == "passband_ripple_db") return setReal(config.passbandRippleDb);
    if (key == "stopband_attenuation_db") return setReal(config.stopbandAttenuationDb);
    if (key == "estimation_interval") return setCount(config.estimationInterval);
    if (key == "max_silent_interval") return setInt64(config.maxSilentInterval);
    if (key == "channel_id") return setId(config.channelId);
    if (key == "action_id") return setId(config.actionId);
    if (key == "monitor_deadline") return setFlag(config.monitorDeadline);

    if (key == "pm_regression_window") return setCount(pm.regressionWindow);
    if (key == "pm_sign_wait_count") return setCount(pm.signWaitCount);
    if (key == "pm_derivative_threshold") return setReal(pm.derivativeThreshold);
    if (key == "pm_default_slope") return setReal(pm.defaultSlope);
    if (key == "pm_gradient_factor") return setReal(pm.gradientFactor);
    if (key == "pm_force_reset") return setFlag(pm.forceReset);
    if (key == "pm_reset_threshold") return setCount(pm.resetThreshold);
    if (key == "pm_lockdown") return setFlag(pm.lockdown);
    if (key == "pm_lockdown_samples") return setCount(pm.lockdownSamples);
    if (key == "pm_compensate_delay") return setFlag(pm.compensateDetectionDelay);

    return false;
}

} // namespace DSP
} // namespace Phasor
