// =============================================================================
// Detector Testbench - Main Entry Point
// =============================================================================
// Offline replay of a recorded or synthetic signal through one phase detector.
//
// Usage:
//   detector_testbench [options] [key=value ...]
//
// Options:
//   --config <file>   Read key=value detector options, one per line
//   --input <file>    Read samples, one per line
//   --sine <hz>       Generate a unit cosine at <hz> instead of reading a file
//   --duration <s>    Length of the generated signal (default 10 s)
//   --noise <amp>     Add uniform noise of this amplitude to the sinusoid
//   --block <n>       Samples per delivered block (default 32)
//   --log <level>     off, error, warning, info or debug (default warning)
//
// Command-line key=value options override the ones read from --config.
// Exit codes: 0 success, 1 usage, 2 configuration error, 3 numerical fault.
// =============================================================================

#include "signal_source.h"
#include "trigger_logger.h"

#include <phasor/dsp/core/detector_config.h>
#include <phasor/dsp/core/logging.h>
#include <phasor/dsp/systems/phase_detector.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using namespace Phasor::DSP;

constexpr int kExitUsage = 1;
constexpr int kExitConfiguration = 2;
constexpr int kExitFault = 3;

struct Options {
    std::string configPath;
    std::string inputPath;
    std::optional<double> sineFrequency;
    double duration = 10.0;
    double noise = 0.0;
    size_t blockSize = 32;
    LogLevel logLevel = LogLevel::Warning;
    std::vector<std::string> assignments;
};

void printUsage() {
    std::fprintf(stderr,
        "usage: detector_testbench [--config <file>] (--input <file> | --sine <hz>)\n"
        "                          [--duration <s>] [--noise <amp>] [--block <n>]\n"
        "                          [--log <level>] [key=value ...]\n");
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "off") return LogLevel::Off;
    if (name == "error") return LogLevel::Error;
    if (name == "warning") return LogLevel::Warning;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> const char* {
            return (i + 1 < argc) ? argv[++i] : nullptr;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--config" || arg == "--input" || arg == "--sine" || arg == "--duration" ||
            arg == "--noise" || arg == "--block" || arg == "--log") {
            const char* text = value();
            if (text == nullptr) {
                std::fprintf(stderr, "error: %s needs a value\n", argv[i]);
                return false;
            }
            if (arg == "--config") {
                options.configPath = text;
            } else if (arg == "--input") {
                options.inputPath = text;
            } else if (arg == "--log") {
                const auto level = parseLogLevel(text);
                if (!level) {
                    std::fprintf(stderr, "error: unknown log level '%s'\n", text);
                    return false;
                }
                options.logLevel = *level;
            } else {
                const auto number = detail::parseNumber(text);
                const bool allowZero = (arg == "--noise");
                if (!number || *number < 0.0 || (*number == 0.0 && !allowZero)) {
                    std::fprintf(stderr, "error: bad value '%s' for %s\n", text, argv[i - 1]);
                    return false;
                }
                if (arg == "--sine") options.sineFrequency = *number;
                else if (arg == "--duration") options.duration = *number;
                else if (arg == "--noise") options.noise = *number;
                else options.blockSize = static_cast<size_t>(*number);
            }
            continue;
        }
        if (arg.find('=') != std::string_view::npos) {
            options.assignments.emplace_back(arg);
            continue;
        }
        std::fprintf(stderr, "error: unexpected argument '%s'\n", argv[i]);
        return false;
    }

    if (options.inputPath.empty() == !options.sineFrequency.has_value()) {
        std::fprintf(stderr, "error: give exactly one of --input and --sine\n");
        return false;
    }
    if (options.blockSize == 0) {
        std::fprintf(stderr, "error: --block must be at least 1\n");
        return false;
    }
    return true;
}

// Apply one "key=value" line. Surrounding whitespace is ignored.
bool applyAssignment(DetectorConfig& config, std::string_view line, const std::string& origin) {
    const auto trim = [](std::string_view text) {
        const auto first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return std::string_view{};
        const auto last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    };

    const auto equals = line.find('=');
    if (equals == std::string_view::npos) {
        std::fprintf(stderr, "%s: expected key=value\n", origin.c_str());
        return false;
    }
    const auto key = trim(line.substr(0, equals));
    const auto value = trim(line.substr(equals + 1));
    if (!setConfigOption(config, key, value)) {
        std::fprintf(stderr, "%s: bad option '%.*s'\n", origin.c_str(),
            static_cast<int>(line.size()), line.data());
        return false;
    }
    return true;
}

bool loadConfigFile(DetectorConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::fprintf(stderr, "error: cannot open %s\n", path.c_str());
        return false;
    }
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        if (!applyAssignment(config, line, path + ":" + std::to_string(lineNumber))) {
            return false;
        }
    }
    return true;
}

void printConfig(const DetectorConfig& config, const PhaseDetector& detector) {
    std::printf("# %s order %d, band %.2f-%.2f Hz at %.1f Hz\n",
        filterFamilyName(config.filterFamily), config.filterOrder,
        config.targetLowcut, config.targetHighcut, config.samplingRate);
    std::printf("# %s window %zu, hop %zu, target %.4f rad, refractory %lld, max silent %lld\n",
        estimatorVariantName(config.estimatorVariant), config.windowLength,
        config.estimationInterval, config.targetPhase,
        static_cast<long long>(detector.refractoryPeriod()),
        static_cast<long long>(detector.maxSilentInterval()));
}

} // namespace

// =============================================================================
// Application Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return kExitUsage;
    }
    setLogLevel(options.logLevel);

    DetectorConfig config;
    if (!options.configPath.empty() && !loadConfigFile(config, options.configPath)) {
        return kExitConfiguration;
    }
    for (const auto& assignment : options.assignments) {
        if (!applyAssignment(config, assignment, "argument")) {
            return kExitConfiguration;
        }
    }

    PhaseDetector detector;
    if (const auto error = detector.prepare(config); error != DetectorError::None) {
        const auto validation = validateConfig(config);
        std::fprintf(stderr, "error: %s: %s\n", detectorErrorName(error),
            validation.message[0] != '\0' ? validation.message : "filter or estimator setup failed");
        return kExitConfiguration;
    }

    std::vector<float> samples;
    if (options.sineFrequency) {
        const auto count = static_cast<size_t>(options.duration * config.samplingRate);
        samples = Testbench::makeSinusoid(*options.sineFrequency, config.samplingRate, count,
                                          options.noise);
    } else {
        std::string error;
        if (!Testbench::loadSampleFile(options.inputPath, samples, error)) {
            std::fprintf(stderr, "error: %s\n", error.c_str());
            return kExitUsage;
        }
    }

    printConfig(config, detector);

    Testbench::BufferedSource source(std::move(samples), config.samplingRate, options.blockSize);
    Testbench::TriggerLogger logger(config.samplingRate);

    const auto error = detector.run(source, logger);

    std::printf("# samples %zu, triggers %llu, mean spacing %.2f samples\n",
        source.size(), static_cast<unsigned long long>(logger.count()), logger.meanSpacing());
    std::printf("# discontinuities %llu, overruns %llu, cycles %lld, state %s\n",
        static_cast<unsigned long long>(detector.discontinuityCount()),
        static_cast<unsigned long long>(detector.overrunCount()),
        static_cast<long long>(detector.cycleCount()),
        detectorStateName(detector.state()));

    if (error == DetectorError::Configuration) {
        std::fprintf(stderr, "error: %s\n", detectorErrorName(error));
        return kExitConfiguration;
    }
    if (error == DetectorError::NumericalFault || detector.state() == DetectorState::Faulted) {
        std::fprintf(stderr, "error: %s\n", detectorErrorName(DetectorError::NumericalFault));
        return kExitFault;
    }
    return EXIT_SUCCESS;
}
