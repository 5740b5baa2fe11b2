// ==============================================================================
// Layer 0: Core Utilities - Logging Tests
// ==============================================================================
// Tests for: dsp/include/phasor/dsp/core/logging.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <phasor/dsp/core/logging.h>

#include <string>
#include <vector>

using namespace Phasor::DSP;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string text;
};

std::vector<CapturedMessage>& captured() {
    static std::vector<CapturedMessage> messages;
    return messages;
}

void captureSink(LogLevel level, const char* message) {
    captured().push_back({level, message});
}

/// Installs the capture sink for one test and restores the defaults after.
struct ScopedCapture {
    explicit ScopedCapture(LogLevel level) : previous_(getLogLevel()) {
        captured().clear();
        setLogLevel(level);
        setLogSink(&captureSink);
    }
    ~ScopedCapture() {
        setLogSink(nullptr);
        setLogLevel(previous_);
    }
    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

private:
    LogLevel previous_;
};

} // namespace

TEST_CASE("Default log level is Warning", "[core][logging]") {
    REQUIRE(getLogLevel() == LogLevel::Warning);
}

TEST_CASE("Messages below the minimum level are dropped", "[core][logging]") {
    ScopedCapture capture(LogLevel::Warning);

    logMessage(LogLevel::Error, "error %d", 1);
    logMessage(LogLevel::Warning, "warning %d", 2);
    logMessage(LogLevel::Info, "info %d", 3);
    logMessage(LogLevel::Debug, "debug %d", 4);

    REQUIRE(captured().size() == 2);
    REQUIRE(captured()[0].level == LogLevel::Error);
    REQUIRE(captured()[0].text == "error 1");
    REQUIRE(captured()[1].level == LogLevel::Warning);
    REQUIRE(captured()[1].text == "warning 2");
}

TEST_CASE("Debug level passes everything", "[core][logging]") {
    ScopedCapture capture(LogLevel::Debug);

    REQUIRE(isLogEnabled(LogLevel::Debug));
    logMessage(LogLevel::Debug, "trigger at %lld, phase %.2f rad", 328LL, 0.05);

    REQUIRE(captured().size() == 1);
    REQUIRE(captured()[0].text == "trigger at 328, phase 0.05 rad");
}

TEST_CASE("Off suppresses all messages", "[core][logging]") {
    ScopedCapture capture(LogLevel::Off);

    REQUIRE_FALSE(isLogEnabled(LogLevel::Error));
    logMessage(LogLevel::Error, "dropped");
    REQUIRE(captured().empty());
}

TEST_CASE("Long messages are truncated to the buffer size", "[core][logging]") {
    ScopedCapture capture(LogLevel::Info);

    const std::string longText(kMaxLogMessageLength * 2, 'x');
    logMessage(LogLevel::Info, "%s", longText.c_str());

    REQUIRE(captured().size() == 1);
    REQUIRE(captured()[0].text.size() == kMaxLogMessageLength - 1);
}
