// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Minimal leveled logging for detector diagnostics.
//
// - Messages are formatted with vsnprintf into a fixed stack buffer, so a
//   filtered-out or emitted message never allocates.
// - Messages below the process-wide minimum level return before formatting.
//   The default level is Warning, which keeps per-trigger Debug output off the
//   processing path unless explicitly requested.
// - Without an installed sink, output goes to stderr (and to the debugger
//   output on Windows).
// - Defining PHASOR_DISABLE_LOGGING compiles every logMessage() call to a
//   no-op.
// ==============================================================================

#pragma once

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Phasor {
namespace DSP {

/// @brief Message severity. A message is emitted when its level is at or
/// below the minimum level (Off suppresses everything).
enum class LogLevel : uint8_t {
    Off = 0,
    Error,
    Warning,
    Info,
    Debug
};

/// @brief Receives fully formatted messages (no trailing newline).
using LogSink = void (*)(LogLevel level, const char* message);

/// Maximum formatted message length, longer messages are truncated
inline constexpr size_t kMaxLogMessageLength = 512;

namespace detail {

inline std::atomic<LogLevel> gLogLevel{LogLevel::Warning};
inline std::atomic<LogSink> gLogSink{nullptr};

[[nodiscard]] constexpr const char* logLevelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return "E";
        case LogLevel::Warning: return "W";
        case LogLevel::Info:    return "I";
        case LogLevel::Debug:   return "D";
        case LogLevel::Off:     break;
    }
    return "-";
}

} // namespace detail

/// @brief Set the process-wide minimum level.
inline void setLogLevel(LogLevel level) noexcept {
    detail::gLogLevel.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline LogLevel getLogLevel() noexcept {
    return detail::gLogLevel.load(std::memory_order_relaxed);
}

/// @brief Install a sink, or restore the default stderr output with nullptr.
inline void setLogSink(LogSink sink) noexcept {
    detail::gLogSink.store(sink, std::memory_order_release);
}

/// @brief True when a message of this level would be emitted.
[[nodiscard]] inline bool isLogEnabled(LogLevel level) noexcept {
#ifdef PHASOR_DISABLE_LOGGING
    (void)level;
    return false;
#else
    const LogLevel minimum = getLogLevel();
    return level != LogLevel::Off && minimum != LogLevel::Off &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(minimum);
#endif
}

/// @brief Format and emit one message (printf-style).
inline void logMessage(LogLevel level, const char* fmt, ...) noexcept {
    if (!isLogEnabled(level)) {
        return;
    }

    char buf[kMaxLogMessageLength];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    if (LogSink sink = detail::gLogSink.load(std::memory_order_acquire)) {
        sink(level, buf);
        return;
    }

    char line[kMaxLogMessageLength + 16];
    std::snprintf(line, sizeof(line), "[PHASOR][%s] %s\n", detail::logLevelTag(level), buf);
#ifdef _WIN32
    OutputDebugStringA(line);
#endif
    std::fputs(line, stderr);
}

} // namespace DSP
} // namespace Phasor
