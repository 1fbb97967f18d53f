// ==============================================================================
// Layer 0: Core Utility - Diagnostic Logging
// ==============================================================================
// printf-style diagnostic logging for the analysis engine.
//
// The numeric kernels do not log; the dispatch layer reports run start,
// completion, cancellation and hard errors. Messages are formatted into a
// fixed-size buffer and handed to the active sink (stderr by default).
// Embedding applications replace the sink to route messages into their own
// log view.
// ==============================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace Scopelab::DSP {

/// @brief Log severity levels
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4
};

/// @brief Short upper-case label for a level ("DEBUG", "WARN", ...).
[[nodiscard]] const char* logLevelLabel(LogLevel level) noexcept;

/// Receives already-formatted messages at or above the active level
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// @brief Set the minimum level that reaches the sink. Default: Warning.
void setLogLevel(LogLevel level) noexcept;

/// @brief Current minimum level.
[[nodiscard]] LogLevel logLevel() noexcept;

/// @brief Replace the sink. An empty function restores the stderr sink.
void setLogSink(LogSink sink);

/// @brief Format and emit a message. Messages longer than 1 KiB are truncated.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void logMessage(LogLevel level, const char* fmt, ...);

} // namespace Scopelab::DSP

#define SCOPELAB_LOG_DEBUG(...) ::Scopelab::DSP::logMessage(::Scopelab::DSP::LogLevel::Debug, __VA_ARGS__)
#define SCOPELAB_LOG_INFO(...) ::Scopelab::DSP::logMessage(::Scopelab::DSP::LogLevel::Info, __VA_ARGS__)
#define SCOPELAB_LOG_WARN(...) ::Scopelab::DSP::logMessage(::Scopelab::DSP::LogLevel::Warning, __VA_ARGS__)
#define SCOPELAB_LOG_ERROR(...) ::Scopelab::DSP::logMessage(::Scopelab::DSP::LogLevel::Error, __VA_ARGS__)
