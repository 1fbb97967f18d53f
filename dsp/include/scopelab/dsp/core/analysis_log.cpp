// ==============================================================================
// Layer 0: Core Utility - Diagnostic Logging (implementation)
// ==============================================================================

#include <scopelab/dsp/core/analysis_log.h>

#include <algorithm>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace Scopelab::DSP {

namespace {

std::atomic<LogLevel> gLevel{LogLevel::Warning};
std::mutex gSinkMutex;
LogSink gSink;

void writeToStderr(LogLevel level, std::string_view message) {
    std::fprintf(stderr, "[scopelab][%s] %.*s\n", logLevelLabel(level),
                 static_cast<int>(message.size()), message.data());
}

} // anonymous namespace

const char* logLevelLabel(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

void setLogLevel(LogLevel level) noexcept {
    gLevel.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() noexcept {
    return gLevel.load(std::memory_order_relaxed);
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(gSinkMutex);
    gSink = std::move(sink);
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (level < logLevel() || fmt == nullptr) return;

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    const int written = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (written < 0) return;

    const std::size_t length = std::min(static_cast<std::size_t>(written), sizeof(buf) - 1);

    // Call outside the lock so a sink may log or replace itself
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(gSinkMutex);
        sink = gSink;
    }
    if (sink) {
        sink(level, std::string_view(buf, length));
    } else {
        writeToStderr(level, std::string_view(buf, length));
    }
}

} // namespace Scopelab::DSP
