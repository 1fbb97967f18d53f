// ==============================================================================
// Layer 0: Core Utility - Analysis Error Taxonomy
// ==============================================================================
// Hard failures surfaced to callers. Numeric degeneracy is never an error
// (see numeric_guards.h) and cancellation is a normal return, so only the
// kinds below are ever thrown by the library.
// ==============================================================================

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Scopelab::DSP {

/// @brief Distinguishable failure kinds so callers can branch on the cause.
enum class ErrorKind : uint8_t {
    InvalidArgument = 0,      ///< Bad window tag, fs, segment or threshold parameter
    EmptySignal = 1,          ///< No samples supplied
    InsufficientSamples = 2,  ///< Too few samples for the requested segmentation
    ChannelMismatch = 3,      ///< Two-channel method given unequal or missing channels
    TemplateNotFound = 4,     ///< Matched-filter template path missing or unreadable
    EmptyTemplate = 5         ///< Matched-filter template holds no samples
};

/// @brief Stable display name for an error kind.
[[nodiscard]] constexpr const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidArgument:     return "InvalidArgument";
        case ErrorKind::EmptySignal:         return "EmptySignal";
        case ErrorKind::InsufficientSamples: return "InsufficientSamples";
        case ErrorKind::ChannelMismatch:     return "ChannelMismatch";
        case ErrorKind::TemplateNotFound:    return "TemplateNotFound";
        case ErrorKind::EmptyTemplate:       return "EmptyTemplate";
    }
    return "Unknown";
}

/// @brief Exception thrown for every hard analysis failure.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// @brief Throw an AnalysisError of kind InvalidArgument.
[[noreturn]] inline void throwInvalidArgument(const std::string& message) {
    throw AnalysisError(ErrorKind::InvalidArgument, message);
}

} // namespace Scopelab::DSP
