// ==============================================================================
// Layer 0: Core Utility - Cooperative Cancellation
// ==============================================================================
// The caller owns an std::atomic<bool> and passes a pointer to it. Segment and
// frame loops poll it between iterations; a null pointer means the
// computation cannot be cancelled.
// ==============================================================================

#pragma once

#include <atomic>

namespace Scopelab::DSP {

/// Cancellation flag handle (may be null)
using CancelFlag = const std::atomic<bool>*;

/// @brief True once the caller has requested cancellation.
[[nodiscard]] inline bool isCancelled(CancelFlag flag) noexcept {
    return flag != nullptr && flag->load(std::memory_order_relaxed);
}

/// Warning text attached to results that stopped early
inline constexpr const char* kCancelledWarning = "analysis cancelled";

} // namespace Scopelab::DSP
