#pragma once

#include "core/shared/cancellation.h"

namespace sx {

// Bounded exponential backoff for transient provider failures.
struct RetryPolicy {
    int maxAttempts = 4;
    int baseDelayMs = 250;
    int maxDelayMs = 8000;

    // Delay before retry number `attempt` (1 = first retry): base * 2^(attempt-1)
    // plus up to 25% jitter, capped at maxDelayMs.
    int delayForAttempt(int attempt) const;
};

// Sleeps for delayMs in short slices. Returns false as soon as the context is
// cancelled or its deadline passes.
bool waitForRetry(int delayMs, const CallContext& context);

} // namespace sx
