#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

namespace sx {

// Shared cancellation flag. Copies observe the same flag, so a token can be
// handed to worker threads while the caller keeps the ability to cancel.
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool isCancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// Per-call limits for provider requests.
struct CallContext {
    CancellationToken token;
    // Absolute deadline in steady-clock milliseconds; 0 means none.
    int64_t deadlineMs = 0;

    static int64_t nowMs();
    static CallContext withTimeout(int timeoutMs, CancellationToken token = {});

    bool expired() const;
    bool shouldStop() const;
    // Milliseconds left until the deadline, or fallbackMs when there is none.
    int remainingMs(int fallbackMs) const;
};

} // namespace sx
