#include "core/embedding/retry_policy.h"

#include <QRandomGenerator>
#include <QThread>

#include <algorithm>

namespace sx {

namespace {

constexpr int kWaitSliceMs = 25;

} // anonymous namespace

int RetryPolicy::delayForAttempt(int attempt) const
{
    const int cap = std::max(0, maxDelayMs);
    if (attempt <= 0 || cap == 0) {
        return 0;
    }

    int delay = std::max(1, baseDelayMs);
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay = std::min(delay * 2, cap);
    }
    delay = std::min(delay, cap);

    const int jitter = QRandomGenerator::global()->bounded(std::max(1, delay / 4 + 1));
    return std::min(delay + jitter, cap);
}

bool waitForRetry(int delayMs, const CallContext& context)
{
    int remaining = delayMs;
    while (remaining > 0) {
        if (context.shouldStop()) {
            return false;
        }
        const int slice = std::min(remaining, kWaitSliceMs);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
    return !context.shouldStop();
}

} // namespace sx
