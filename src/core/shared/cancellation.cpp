#include "core/shared/cancellation.h"

#include <algorithm>
#include <chrono>

namespace sx {

CancellationToken::CancellationToken()
    : m_flag(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationToken::cancel()
{
    m_flag->store(true);
}

bool CancellationToken::isCancelled() const
{
    return m_flag->load();
}

int64_t CallContext::nowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

CallContext CallContext::withTimeout(int timeoutMs, CancellationToken token)
{
    CallContext context;
    context.token = std::move(token);
    if (timeoutMs > 0) {
        context.deadlineMs = nowMs() + timeoutMs;
    }
    return context;
}

bool CallContext::expired() const
{
    return deadlineMs > 0 && nowMs() >= deadlineMs;
}

bool CallContext::shouldStop() const
{
    return token.isCancelled() || expired();
}

int CallContext::remainingMs(int fallbackMs) const
{
    if (deadlineMs <= 0) {
        return fallbackMs;
    }
    const int64_t left = deadlineMs - nowMs();
    return static_cast<int>(std::max<int64_t>(left, 0));
}

} // namespace sx
