#include "core/indexing/corpus_lock.h"

namespace sx {

// ── Guard ───────────────────────────────────────────────────

CorpusLockRegistry::Guard::Guard(CorpusLockRegistry* registry, QString corpusId)
    : m_registry(registry)
    , m_corpusId(std::move(corpusId))
{
}

CorpusLockRegistry::Guard::~Guard()
{
    release();
}

CorpusLockRegistry::Guard::Guard(Guard&& other) noexcept
    : m_registry(other.m_registry)
    , m_corpusId(std::move(other.m_corpusId))
{
    other.m_registry = nullptr;
}

CorpusLockRegistry::Guard& CorpusLockRegistry::Guard::operator=(Guard&& other) noexcept
{
    if (this != &other) {
        release();
        m_registry = other.m_registry;
        m_corpusId = std::move(other.m_corpusId);
        other.m_registry = nullptr;
    }
    return *this;
}

void CorpusLockRegistry::Guard::release()
{
    if (m_registry) {
        m_registry->unlock(m_corpusId);
        m_registry = nullptr;
    }
}

// ── Registry ────────────────────────────────────────────────

CorpusLockRegistry::Guard CorpusLockRegistry::acquire(const QString& corpusId)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_released.wait(lock, [this, &corpusId]() { return m_held.count(corpusId) == 0; });
    m_held.insert(corpusId);
    return Guard(this, corpusId);
}

std::optional<CorpusLockRegistry::Guard> CorpusLockRegistry::tryAcquire(const QString& corpusId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_held.count(corpusId) > 0) {
        return std::nullopt;
    }
    m_held.insert(corpusId);
    return Guard(this, corpusId);
}

bool CorpusLockRegistry::isLocked(const QString& corpusId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_held.count(corpusId) > 0;
}

void CorpusLockRegistry::unlock(const QString& corpusId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held.erase(corpusId);
    }
    m_released.notify_all();
}

} // namespace sx
