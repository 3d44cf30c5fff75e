#pragma once

#include <QString>

#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>

namespace sx {

// CorpusLockRegistry: cooperative mutual exclusion keyed by corpus id.
//
// At most one index run holds a given corpus; runs for different corpora
// do not block each other. Holding is expressed by a move-only Guard that
// releases on destruction.
class CorpusLockRegistry {
public:
    class Guard {
    public:
        Guard() = default;
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool ownsLock() const { return m_registry != nullptr; }
        const QString& corpusId() const { return m_corpusId; }

        void release();

    private:
        friend class CorpusLockRegistry;
        Guard(CorpusLockRegistry* registry, QString corpusId);

        CorpusLockRegistry* m_registry = nullptr;
        QString m_corpusId;
    };

    CorpusLockRegistry() = default;

    // Non-copyable, non-movable
    CorpusLockRegistry(const CorpusLockRegistry&) = delete;
    CorpusLockRegistry& operator=(const CorpusLockRegistry&) = delete;

    // Blocks until the corpus is free.
    Guard acquire(const QString& corpusId);

    // Returns nullopt when another run holds the corpus.
    std::optional<Guard> tryAcquire(const QString& corpusId);

    bool isLocked(const QString& corpusId) const;

private:
    void unlock(const QString& corpusId);

    mutable std::mutex m_mutex;
    std::condition_variable m_released;
    std::set<QString> m_held;
};

} // namespace sx
