#include "core/embedding/provider_executor.h"

#include <algorithm>

namespace sx {

ProviderExecutor::ProviderExecutor(int liveWorkers, int bulkWorkers)
{
    start(m_live, std::max(liveWorkers, 1));
    start(m_bulk, std::max(bulkWorkers, 1));
}

ProviderExecutor::~ProviderExecutor()
{
    stop(m_live);
    stop(m_bulk);
}

void ProviderExecutor::start(Pool& pool, int workers)
{
    pool.workerCount = workers;
    pool.threads.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        pool.threads.emplace_back([&pool]() { workerLoop(pool); });
    }
}

void ProviderExecutor::stop(Pool& pool)
{
    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        pool.stop = true;
    }
    pool.cv.notify_all();

    for (auto& thread : pool.threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    pool.threads.clear();
}

void ProviderExecutor::enqueue(Lane lane, std::function<void()> job)
{
    Pool& pool = lane == Lane::Live ? m_live : m_bulk;
    {
        std::lock_guard<std::mutex> lock(pool.mutex);
        pool.queue.push_back(std::move(job));
    }
    pool.cv.notify_one();
}

void ProviderExecutor::workerLoop(Pool& pool)
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(pool.mutex);
            pool.cv.wait(lock, [&pool]() { return pool.stop || !pool.queue.empty(); });
            // Drain what is queued so no future is left without a value.
            if (pool.stop && pool.queue.empty()) {
                return;
            }
            job = std::move(pool.queue.front());
            pool.queue.pop_front();
        }
        job();
    }
}

} // namespace sx
