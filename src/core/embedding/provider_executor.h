#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sx {

// Runs provider calls on worker threads. Search calls go to a live lane with
// its own workers so a bulk index run never queues ahead of a query; the
// bulk workers bound how many embedding batches are in flight at once.
// Callers wait on the returned future (with a timeout on the search path).
class ProviderExecutor {
public:
    enum class Lane {
        Live,
        Bulk,
    };

    ProviderExecutor(int liveWorkers, int bulkWorkers);
    ~ProviderExecutor();

    ProviderExecutor(const ProviderExecutor&) = delete;
    ProviderExecutor& operator=(const ProviderExecutor&) = delete;

    template <typename Fn>
    auto submit(Lane lane, Fn&& fn) -> std::future<decltype(fn())>
    {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        enqueue(lane, [task]() { (*task)(); });
        return future;
    }

    int liveWorkers() const { return m_live.workerCount; }
    int bulkWorkers() const { return m_bulk.workerCount; }

private:
    struct Pool {
        int workerCount = 0;
        std::vector<std::thread> threads;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> queue;
        bool stop = false;
    };

    void start(Pool& pool, int workers);
    void stop(Pool& pool);
    void enqueue(Lane lane, std::function<void()> job);
    static void workerLoop(Pool& pool);

    Pool m_live;
    Pool m_bulk;
};

} // namespace sx
