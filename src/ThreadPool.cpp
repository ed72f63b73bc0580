#include "ramancal/ThreadPool.hpp"
#include <algorithm>

namespace ramancal {

unsigned resolve_thread_count(unsigned requested)
{
    if (requested == 0) requested = std::thread::hardware_concurrency();
    return std::max(1u, requested);
}

ThreadPool::ThreadPool(unsigned nthreads)
{
    nthreads = resolve_thread_count(nthreads);
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

} // namespace ramancal
