#include "seasonfit/ThreadPool.hpp"

namespace seasonfit {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i)
        workers_.emplace_back([this](std::stop_token st) { work(st); });
}

ThreadPool::~ThreadPool()
{
    for (auto& t : workers_) t.request_stop();
    cv_.notify_all();
    workers_.clear();                    // jthread joins
}

void ThreadPool::work(std::stop_token stop)
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lk(mtx_);
            /* false only once a stop was requested and the queue is dry */
            if (!cv_.wait(lk, stop, [this] { return !tasks_.empty(); }))
                return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace seasonfit
