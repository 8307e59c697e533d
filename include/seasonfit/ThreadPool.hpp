#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace seasonfit {

/* Fixed set of workers draining a FIFO of tasks.  Queued work is still
 * executed when the pool is destroyed.                                 */
class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    unsigned size() const { return static_cast<unsigned>(workers_.size()); }

private:
    void work(std::stop_token stop);

    std::queue<std::function<void()>> tasks_;
    std::mutex                        mtx_;
    std::condition_variable_any       cv_;
    std::vector<std::jthread>         workers_;     // last: joined first
};

template <class F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>>
{
    using Ret = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<F>(f));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

} // namespace seasonfit
