#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <bsplink/core/format.h>

namespace bsplink::ipc {

/**
 * Named set of worker threads draining one FIFO queue.
 *
 * The server keeps a "requests" pool for queries and lifecycle requests and a separate
 * "compiles" pool so a long compile never holds the threads that answer them. The client
 * decodes analysis files on its own "analysis" pool, off the connection strand.
 *
 * stop() refuses new work, runs what is already queued and joins the threads.
 */
class ThreadPool {
public:
    ThreadPool(std::string name, std::size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false when the pool has been stopped and the task was dropped
    bool post(std::function<void()> task);

    // Throws std::runtime_error when the pool has been stopped
    template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<F>>;

    void stop();

    const std::string& name() const noexcept { return name_; }
    std::size_t size() const noexcept { return size_; }

private:
    void run();

    std::string name_;
    std::size_t size_{0};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> tasks_;
    bool stopped_{false};
    std::vector<std::jthread> threads_;
};

template <typename F> auto ThreadPool::submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    // std::function needs a copyable target
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto result = task->get_future();
    if (!post([task] { (*task)(); })) {
        throw std::runtime_error(bsplink::format("{} pool is stopped", name_));
    }
    return result;
}

} // namespace bsplink::ipc
