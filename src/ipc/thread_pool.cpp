#include <bsplink/ipc/thread_pool.h>

#include <spdlog/spdlog.h>

namespace bsplink::ipc {

ThreadPool::ThreadPool(std::string name, std::size_t threads)
    : name_(std::move(name)), size_(threads == 0 ? 1 : threads) {
    threads_.reserve(size_);
    for (std::size_t i = 0; i < size_; ++i) {
        threads_.emplace_back([this] { run(); });
    }
    spdlog::debug("ThreadPool '{}' started with {} threads", name_, size_);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
    return true;
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    wake_.notify_all();
    // Queued tasks still run before the threads exit
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void ThreadPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stopped_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("ThreadPool '{}': task threw: {}", name_, e.what());
        }
    }
}

} // namespace bsplink::ipc
