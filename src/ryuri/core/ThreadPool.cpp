#include "ryuri/core/ThreadPool.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"

namespace ryuri {
namespace core {

ThreadPool::ThreadPool(size_t width) {
    if (width == 0) {
        width = std::thread::hardware_concurrency();
        if (width == 0) width = 4;
    }
    workers_.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    CORE_DEBUG("ThreadPool started {} workers", workers_.size());
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    CORE_DEBUG("ThreadPool joined {} workers", workers_.size());
}

void ThreadPool::push(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw RyuriException("enqueue on stopped ThreadPool", ErrorCode::InternalError, __FILE__, __LINE__);
        }
        queue_.push_back(std::move(task));
        ++in_flight_;
    }
    work_available_.notify_one();
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // 任务异常由 packaged_task 存入 future
        task();

        std::lock_guard<std::mutex> lock(mutex_);
        if (--in_flight_ == 0) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::wait_for_all_tasks() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return in_flight_ == 0; });
}

}} // namespace ryuri::core
