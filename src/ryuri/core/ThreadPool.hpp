#pragma once

#include "ryuri/core/Exception.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace ryuri {
namespace core {

/**
 * @brief 固定宽度线程池
 *
 * 批处理调度器的执行单元。每个任务是一个无参可调用对象，
 * 结果与异常都经由 future 交还调用方。
 */
class ThreadPool {
public:
    /**
     * @param width 工作线程数，为 0 时取硬件并发数
     */
    explicit ThreadPool(size_t width);

    /**
     * @brief 执行完队列中剩余任务后回收线程
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @throws RyuriException(InternalError) 线程池已停止
     */
    template<class Job>
    std::future<std::invoke_result_t<Job>> enqueue(Job job);

    size_t size() const { return workers_.size(); }

    /**
     * @brief 阻塞到队列为空且没有任务在执行
     */
    void wait_for_all_tasks();

private:
    void worker_loop();
    void push(std::function<void()> task);

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    bool stopping_ = false;
    size_t in_flight_ = 0;
};

template<class Job>
std::future<std::invoke_result_t<Job>> ThreadPool::enqueue(Job job) {
    using R = std::invoke_result_t<Job>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(job));
    std::future<R> result = task->get_future();
    push([task]() { (*task)(); });
    return result;
}

}} // namespace ryuri::core
