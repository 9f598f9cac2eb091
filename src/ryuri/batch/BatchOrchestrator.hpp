#pragma once

#include "ryuri/RyuriCore.hpp"
#include "ryuri/config/ResolvedConfig.hpp"
#include "ryuri/core/ErrorCode.hpp"
#include "ryuri/core/Expected.hpp"
#include "ryuri/core/Path.hpp"
#include "ryuri/filter/FilterChain.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ryuri {
namespace batch {

using JobId = size_t;

enum class JobKind {
    Pipeline,   // 运行过滤器链
    Protect,    // 内容保护
    Unprotect   // 解除保护
};

const char* toString(JobKind kind) noexcept;

/**
 * @brief 一个批处理任务：读入、变换、导出
 */
struct BatchJob {
    core::Path input;
    core::Path output;
    JobKind kind = JobKind::Pipeline;

    // 未设置时使用配置中的过滤器链
    std::optional<std::vector<filter::FilterSpec>> filters;

    // Protect / Unprotect 的密钥
    std::string key;

    ExportFormat format = ExportFormat::Archive;

    // 未设置时不限时
    std::optional<std::chrono::milliseconds> timeout;
};

struct BatchResult {
    JobId id = 0;
    core::Path input;
    bool success = false;
    std::optional<core::Error> error;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief 批处理调度器
 *
 * 每个任务在一个工作线程上完整执行，拥有独立的存储与文档缓存。
 * 任务开始前可以取消；超时在过滤器之间和导出前检查，超时的任务不导出。
 */
class BatchOrchestrator {
public:
    explicit BatchOrchestrator(size_t width = 4);

    /**
     * @brief 宽度取 config.threads()
     */
    explicit BatchOrchestrator(const config::ResolvedConfig& config);

    BatchOrchestrator(size_t width, const config::ResolvedConfig& config);

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    JobId submit(BatchJob job);

    /**
     * @brief 取消尚未开始的任务
     * @return 任务存在且尚未开始时返回 true
     */
    bool cancel(JobId id);

    /**
     * @brief 执行全部已提交任务，按提交顺序返回结果
     */
    std::vector<BatchResult> runAll();

    size_t width() const { return width_; }
    size_t pendingCount() const;

    const config::ResolvedConfig& config() const { return config_; }

private:
    enum class JobState {
        Pending,
        Running,
        Cancelled,
        Finished
    };

    struct Slot {
        JobId id;
        BatchJob job;
        JobState state = JobState::Pending;
    };

    /**
     * @brief 工作线程入口：检查取消状态后执行任务
     */
    BatchResult runSlot(size_t index);

    core::VoidResult execute(const BatchJob& job, std::optional<filter::Deadline> deadline) const;
    core::VoidResult transform(const BatchJob& job, store::PackageStore& store, cache::DocumentCache& cache,
                               std::optional<filter::Deadline> deadline) const;

    size_t width_;
    config::ResolvedConfig config_;

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    JobId next_id_ = 1;
};

}} // namespace ryuri::batch
