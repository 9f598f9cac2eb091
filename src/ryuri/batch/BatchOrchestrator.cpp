#include "ryuri/batch/BatchOrchestrator.hpp"
#include "ryuri/cache/DocumentCache.hpp"
#include "ryuri/core/ExceptionBridge.hpp"
#include "ryuri/core/ThreadPool.hpp"
#include "ryuri/protect/ProtectionCodec.hpp"
#include "ryuri/utils/ModuleLoggers.hpp"
#include <future>

namespace ryuri {
namespace batch {

using Clock = std::chrono::steady_clock;

const char* toString(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::Pipeline:  return "pipeline";
        case JobKind::Protect:   return "protect";
        case JobKind::Unprotect: return "unprotect";
    }
    return "pipeline";
}

BatchOrchestrator::BatchOrchestrator(size_t width)
    : BatchOrchestrator(width, core::ExceptionBridge::unwrap(config::resolveDefaultConfig())) {
}

BatchOrchestrator::BatchOrchestrator(const config::ResolvedConfig& config)
    : BatchOrchestrator(config.threads(), config) {
}

BatchOrchestrator::BatchOrchestrator(size_t width, const config::ResolvedConfig& config)
    : width_(width == 0 ? 1 : width), config_(config) {
}

JobId BatchOrchestrator::submit(BatchJob job) {
    std::lock_guard<std::mutex> lock(mutex_);
    const JobId id = next_id_++;
    BATCH_DEBUG("Submitted job {} ({}, {})", id, toString(job.kind), job.input.string());
    slots_.push_back(Slot{id, std::move(job), JobState::Pending});
    return id;
}

bool BatchOrchestrator::cancel(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
        if (slot.id == id) {
            if (slot.state != JobState::Pending) {
                return false;
            }
            slot.state = JobState::Cancelled;
            BATCH_INFO("Cancelled job {}", id);
            return true;
        }
    }
    return false;
}

size_t BatchOrchestrator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& slot : slots_) {
        if (slot.state == JobState::Pending) {
            ++count;
        }
    }
    return count;
}

std::vector<BatchResult> BatchOrchestrator::runAll() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = slots_.size();
    }
    if (count == 0) {
        return {};
    }

    BATCH_INFO("Running {} jobs on {} workers", count, width_);
    std::vector<std::future<BatchResult>> futures;
    futures.reserve(count);
    {
        core::ThreadPool pool(width_);
        for (size_t i = 0; i < count; ++i) {
            futures.push_back(pool.enqueue([this, i]() { return runSlot(i); }));
        }
        pool.wait_for_all_tasks();
    }

    std::vector<BatchResult> results;
    results.reserve(count);
    for (auto& future : futures) {
        results.push_back(future.get());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.erase(slots_.begin(), slots_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    size_t failed = 0;
    for (const auto& result : results) {
        if (!result.success) {
            ++failed;
        }
    }
    BATCH_INFO("Batch finished: {} succeeded, {} failed", results.size() - failed, failed);
    return results;
}

BatchResult BatchOrchestrator::runSlot(size_t index) {
    BatchJob job;
    BatchResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Slot& slot = slots_[index];
        result.id = slot.id;
        result.input = slot.job.input;
        if (slot.state == JobState::Cancelled) {
            result.error = core::makeError(core::ErrorCode::Cancelled, "Job cancelled before start",
                                           slot.job.input.string());
            return result;
        }
        slot.state = JobState::Running;
        job = slot.job;
    }

    const auto started = Clock::now();
    std::optional<filter::Deadline> deadline;
    if (job.timeout) {
        deadline = started + *job.timeout;
    }

    core::VoidResult outcome = execute(job, deadline);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    result.success = outcome.hasValue();
    if (!outcome) {
        result.error = outcome.error();
        BATCH_ERROR("Job {} failed: {}", result.id, outcome.error().fullMessage());
    } else {
        BATCH_INFO("Job {} done in {} ms", result.id, result.elapsed.count());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    slots_[index].state = JobState::Finished;
    return result;
}

core::VoidResult BatchOrchestrator::transform(const BatchJob& job, store::PackageStore& store,
                                              cache::DocumentCache& cache,
                                              std::optional<filter::Deadline> deadline) const {
    switch (job.kind) {
        case JobKind::Pipeline: {
            const filter::FilterRegistry registry = filter::FilterRegistry::withBuiltins();
            auto chain = filter::FilterChain::build(job.filters ? *job.filters : config_.filters(), registry);
            if (!chain) {
                return chain.error();
            }
            chain.value().setRetainDocuments(config_.xmlCache());
            return chain.value().run(store, cache, deadline);
        }
        case JobKind::Protect:
            return protect::ProtectionCodec(config_.protection()).protect(store, cache, job.key);
        case JobKind::Unprotect:
            return protect::ProtectionCodec(config_.protection()).unprotect(store, cache, job.key);
    }
    return core::makeError(core::ErrorCode::InvalidArgument, "Unknown job kind");
}

core::VoidResult BatchOrchestrator::execute(const BatchJob& job, std::optional<filter::Deadline> deadline) const {
    auto opened = core::ExceptionBridge::wrapCall([&]() { return openPackage(job.input); });
    if (!opened) {
        return opened.error();
    }
    std::unique_ptr<store::PackageStore> store = std::move(opened).value();
    cache::DocumentCache cache(*store);

    core::VoidResult transformed = transform(job, *store, cache, deadline);
    if (!transformed) {
        return transformed;
    }

    if (deadline && Clock::now() >= *deadline) {
        return core::makeError(core::ErrorCode::Timeout, "Deadline expired before export", job.input.string());
    }
    return core::ExceptionBridge::wrapVoidCall([&]() {
        exportPackage(*store, job.output, job.format, config_.compressionLevel());
    });
}

}} // namespace ryuri::batch
