/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "nre/foundation/job_scheduler.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nre::foundation {

struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::mutex mutex;
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("nre_job_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false);
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

GameResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("nre_job_" + std::to_string(id))
        .work([fn = std::move(job), promise]() -> kcenon::common::VoidResult {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return GameResult<JobId>::err(
            EngineError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
    }

    return GameResult<JobId>::ok(id);
}

GameResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return GameResult<void>::err(
                EngineError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
        impl_->futures.erase(it);
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return GameResult<void>::err(
            EngineError(ErrorCode::ThreadError, std::string("job failed: ") + e.what()));
    } catch (...) {
        return GameResult<void>::err(
            EngineError(ErrorCode::ThreadError, "job failed with a non-standard exception"));
    }
    return GameResult<void>::ok();
}

std::size_t JobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

} // namespace nre::foundation
