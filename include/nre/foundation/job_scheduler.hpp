#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for data-parallel fan-out.

#include "nre/foundation/engine_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace nre::foundation {

/// Thread-pool backed scheduler used to compute independent game-mode
/// slices in parallel. Jobs must not share mutable state; each writes to
/// its own output slot.
///
/// Example:
/// @code
///   JobScheduler scheduler(4);
///   auto id = scheduler.schedule([&slot] { slot = computeSlice(); });
///   scheduler.wait(id.value());
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler with @p numThreads workers (at least one).
    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Enqueue a job. JobScheduleFailed if the pool rejects it.
    GameResult<JobId> schedule(JobFunc job);

    /// Block until job @p id completes. JobNotFound for unknown ids,
    /// ThreadError if the job threw.
    GameResult<void> wait(JobId id);

    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nre::foundation
