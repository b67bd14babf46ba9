/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Worker pool used to mint identifiers from several threads at once.
 *
 * @details
 * This header defines the `Scheduler` class, a Producer-Consumer thread pool.
 * `tagid-mint --threads N` fans generation out across its workers, and the
 * concurrency tests use it to hammer the stateful generators from many threads.
 * Results come back through `std::future`, so an exception thrown inside a task
 * (a `GenerationFailure`, for instance) is rethrown to whoever calls `get()`.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace tagid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the thread pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. Zero (for example when
     * `hardware_concurrency()` cannot be detected) is raised to one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Drains the queue, then joins every worker.
     *
     * @note This is a **blocking** operation: tasks already submitted still run.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a callable and returns a future for its result.
     *
     * @code
     * tagid::infra::Scheduler pool(4);
     * auto f = pool.submit([] { return tagid::next_id<User>(); });
     * auto id = f.get();
     * @endcode
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    /// @brief Number of worker threads.
    size_t size() const noexcept { return workers_.size(); }

  private:
    using Task = std::function<void()>;

    /// @brief Pushes a type-erased task and wakes one worker.
    void enqueue(Task task);

    /// @brief Blocks for the next task; an empty task means the pool is drained and stopping.
    Task next_task();

    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;

    /// @brief Guards `tasks_` and `stopping_`.
    std::mutex queue_mutex_;
    std::condition_variable work_ready_;
    bool stopping_ = false;
};

} // namespace tagid::infra
