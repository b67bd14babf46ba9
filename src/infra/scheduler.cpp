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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 */

#include "tagid/infra/scheduler.hpp"

namespace tagid::infra {

Scheduler::Scheduler(size_t threads)
{
    const size_t count = threads == 0 ? 1 : threads;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&Scheduler::worker_loop, this);
    }
}

Scheduler::~Scheduler()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    work_ready_.notify_all();

    for (std::thread& worker : workers_) {
        worker.join();
    }
}

void Scheduler::enqueue(Task task)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        tasks_.push(std::move(task));
    }
    work_ready_.notify_one();
}

Scheduler::Task Scheduler::next_task()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    work_ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

    // Pending tasks still run after shutdown starts, so every future is satisfied.
    if (tasks_.empty()) {
        return Task();
    }
    Task task = std::move(tasks_.front());
    tasks_.pop();
    return task;
}

void Scheduler::worker_loop()
{
    // Task exceptions are captured by the packaged_task and surface through its future.
    while (Task task = next_task()) {
        task();
    }
}

} // namespace tagid::infra
