// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file executor.h
/// @brief Apply context abstraction for the update pipeline.
///
/// The rendering surface is owned by one thread. The pipeline never assumes
/// which one: every step that touches committed state or calls back into
/// the renderer is posted through an Executor supplied by the caller.
///
/// Usage:
/// @code
///   SerialExecutor ui_queue;
///   UpdateScheduler<int, int> scheduler(ui_queue.as_executor(), render);
///   scheduler.apply(next);
///   // on the rendering thread:
///   while (ui_queue.run_one()) {}
/// @endcode

#pragma once

#include <listkit/api.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace listkit {

using Task = std::function<void()>;

/// Posts a task to the apply context. Must not run the task on a thread
/// other than the one owning the rendering surface. Running it inline is
/// allowed when the caller already is that thread.
using Executor = std::function<void(Task)>;

/// Executor that runs every task immediately on the posting thread.
[[nodiscard]] LISTKIT_API Executor inline_executor();

// ============================================================
// SerialExecutor - FIFO task queue drained by its owner thread
// ============================================================

class LISTKIT_API SerialExecutor {
public:
    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Enqueue a task. Thread-safe.
    void post(Task task);

    /// Run one queued task if there is one.
    /// @return true if a task ran
    bool run_one();

    /// Wait up to `timeout` for a task and run it.
    /// @return true if a task ran
    bool run_one_for(std::chrono::milliseconds timeout);

    /// Run every task queued at the time of the call, plus the ones those
    /// tasks post. @return number of tasks run
    std::size_t poll();

    [[nodiscard]] std::size_t pending() const;

    /// Executor handle posting into this queue. The handle must not outlive
    /// the SerialExecutor.
    [[nodiscard]] Executor as_executor();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace listkit
