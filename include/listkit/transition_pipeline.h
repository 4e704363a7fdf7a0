// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file transition_pipeline.h
/// @brief Serialized transition queue behind UpdateScheduler.
///
/// One transition runs at a time, in submission order. Each transition is
/// split in three steps:
///
///   prepare()  apply context   capture the committed state, report workload
///   compute()  any thread      pure diff work
///   commit()   apply context   publish the new state, call the renderer
///
/// compute() runs inline when the workload is at or below
/// background_threshold, otherwise on a Boost.Asio thread pool. Every
/// transition carries a generation number; with coalesce_superseded a
/// transition that has a newer one queued behind it is resolved as Cancelled
/// before it starts, and again right before it would commit. A cancelled
/// transition never commits, so the committed state is always the result of
/// some fully applied transition.

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/api.h>
#include <listkit/executor.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace listkit {

using Generation = std::uint64_t;

enum class TransitionStatus { Applied, Cancelled, Failed };

LISTKIT_API const char* to_string(TransitionStatus status) noexcept;

using Completion = std::function<void(TransitionStatus)>;

struct PipelineOptions {
    /// Workloads above this many items are diffed on a worker thread.
    std::size_t background_threshold = default_background_threshold;
    /// Skip transitions that already have a newer one queued behind them.
    bool coalesce_superseded = true;
    std::size_t worker_threads = 1;
};

/// One unit of work queued on a TransitionPipeline.
class TransitionJob {
public:
    virtual ~TransitionJob() = default;

    /// Apply context. Returns the workload used to pick inline vs background.
    virtual std::size_t prepare() = 0;

    /// Any thread. Must not touch committed state.
    virtual void compute() = 0;

    /// Apply context. Only called when the transition is still current.
    virtual void commit(Generation generation) = 0;
};

class LISTKIT_API TransitionPipeline {
public:
    TransitionPipeline(Executor apply_context, PipelineOptions options = {});

    /// Cancels queued transitions and joins the background workers. A
    /// transition already computing finishes as Cancelled.
    ~TransitionPipeline();

    TransitionPipeline(const TransitionPipeline&) = delete;
    TransitionPipeline& operator=(const TransitionPipeline&) = delete;

    /// Queue a transition. `completion` runs on the apply context once the
    /// transition resolves. Thread-safe.
    /// @return the generation assigned to the transition
    Generation submit(std::unique_ptr<TransitionJob> job, Completion completion = {});

    /// Resolve every queued, not yet started transition as Cancelled. A
    /// transition already running is not affected and still commits.
    /// Completions run on the calling thread.
    /// @return number of transitions cancelled
    std::size_t cancel_pending();

    /// No transition queued or running.
    [[nodiscard]] bool idle() const;

    [[nodiscard]] Generation latest_generation() const;

    /// Generation of the last transition that committed; 0 before any.
    [[nodiscard]] Generation applied_generation() const;

    [[nodiscard]] const PipelineOptions& options() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace listkit
