// transition_pipeline.cpp - Serialized transitions with background diffing

#include <listkit/transition_pipeline.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace listkit {

const char* to_string(TransitionStatus status) noexcept
{
    switch (status) {
    case TransitionStatus::Applied:
        return "applied";
    case TransitionStatus::Cancelled:
        return "cancelled";
    case TransitionStatus::Failed:
        return "failed";
    }
    return "unknown";
}

namespace {

struct Request {
    Generation generation = 0;
    std::unique_ptr<TransitionJob> job;
    Completion completion;
    std::string error; // set when compute() threw
};

void complete(Request& request, TransitionStatus status)
{
    if (!request.completion) {
        return;
    }
    try {
        request.completion(status);
    } catch (const std::exception& e) {
        std::cerr << "[TransitionPipeline] Completion of generation " << request.generation
                  << " threw: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[TransitionPipeline] Completion of generation " << request.generation
                  << " threw a non-standard exception\n";
    }
}

} // namespace

// ============================================================
// TransitionPipeline::Impl
//
// Shared with every closure posted to the apply context or the pool, so
// in-flight work never dereferences a destroyed pipeline.
// ============================================================

struct TransitionPipeline::Impl : std::enable_shared_from_this<TransitionPipeline::Impl> {
    Executor apply;
    PipelineOptions options;
    boost::asio::thread_pool pool;

    mutable std::mutex mutex;
    std::deque<std::shared_ptr<Request>> queue;
    bool running = false;
    Generation issued = 0;
    // Trampoline for run_next(): an inline apply context would otherwise
    // recurse once per transition.
    bool stepping = false;
    bool step_again = false;

    std::atomic<Generation> applied{0};
    std::atomic<bool> shutting_down{false};

    Impl(Executor apply_context, PipelineOptions opts)
        : apply(std::move(apply_context))
        , options(opts)
        , pool(opts.worker_threads > 0 ? opts.worker_threads : 1)
    {
    }

    // The queue only ever holds transitions issued after the running one, so
    // a non-empty queue means a live newer transition is waiting.
    bool superseded() const {
        if (!options.coalesce_superseded) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex);
        return !queue.empty();
    }

    void schedule_next() {
        apply([self = shared_from_this()] { self->run_next(); });
    }

    // Apply context
    void run_next() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stepping) {
                step_again = true;
                return;
            }
            stepping = true;
        }
        for (;;) {
            step();
            std::lock_guard<std::mutex> lock(mutex);
            if (!step_again) {
                stepping = false;
                return;
            }
            step_again = false;
        }
    }

    // Resolve or dispatch the oldest queued transition.
    void step() {
        std::shared_ptr<Request> request;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (queue.empty()) {
                running = false;
                return;
            }
            request = std::move(queue.front());
            queue.pop_front();
        }

        if (shutting_down || superseded()) {
            complete(*request, TransitionStatus::Cancelled);
            schedule_next();
            return;
        }

        std::size_t workload = 0;
        try {
            workload = request->job->prepare();
        } catch (const std::exception& e) {
            std::cerr << "[TransitionPipeline] Preparing generation " << request->generation
                      << " failed: " << e.what() << "\n";
            complete(*request, TransitionStatus::Failed);
            schedule_next();
            return;
        } catch (...) {
            std::cerr << "[TransitionPipeline] Preparing generation " << request->generation
                      << " failed: non-standard exception\n";
            complete(*request, TransitionStatus::Failed);
            schedule_next();
            return;
        }

        if (workload <= options.background_threshold) {
            compute(*request);
            finish(*request);
            return;
        }

        boost::asio::post(pool, [self = shared_from_this(), request] {
            self->compute(*request);
            self->apply([self, request] { self->finish(*request); });
        });
    }

    // Any thread
    void compute(Request& request) {
        try {
            request.job->compute();
        } catch (const std::exception& e) {
            request.error = e.what();
        } catch (...) {
            // Must not escape a pool thread.
            request.error = "non-standard exception";
        }
    }

    // Apply context
    void finish(Request& request) {
        TransitionStatus status = TransitionStatus::Applied;
        if (!request.error.empty()) {
            std::cerr << "[TransitionPipeline] Diff for generation " << request.generation
                      << " failed: " << request.error << "\n";
            status = TransitionStatus::Failed;
        } else if (shutting_down || superseded()) {
            status = TransitionStatus::Cancelled;
        } else {
            try {
                request.job->commit(request.generation);
                applied = request.generation;
            } catch (const std::exception& e) {
                std::cerr << "[TransitionPipeline] Committing generation " << request.generation
                          << " failed: " << e.what() << "\n";
                status = TransitionStatus::Failed;
            } catch (...) {
                std::cerr << "[TransitionPipeline] Committing generation " << request.generation
                          << " failed: non-standard exception\n";
                status = TransitionStatus::Failed;
            }
        }
        complete(request, status);
        schedule_next();
    }
};

// ============================================================
// TransitionPipeline
// ============================================================

TransitionPipeline::TransitionPipeline(Executor apply_context, PipelineOptions options)
    : impl_(std::make_shared<Impl>(std::move(apply_context), options))
{
}

TransitionPipeline::~TransitionPipeline()
{
    impl_->shutting_down = true;
    cancel_pending();
    impl_->pool.join();
}

Generation TransitionPipeline::submit(std::unique_ptr<TransitionJob> job, Completion completion)
{
    auto request = std::make_shared<Request>();
    request->job = std::move(job);
    request->completion = std::move(completion);

    bool start = false;
    Generation generation = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        generation = ++impl_->issued;
        request->generation = generation;
        impl_->queue.push_back(std::move(request));
        if (!impl_->running) {
            impl_->running = true;
            start = true;
        }
    }
    // Never post while holding the mutex: an inline executor re-enters.
    if (start) {
        impl_->schedule_next();
    }
    return generation;
}

std::size_t TransitionPipeline::cancel_pending()
{
    std::deque<std::shared_ptr<Request>> dropped;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        dropped.swap(impl_->queue);
    }
    for (auto& request : dropped) {
        complete(*request, TransitionStatus::Cancelled);
    }
    return dropped.size();
}

bool TransitionPipeline::idle() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return !impl_->running && impl_->queue.empty();
}

Generation TransitionPipeline::latest_generation() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->issued;
}

Generation TransitionPipeline::applied_generation() const
{
    return impl_->applied;
}

const PipelineOptions& TransitionPipeline::options() const noexcept
{
    return impl_->options;
}

} // namespace listkit
