// executor.cpp - Apply context implementations

#include <listkit/executor.h>

#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>

namespace listkit {

Executor inline_executor()
{
    return [](Task task) { task(); };
}

// ============================================================
// SerialExecutor Implementation
// ============================================================

struct SerialExecutor::Impl {
    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<Task> queue;

    bool pop(Task& out) {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return false;
        }
        out = std::move(queue.front());
        queue.pop_front();
        return true;
    }
};

SerialExecutor::SerialExecutor()
    : impl_(std::make_unique<Impl>())
{
}

SerialExecutor::~SerialExecutor()
{
    if (const auto left = pending(); left > 0) {
        std::cerr << "[SerialExecutor] Destroyed with " << left << " pending task(s)\n";
    }
}

void SerialExecutor::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->queue.push_back(std::move(task));
    }
    impl_->ready.notify_one();
}

bool SerialExecutor::run_one()
{
    Task task;
    if (!impl_->pop(task)) {
        return false;
    }
    task();
    return true;
}

bool SerialExecutor::run_one_for(std::chrono::milliseconds timeout)
{
    Task task;
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        if (!impl_->ready.wait_for(lock, timeout, [this] { return !impl_->queue.empty(); })) {
            return false;
        }
        task = std::move(impl_->queue.front());
        impl_->queue.pop_front();
    }
    task();
    return true;
}

std::size_t SerialExecutor::poll()
{
    std::size_t count = 0;
    while (run_one()) {
        ++count;
    }
    return count;
}

std::size_t SerialExecutor::pending() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

Executor SerialExecutor::as_executor()
{
    return [impl = impl_.get()](Task task) {
        {
            std::lock_guard<std::mutex> lock(impl->mutex);
            impl->queue.push_back(std::move(task));
        }
        impl->ready.notify_one();
    };
}

} // namespace listkit
