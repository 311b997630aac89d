#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace loom::daemon
{

// Multi-producer, single-consumer queue of closures for the control thread.
// Channel reader threads post here; the control loop drains it between
// deadline checks.
// Unbounded: post() never blocks and never drops.
class ControlInbox
{
   public:
    using Task = std::function<void()>;

    ControlInbox()  = default;
    ~ControlInbox() = default;

    ControlInbox(const ControlInbox&)            = delete;
    ControlInbox& operator=(const ControlInbox&) = delete;

    // Producer side: enqueue a task and wake the consumer.
    void post(Task task)
    {
        {
            std::lock_guard lock(mu_);
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    // Consumer side: wait up to `timeout` for at least one task, then run
    // everything queued so far. Returns the number of tasks executed.
    size_t wait_and_drain(std::chrono::milliseconds timeout)
    {
        std::deque<Task> batch;
        {
            std::unique_lock lock(mu_);
            if (tasks_.empty() && timeout.count() > 0)
                cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); });
            batch.swap(tasks_);
        }

        size_t count = 0;
        for (auto& task : batch)
        {
            if (task)
            {
                task();
            }
            ++count;
        }
        return count;
    }

    // Consumer side: run whatever is queued without waiting.
    size_t drain() { return wait_and_drain(std::chrono::milliseconds(0)); }

    bool empty() const
    {
        std::lock_guard lock(mu_);
        return tasks_.empty();
    }

    size_t size() const
    {
        std::lock_guard lock(mu_);
        return tasks_.size();
    }

   private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Task>        tasks_;
};

}   // namespace loom::daemon
