#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Bounded FIFO shared by the scan workers. Completion is tracked with an
// explicit count of tasks that are queued or running: when it reaches zero
// no worker can produce more work and every waiter is released.
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

    // False when the queue is full; the caller then runs the task itself.
    bool tryPush(T task) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (items.size() >= capacity)
                return false;
            items.push_back(std::move(task));
            ++outstanding;
        }
        available.notify_one();
        return true;
    }

    // Counts a task the caller runs inline, so completion waits for it.
    void beginInline() {
        std::lock_guard<std::mutex> lock(mutex);
        ++outstanding;
    }

    // Blocks until a task is available, all work is done, or stop is set.
    // Tasks popped here must be balanced by a call to done().
    std::optional<T> pop(const std::atomic<bool>& stop) {
        std::unique_lock<std::mutex> lock(mutex);
        available.wait(lock, [&] { return stop || !items.empty() || outstanding == 0; });
        if (stop || items.empty())
            return std::nullopt;
        T task = std::move(items.front());
        items.pop_front();
        return task;
    }

    void done() {
        bool finished;
        {
            std::lock_guard<std::mutex> lock(mutex);
            finished = --outstanding == 0;
        }
        if (finished)
            available.notify_all();
    }

    // Wakes waiters so they can observe a stop request. A worker that sees
    // the stop calls this on its way out, so the wakeup reaches every worker.
    void wake() {
        std::lock_guard<std::mutex> lock(mutex);
        available.notify_all();
    }

    // Removes whatever was never dequeued (after a stop).
    std::deque<T> drain() {
        std::lock_guard<std::mutex> lock(mutex);
        std::deque<T> left;
        left.swap(items);
        outstanding -= left.size();
        return left;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

private:
    const size_t capacity;
    mutable std::mutex mutex;
    std::condition_variable available;
    std::deque<T> items;
    size_t outstanding = 0;
};
