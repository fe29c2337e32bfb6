#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace gigvault {

/// Runs posted jobs one at a time, in order, on a single worker thread.
class SerialQueue {
public:
    SerialQueue();
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    /// Enqueue a job. Jobs posted after shutdown() are dropped.
    void post(std::function<void()> job);

    /// Block until every job posted before this call has run.
    /// Must not be called from the worker thread.
    void drain();

    /// Run remaining jobs, then stop the worker. Idempotent.
    void shutdown();

    bool on_worker_thread() const;

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> jobs_;
    bool running_ = true;
    bool busy_ = false;
    std::thread worker_;
};

}  // namespace gigvault
