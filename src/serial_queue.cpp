#include "gigvault/serial_queue.hpp"
#include "gigvault/log.hpp"

#include <exception>

namespace gigvault {

SerialQueue::SerialQueue() {
    worker_ = std::thread(&SerialQueue::worker_loop, this);
}

SerialQueue::~SerialQueue() {
    shutdown();
}

void SerialQueue::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void SerialQueue::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && !busy_; });
}

void SerialQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SerialQueue::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialQueue::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !jobs_.empty() || !running_; });
            if (jobs_.empty()) {
                break;  // stopped and drained
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }

        try {
            job();
        } catch (const std::exception& e) {
            log_error("serial queue job threw: %s", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }

    idle_cv_.notify_all();
}

}  // namespace gigvault
