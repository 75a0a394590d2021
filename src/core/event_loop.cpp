#include "rtvoice/core/event_loop.hpp"

#include <exception>

#include "rtvoice/logging.hpp"

namespace rtvoice {

void EventLoop::post(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::post_after(std::chrono::milliseconds delay, Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timed_.push({Clock::now() + delay, sequence_++, std::move(task)});
    }
    cv_.notify_one();
}

void EventLoop::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) {
                break;
            }
            if (ready_.empty()) {
                if (timed_.empty()) {
                    cv_.wait(lock, [this]() {
                        return stop_ || !ready_.empty() || !timed_.empty();
                    });
                } else {
                    const auto deadline = timed_.top().deadline;
                    cv_.wait_until(lock, deadline, [this, deadline]() {
                        return stop_ || !ready_.empty() ||
                               (!timed_.empty() && timed_.top().deadline < deadline);
                    });
                }
            }
            if (stop_) {
                break;
            }
        }
        poll(Clock::now());
    }
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::poll(Clock::time_point now) {
    size_t executed = 0;
    while (true) {
        auto tasks = take_ready(now);
        if (tasks.empty()) {
            break;
        }
        for (auto& task : tasks) {
            try {
                task();
            } catch (const std::exception& ex) {
                logging::error(
                    "Event loop task failed",
                    {kv("error", ex.what())});
            }
            ++executed;
        }
    }
    return executed;
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + timed_.size();
}

bool EventLoop::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

std::vector<EventLoop::Task> EventLoop::take_ready(Clock::time_point now) {
    std::vector<Task> tasks;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!timed_.empty() && timed_.top().deadline <= now) {
        ready_.push_back(timed_.top().task);
        timed_.pop();
    }
    tasks.reserve(ready_.size());
    while (!ready_.empty()) {
        tasks.push_back(std::move(ready_.front()));
        ready_.pop_front();
    }
    return tasks;
}

}
