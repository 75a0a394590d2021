#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace rtvoice {

class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    void post(Task task);
    void post_after(std::chrono::milliseconds delay, Task task);

    void run();
    void stop();

    size_t poll(Clock::time_point now = Clock::now());

    size_t pending() const;
    bool stopped() const;

private:
    struct Timed {
        Clock::time_point deadline;
        uint64_t sequence = 0;
        Task task;
    };

    struct TimedLater {
        bool operator()(const Timed& a, const Timed& b) const {
            if (a.deadline != b.deadline) {
                return a.deadline > b.deadline;
            }
            return a.sequence > b.sequence;
        }
    };

    std::vector<Task> take_ready(Clock::time_point now);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::priority_queue<Timed, std::vector<Timed>, TimedLater> timed_;
    uint64_t sequence_ = 0;
    bool stop_ = false;
};

class LifetimeToken {
public:
    LifetimeToken() : alive_(std::make_shared<int>(0)) {}
    LifetimeToken(const LifetimeToken&) = delete;
    LifetimeToken& operator=(const LifetimeToken&) = delete;

    EventLoop::Task guard(EventLoop::Task task) const {
        std::weak_ptr<int> weak = alive_;
        return [weak, task = std::move(task)]() {
            if (weak.lock()) {
                task();
            }
        };
    }

    // For guards built on other threads; take it on the owner's thread.
    std::weak_ptr<int> watch() const {
        return alive_;
    }

private:
    std::shared_ptr<int> alive_;
};

}
