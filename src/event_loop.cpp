#include "event_loop.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace calcvox {

EventLoop::EventLoop() : running_(false), loop_thread_(std::this_thread::get_id()) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    size_t executed = 0;
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            // A handler must not take the loop down; the failure is reported and the next task runs
            Logger::error(std::string("Event loop task threw: ") + e.what());
        }
        executed++;
    }
    return executed;
}

void EventLoop::run(const IdleHook& idle_hook, int idle_wait_ms) {
    loop_thread_ = std::this_thread::get_id();
    running_ = true;

    while (running_) {
        run_pending();
        if (idle_hook) {
            idle_hook();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(idle_wait_ms),
                     [this] { return !tasks_.empty() || !running_; });
    }

    // Drain whatever was posted by the shutdown path
    run_pending();
}

void EventLoop::quit() {
    running_ = false;
    cv_.notify_one();
}

bool EventLoop::is_loop_thread() const {
    return std::this_thread::get_id() == loop_thread_;
}

} // namespace calcvox
