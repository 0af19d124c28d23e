#pragma once

#include <functional>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>
#include <thread>

namespace calcvox {

/**
 * @brief Single-threaded cooperative event loop
 *
 * All engine state is touched only from the thread that calls run() or
 * run_pending(). Other threads (transport handshake, stdin reader) hand work
 * over with post(), which is the only thread-safe entry point besides quit().
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using IdleHook = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task for the loop thread (thread-safe)
    void post(Task task);

    /**
     * @brief Run every task queued so far, in FIFO order
     * @return Number of tasks executed
     *
     * Tasks posted while draining run on the next call.
     */
    size_t run_pending();

    /**
     * @brief Run until quit()
     * @param idle_hook Called once per iteration after posted tasks (device and socket polling)
     * @param idle_wait_ms Max time to wait for new tasks between iterations
     */
    void run(const IdleHook& idle_hook, int idle_wait_ms = 5);

    /// Make run() return after the current iteration (thread-safe)
    void quit();

    bool is_loop_thread() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::atomic<bool> running_;
    std::thread::id loop_thread_;
};

} // namespace calcvox
