#pragma once

#include <deque>
#include <mutex>
#include <functional>
#include <condition_variable>

// Single-threaded continuation queue. Transports may complete on any thread;
// they post the continuation here and run() executes it on the session thread,
// so the pump never recurses through a synchronous transport.
class EventLoop {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Runs tasks until stop() is called and the queue is drained.
    void run();
    void stop();

    // Runs whatever is queued right now without blocking. Returns the number
    // of tasks executed.
    size_t poll();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopped_ = false;
};
