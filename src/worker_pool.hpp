#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ports {

// Fixed set of threads draining a FIFO of tasks
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool is stopping
    bool submit(std::function<void()> task);

    // Finish queued tasks, then join all workers. Idempotent.
    void stop();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

} // namespace ports
