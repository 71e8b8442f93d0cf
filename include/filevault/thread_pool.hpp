#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace filevault {

/**
 * @class ThreadPool
 * @brief Fixed set of workers behind a FIFO job queue.
 *
 * HttpServer hands each accepted connection to the pool with tryPost().
 * When maxQueued is non-zero the queue is bounded, so a flood of
 * connections is refused instead of piling up.
 */
class ThreadPool {
public:
    using Job = std::function<void()>;

    // maxQueued == 0 leaves the queue unbounded.
    explicit ThreadPool(size_t numThreads, size_t maxQueued = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false instead of queueing when stopped or full.
    bool tryPost(Job job);

    // Runs the queued jobs to completion, then joins the workers.
    void shutdown();

    size_t getThreadCount() const { return workers_.size(); }

    size_t getActiveThreadCount() const { return activeThreads_.load(); }

    size_t getQueueSize() const;

    size_t getMaxQueued() const { return maxQueued_; }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Job> jobs_;
    const size_t maxQueued_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    bool stopping_ = false;
    std::atomic<size_t> activeThreads_{0};
};

} // namespace filevault
