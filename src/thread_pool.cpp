#include "filevault/thread_pool.hpp"
#include "filevault/logger.hpp"

#include <utility>

namespace filevault {

ThreadPool::ThreadPool(size_t numThreads, size_t maxQueued) : maxQueued_(maxQueued) {
    size_t count = numThreads > 0 ? numThreads : 1;

    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::tryPost(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (maxQueued_ > 0 && jobs_.size() >= maxQueued_) {
            return false;
        }
        jobs_.push_back(std::move(job));
    }

    wakeup_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wakeup_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ThreadPool::workerLoop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wakeup_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });

            // Drain before exiting so accepted connections still get an answer
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        ++activeThreads_;
        try {
            job();
        } catch (const std::exception& e) {
            FV_LOG_ERROR("Worker job failed: " + std::string(e.what()));
        }
        --activeThreads_;
    }
}

} // namespace filevault
