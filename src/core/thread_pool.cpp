/*
 * sitemirror - Thread Pool Implementation
 */
#include <sitemirror/core/thread_pool.hpp>
#include <sitemirror/core/logger.hpp>

namespace sitemirror {

ThreadPool::ThreadPool(size_t num_threads) : stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("Thread pool started with %zu workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("Cannot enqueue task - thread pool is stopped");
            return false;
        }
        tasks_.push(task);
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;  // Already stopped
        stop_ = true;
    }
    
    condition_.notify_all();
    
    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    LOG_DEBUG("Thread pool shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;
        
        {
            std::unique_lock<std::mutex> lock(mutex_);
            
            // Wait for a task or stop signal
            condition_.wait(lock, [this] { 
                return stop_ || !tasks_.empty(); 
            });
            
            if (stop_ && tasks_.empty()) {
                return;  // Exit thread
            }
            
            task = tasks_.front();
            tasks_.pop();
        }
        
        // Execute task outside the lock
        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Thread pool task threw exception: %s", e.what());
            }
        }
    }
}

// ============ TaskGroup ============

TaskGroup::TaskGroup(ThreadPool& pool) : pool_(pool), outstanding_(0) {}

TaskGroup::~TaskGroup() {
    wait();
}

void TaskGroup::run(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++outstanding_;
    }

    bool queued = pool_.enqueue([this, task]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Task group task threw exception: %s", e.what());
        }
        finish_one();
    });

    if (!queued) {
        // Pool already stopped: run inline so wait() still terminates
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Task group task threw exception: %s", e.what());
        }
        finish_one();
    }
}

void TaskGroup::finish_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ > 0) --outstanding_;
    if (outstanding_ == 0) done_.notify_all();
}

void TaskGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_.wait(lock, [this] { return outstanding_ == 0; });
}

size_t TaskGroup::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

} // namespace sitemirror
