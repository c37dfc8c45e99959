/*
 * sitemirror - Bounded worker pool for asset downloads
 */
#ifndef SITEMIRROR_CORE_THREAD_POOL_HPP
#define SITEMIRROR_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace sitemirror {

// Fixed-size pool; width bounds how many downloads run at once
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();
    
    // Add a task to the queue. Returns false once the pool is stopped.
    bool enqueue(std::function<void()> task);
    
    // Get number of threads
    size_t size() const { return threads_.size(); }
    
    // Drain queued tasks and join the workers
    void shutdown();

private:
    void worker();
    
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

// Tracks one batch of tasks on a shared pool. wait() returns once every task
// of this batch has finished, whether it succeeded or threw; batches from
// other clone runs on the same pool are not waited for.
class TaskGroup {
public:
    explicit TaskGroup(ThreadPool& pool);
    ~TaskGroup();

    void run(std::function<void()> task);
    void wait();

    size_t outstanding() const;

private:
    TaskGroup(const TaskGroup&);
    TaskGroup& operator=(const TaskGroup&);

    void finish_one();

    ThreadPool& pool_;
    size_t outstanding_;
    mutable std::mutex mutex_;
    std::condition_variable done_;
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_THREAD_POOL_HPP
