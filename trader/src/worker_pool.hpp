#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>

// Fixed set of threads draining a shared task queue.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();
    
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    
    std::future<void> submit(std::function<void()> task);
    
    // Finishes queued tasks, then joins the threads.
    void shutdown();
    
    size_t size() const { return workers_.size(); }
    
private:
    void worker_loop();
    
    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};
