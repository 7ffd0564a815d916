// NodeCraft worker pool
//
// Fixed set of worker threads draining a FIFO of tasks. The executor's
// scheduler posts ready nodes here; tasks never block on each other.
#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace NodeCraft {

class ThreadPool {
public:
    explicit ThreadPool(std::size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(std::function<void()> task);
    std::size_t size() const { return threads.size(); }

private:
    void workerLoop();

    std::vector<std::thread> threads;
    std::deque<std::function<void()>> tasks;
    std::mutex mutex;
    std::condition_variable cv;
    bool stopping = false;
};

} // namespace NodeCraft
