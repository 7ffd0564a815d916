// NodeCraftThreadPool.cpp
#include "NodeCraftThreadPool.hpp"
#include "NodeCraftLog.hpp"
#include <exception>

namespace NodeCraft {

ThreadPool::ThreadPool(std::size_t workers) {
    if (workers == 0) workers = 1;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) threads.emplace_back([this] { workerLoop(); });
    logDebug("Thread pool started with {} workers", workers);
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    cv.notify_all();
    for (auto& t : threads) t.join();
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        tasks.push_back(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return stopping || !tasks.empty(); });
            if (tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop_front();
        }
        // Tasks report their own failures; anything escaping is a bug.
        try {
            task();
        } catch (const std::exception& e) {
            logError("Worker task escaped with exception: {}", e.what());
        }
    }
}

} // namespace NodeCraft
