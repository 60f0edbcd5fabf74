#include "WorkerPool.hpp"
#include "supervisor/Logger.hpp"
#include <exception>

WorkerPool::WorkerPool(std::string poolName, int workerCount, size_t queueLimit)
    : name(std::move(poolName)), maxQueued(queueLimit) {
    for (int i = 0; i < workerCount; i++) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [&] { return !jobs.empty() || !running; });
            if (!running && jobs.empty()) return;
            job = std::move(jobs.front());
            jobs.pop();
            busy++;
        }
        try {
            job();
        } catch (const std::exception& e) {
            logError(name, std::string("job failed: ") + e.what());
        } catch (...) {
            logError(name, "job failed: unknown exception");
        }
        {
            std::lock_guard<std::mutex> lock(mtx);
            busy--;
        }
        idleCv.notify_all();
    }
}

bool WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running || jobs.size() >= maxQueued) return false;
        jobs.push(std::move(job));
    }
    cv.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(mtx);
    idleCv.wait(lock, [&] { return jobs.empty() && busy == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running = false;
    }
    cv.notify_all();
    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }
    workers.clear();
}

size_t WorkerPool::pending() {
    std::lock_guard<std::mutex> lock(mtx);
    return jobs.size();
}
