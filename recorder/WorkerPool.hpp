#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed-size pool with a bounded queue. submit() never spawns threads; it
// refuses work when the queue is full or the pool is shutting down.
class WorkerPool {
    std::string name;
    std::queue<std::function<void()>> jobs;
    std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable idleCv;
    bool running = true;
    size_t maxQueued;
    int busy = 0;
    std::vector<std::thread> workers;

    void workerLoop();

public:
    WorkerPool(std::string poolName, int workerCount, size_t queueLimit);
    ~WorkerPool();

    bool submit(std::function<void()> job);

    // Blocks until the queue is empty and no job is running.
    void waitIdle();

    // Finishes queued jobs, then joins.
    void shutdown();

    size_t pending();
};
