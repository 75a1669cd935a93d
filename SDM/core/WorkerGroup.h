#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <mutex>

// Fan-out/fan-in: one thread per task index, wait() joins every one of them.
class WorkerGroup {
public:
    using WorkerFn = std::function<void(std::size_t index)>;

    WorkerGroup() = default;
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void start(std::size_t n, WorkerFn worker);
    void wait();

    std::size_t size() const;

private:
    std::vector<std::thread> threads;
    mutable std::mutex mtx;
};
