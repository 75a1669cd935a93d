#include "WorkerGroup.h"

WorkerGroup::~WorkerGroup() {
    wait();
}

void WorkerGroup::start(std::size_t n, WorkerFn worker) {
    std::lock_guard<std::mutex> lock(mtx);

    threads.reserve(threads.size() + n);
    for (std::size_t i = 0; i < n; ++i) {
        threads.emplace_back(worker, i);
    }
}

void WorkerGroup::wait() {
    std::vector<std::thread> running;
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.swap(threads);
    }

    for (auto& t : running) {
        if (t.joinable())
            t.join();
    }
}

std::size_t WorkerGroup::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return threads.size();
}
