#include "SpeedMonitor.h"

SpeedMonitor::SpeedMonitor(TransferStatus& s, std::chrono::milliseconds i)
    : status(s), interval(i.count() > 0 ? i : std::chrono::milliseconds(1000)) {
}

SpeedMonitor::~SpeedMonitor() {
    stop();
}

bool SpeedMonitor::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (active)
        return false;

    active = true;
    previous = status.downloaded();
    worker = std::thread(&SpeedMonitor::run, this);
    return true;
}

void SpeedMonitor::stop() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mtx);
        active = false;
        finished = std::move(worker);
    }
    cv.notify_all();

    if (finished.joinable())
        finished.join();

    status.setSpeed(0);
}

bool SpeedMonitor::running() const {
    std::lock_guard<std::mutex> lock(mtx);
    return active;
}

void SpeedMonitor::run() {
    const auto millis = static_cast<std::uint64_t>(interval.count());

    std::unique_lock<std::mutex> lock(mtx);
    while (active) {
        if (cv.wait_for(lock, interval, [this]() { return !active; }))
            break;

        const std::uint64_t current = status.downloaded();
        // bytes per nominal interval, scaled to bytes/sec
        status.setSpeed((current - previous) * 1000 / millis);
        previous = current;
    }
}
