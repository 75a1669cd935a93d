#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "TransferStatus.h"

// Samples TransferStatus::downloaded() every interval and publishes the
// rate through TransferStatus::setSpeed(). Stopping resets the rate to 0.
class SpeedMonitor {
public:
    SpeedMonitor(TransferStatus& status, std::chrono::milliseconds interval);
    ~SpeedMonitor();

    SpeedMonitor(const SpeedMonitor&) = delete;
    SpeedMonitor& operator=(const SpeedMonitor&) = delete;

    // false if already sampling
    bool start();
    void stop();
    bool running() const;

private:
    void run();

private:
    TransferStatus& status;
    std::chrono::milliseconds interval;

    std::thread worker;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool active{ false };
    // Downloaded at the last sample, taken by start()
    std::uint64_t previous{ 0 };
};
