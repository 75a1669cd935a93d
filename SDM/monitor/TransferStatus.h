#pragma once
#include <atomic>
#include <cstdint>

// Live counters of one transfer, safe to read from any thread.
class TransferStatus {
public:
    explicit TransferStatus(std::int64_t totalBytes = -1);

    void add(std::uint64_t bytes);
    std::uint64_t downloaded() const;

    void setSpeed(std::uint64_t bytesPerSec);
    std::uint64_t speed() const;

    void setTotal(std::int64_t totalBytes);
    std::int64_t total() const;

    // 0..1, or 0 while the size is unknown
    double progress() const;

private:
    std::atomic<std::int64_t> totalSize;
    std::atomic<std::uint64_t> current{ 0 };
    std::atomic<std::uint64_t> speeds{ 0 };
};
