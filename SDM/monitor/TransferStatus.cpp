#include "TransferStatus.h"

TransferStatus::TransferStatus(std::int64_t totalBytes)
    : totalSize(totalBytes) {
}

void TransferStatus::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t TransferStatus::downloaded() const {
    return current.load(std::memory_order_relaxed);
}

void TransferStatus::setSpeed(std::uint64_t bytesPerSec) {
    speeds.store(bytesPerSec, std::memory_order_relaxed);
}

std::uint64_t TransferStatus::speed() const {
    return speeds.load(std::memory_order_relaxed);
}

void TransferStatus::setTotal(std::int64_t totalBytes) {
    totalSize.store(totalBytes, std::memory_order_relaxed);
}

std::int64_t TransferStatus::total() const {
    return totalSize.load(std::memory_order_relaxed);
}

double TransferStatus::progress() const {
    const std::int64_t t = total();
    return t <= 0 ? 0.0 : (double)downloaded() / (double)t;
}
