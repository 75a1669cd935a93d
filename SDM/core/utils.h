#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

#include "RetryPolicy.h"

struct TransferConfig {
    static constexpr std::size_t maxParallelism = 32;

    std::string url;
    std::string outputPath;

    std::size_t parallelism = 5;
    std::size_t chunkSize = 1024;

    std::chrono::milliseconds speedInterval{ 1000 };
    std::chrono::milliseconds connectTimeout{ 15000 };
    // Abort a request that moves less than 1 byte/s for this long (0 = never)
    std::chrono::milliseconds stallTimeout{ 30000 };

    RetryPolicy retry;

    bool verbose = false;
};

// End == -1 marks the open-ended tail used when the size is unknown.
struct Block {
    std::int64_t begin = 0;
    std::int64_t end = -1;

    bool openEnded() const { return end == -1; }
    bool complete() const { return !openEnded() && begin > end; }
    std::int64_t remaining() const { return openEnded() ? -1 : end + 1 - begin; }
};

enum class TransferState {
    Idle,
    Running,
    Paused,
    Finished,
    Failed
};

enum class TransferError {
    None = 0,
    Probe,
    Network,
    Write,
    NoBlocks,
    RetriesExhausted,
    Dispatch
};

const char* toString(TransferState state);
const char* toString(TransferError error);

struct FetchResult {
    TransferError error = TransferError::None;
    std::uint64_t bytesWritten = 0;
    bool completed = false;
    std::string message;
};

struct WorkerReport {
    std::size_t blockIndex = 0;
    std::size_t attempts = 0;
    bool completed = false;
    bool gaveUp = false;
    TransferError lastError = TransferError::None;
    std::string error;
};
