#pragma once
#include <atomic>
#include <cstdint>

#include "utils.h"
#include "ConnectionPool.h"
#include "../io/ByteSink.h"
#include "../monitor/TransferStatus.h"

// One block of a transfer. begin is the resume cursor and only moves forward.
struct BlockSlot {
    explicit BlockSlot(const Block& block);

    std::atomic<std::int64_t> begin;
    const std::int64_t end;
    // An open-ended block is only known to be complete once its stream ended
    std::atomic<bool> streamDone{ false };

    Block snapshot() const;
    bool complete() const;
};

// Fetches the unfetched part of one block and writes it in place.
class RangeFetcher {
public:
    RangeFetcher(ConnectionPool& pool,
        ByteSink& sink,
        TransferStatus& status,
        const std::atomic<bool>& pausedFlag,
        std::size_t chunkSize);

    // No error with completed == false means the paused flag stopped it.
    FetchResult fetch(BlockSlot& slot);

private:
    ConnectionPool& connectionPool;
    ByteSink& byteSink;
    TransferStatus& transferStatus;
    const std::atomic<bool>& paused;
    std::size_t chunk;
};
