#include "RangeFetcher.h"

#include <algorithm>
#include <string>

BlockSlot::BlockSlot(const Block& block)
    : begin(block.begin), end(block.end) {
}

Block BlockSlot::snapshot() const {
    return Block{ begin.load(), end };
}

bool BlockSlot::complete() const {
    if (end == -1)
        return streamDone.load();
    return begin.load() > end;
}

RangeFetcher::RangeFetcher(ConnectionPool& pool,
    ByteSink& sink,
    TransferStatus& status,
    const std::atomic<bool>& pausedFlag,
    std::size_t chunkSize)
    : connectionPool(pool),
    byteSink(sink),
    transferStatus(status),
    paused(pausedFlag),
    chunk(chunkSize == 0 ? 1024 : chunkSize) {
}

FetchResult RangeFetcher::fetch(BlockSlot& slot) {
    FetchResult result;

    if (slot.complete()) {
        result.completed = true;
        return result;
    }
    if (paused.load())
        return result;

    const Block block = slot.snapshot();

    bool writeFailed = false;
    bool truncated = false;
    bool pausedStop = false;
    std::uint64_t failedOffset = 0;

    auto onData = [&](const char* data, std::size_t size) {
        while (size > 0) {
            // checkpoint
            if (paused.load()) {
                pausedStop = true;
                return false;
            }

            std::size_t n = std::min(size, chunk);
            const std::int64_t begin = slot.begin.load();

            // Never write past the end of a bounded block
            if (slot.end != -1) {
                const std::int64_t owed = slot.end + 1 - begin;
                if (static_cast<std::int64_t>(n) >= owed) {
                    n = static_cast<std::size_t>(owed);
                    truncated = true;
                }
            }

            if (n > 0 && !byteSink.writeAt(static_cast<std::uint64_t>(begin), data, n)) {
                writeFailed = true;
                failedOffset = static_cast<std::uint64_t>(begin);
                return false;
            }

            slot.begin.store(begin + static_cast<std::int64_t>(n));
            transferStatus.add(n);
            result.bytesWritten += n;

            if (truncated)
                return false;

            data += n;
            size -= n;
        }
        return true;
    };

    auto shouldAbort = [this]() { return paused.load(); };

    std::string error;
    auto client = connectionPool.acquire();
    const HttpGetStatus status = client->get(block.begin, block.end, onData, shouldAbort, error);
    connectionPool.release(std::move(client));

    if (writeFailed) {
        result.error = TransferError::Write;
        result.message = "write failed at offset " + std::to_string(failedOffset);
        return result;
    }

    if (truncated) {
        result.completed = true;
        return result;
    }

    if (pausedStop || status == HttpGetStatus::Aborted)
        return result;

    if (status != HttpGetStatus::Ok) {
        result.error = TransferError::Network;
        result.message = error.empty() ? "request failed" : error;
        return result;
    }

    if (slot.end == -1) {
        slot.streamDone.store(true);
        result.completed = true;
        return result;
    }

    if (!slot.complete()) {
        result.error = TransferError::Network;
        result.message = "short read: stream ended at offset " + std::to_string(slot.begin.load()) +
            ", block ends at " + std::to_string(slot.end);
        return result;
    }

    result.completed = true;
    return result;
}
