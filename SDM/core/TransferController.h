#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <string>
#include <chrono>

#include "utils.h"
#include "BlockPlanner.h"
#include "ConnectionPool.h"
#include "RangeFetcher.h"
#include "TransferObserver.h"
#include "WorkerGroup.h"
#include "../io/ByteSink.h"
#include "../net/HttpClient.h"
#include "../monitor/Logger.h"
#include "../monitor/SpeedMonitor.h"
#include "../monitor/TransferStatus.h"

// Drives one segmented download:
//
//   Idle --start--> Running --> Finished
//                     |  ^
//               pause |  | resume
//                     v  |
//              Paused / Failed
//
// Every round dispatches one worker per block and joins all of them before
// deciding the next state. start(), pause() and resume() return at once.
// The public API is not reentrant; callers serialize control calls.
class TransferController {
public:
    TransferController(const TransferConfig& config,
        ByteSink& sink,
        TransferObserver& observer,
        HttpClientFactory clientFactory = HttpClientFactory(),
        Logger* logger = nullptr);
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    // Metadata request for the content length. false on ProbeError, which is
    // also reported through onError.
    bool probe();

    // Only from Idle, after a successful probe().
    bool start();
    void pause();
    // NoBlocks when nothing was ever started.
    TransferError resume();

    // Blocks until the transfer is not Running or the timeout expires.
    bool waitForSettled(std::chrono::milliseconds timeout);

    TransferState state() const;
    std::int64_t totalSize() const { return totalBytes; }
    std::vector<Block> blocks() const;
    const TransferStatus& status() const { return transferStatus; }
    std::string lastError() const;

private:
    void coordinatorLoop();
    // false when not every worker could be launched
    bool runRound(std::string& error);
    void runBlock(std::size_t index);
    bool parkUntilResumed(TransferState parkedAs);
    void reportError(TransferError code, const std::string& message);
    void sleepUnlessPaused(std::chrono::milliseconds delay);

private:
    const TransferConfig cfg;
    ByteSink& byteSink;
    TransferObserver& events;

    std::unique_ptr<Logger> ownedLogger;
    Logger& logger;

    std::unique_ptr<ConnectionPool> connectionPool;
    std::unique_ptr<RangeFetcher> fetcher;

    TransferStatus transferStatus;
    SpeedMonitor speedMonitor;

    std::int64_t totalBytes{ -1 };
    bool probed{ false };
    bool supportsRange{ false };

    // Fixed once start() planned them
    std::vector<std::unique_ptr<BlockSlot>> slots;
    std::vector<WorkerReport> reports;

    std::atomic<bool> paused{ false };

    mutable std::mutex stateMutex;
    std::condition_variable controlCv;
    std::condition_variable settledCv;
    TransferState currentState{ TransferState::Idle };
    bool resumePending{ false };
    bool shuttingDown{ false };
    std::string lastErrorMessage;

    std::thread coordinator;
    std::thread startHook;
};
