#include "TransferController.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <system_error>

TransferController::TransferController(const TransferConfig& config,
    ByteSink& sink,
    TransferObserver& observer,
    HttpClientFactory clientFactory,
    Logger* externalLogger)
    : cfg(config),
    byteSink(sink),
    events(observer),
    ownedLogger(externalLogger ? std::unique_ptr<Logger>()
        : std::make_unique<Logger>(std::cerr, config.verbose ? LogLevel::Debug : LogLevel::Warn)),
    logger(externalLogger ? *externalLogger : *ownedLogger),
    speedMonitor(transferStatus, config.speedInterval)
{
    if (ownedLogger)
        ownedLogger->start();

    if (!clientFactory) {
        HttpOptions options;
        options.connectTimeout = cfg.connectTimeout;
        options.stallTimeout = cfg.stallTimeout;
        clientFactory = curlClientFactory(options);
    }

    const std::size_t poolSize = std::clamp<std::size_t>(cfg.parallelism, 1, TransferConfig::maxParallelism);
    connectionPool = std::make_unique<ConnectionPool>(cfg.url, poolSize, std::move(clientFactory));
    fetcher = std::make_unique<RangeFetcher>(*connectionPool, byteSink, transferStatus, paused, cfg.chunkSize);
}

TransferController::~TransferController() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        shuttingDown = true;
        paused.store(true);
    }
    controlCv.notify_all();

    if (coordinator.joinable())
        coordinator.join();
    if (startHook.joinable())
        startHook.join();

    speedMonitor.stop();

    if (ownedLogger)
        ownedLogger->stop();
}

bool TransferController::probe() {
    HttpHeadResult head{};
    std::string error;

    auto client = connectionPool->acquire();
    const bool ok = client->head(head, error);
    connectionPool->release(std::move(client));

    if (!ok) {
        const std::string message = "probe of " + cfg.url + " failed: " + error;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            lastErrorMessage = message;
        }
        logger.error(message);
        events.onError(TransferError::Probe, message);
        return false;
    }

    totalBytes = head.contentLength >= 0 ? head.contentLength : -1;
    supportsRange = head.acceptRanges;
    probed = true;
    transferStatus.setTotal(totalBytes);

    std::ostringstream os;
    os << "Probed " << cfg.url << ": size "
        << (totalBytes >= 0 ? std::to_string(totalBytes) : std::string("unknown"))
        << ", ranges " << (supportsRange ? "yes" : "no");
    if (!head.etag.empty())
        os << ", etag " << head.etag;
    logger.info(os.str());

    return true;
}

bool TransferController::start() {
    std::lock_guard<std::mutex> lock(stateMutex);

    if (currentState != TransferState::Idle) {
        lastErrorMessage = "start: transfer is already " + std::string(toString(currentState));
        return false;
    }
    if (!probed) {
        lastErrorMessage = "start: no successful probe";
        return false;
    }

    std::size_t parallelism = cfg.parallelism;
    if (parallelism > TransferConfig::maxParallelism) {
        logger.warn("Parallelism " + std::to_string(parallelism) + " capped at " +
            std::to_string(TransferConfig::maxParallelism));
        parallelism = TransferConfig::maxParallelism;
    }

    // Without range support only a single block starting at 0 is safe
    if (!supportsRange && totalBytes > 0 && parallelism > 1) {
        logger.warn("Server does not advertise byte ranges, using a single block");
        parallelism = 1;
    }

    for (const Block& block : planBlocks(totalBytes, parallelism))
        slots.push_back(std::make_unique<BlockSlot>(block));

    std::ostringstream plan;
    plan << "Planned " << slots.size() << " block(s):";
    for (const auto& slot : slots)
        plan << " [" << slot->begin.load() << ", " << slot->end << "]";
    logger.debug(plan.str());

    paused.store(false);
    currentState = TransferState::Running;
    speedMonitor.start();

    startHook = std::thread([this]() { events.onStart(); });
    coordinator = std::thread(&TransferController::coordinatorLoop, this);
    return true;
}

void TransferController::pause() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (currentState != TransferState::Running)
            return;
        paused.store(true);
        resumePending = false;
        speedMonitor.stop();
    }
    controlCv.notify_all();

    logger.info("Pause requested");
}

TransferError TransferController::resume() {
    std::unique_lock<std::mutex> lock(stateMutex);

    if (slots.empty()) {
        const std::string message = "resume: no blocks, transfer was never started";
        lastErrorMessage = message;
        lock.unlock();

        logger.error(message);
        events.onError(TransferError::NoBlocks, message);
        return TransferError::NoBlocks;
    }

    switch (currentState) {
    case TransferState::Paused:
    case TransferState::Failed:
        currentState = TransferState::Running;
        break;
    case TransferState::Running:
        // A pause that has not settled yet is withdrawn
        if (!paused.load())
            return TransferError::None;
        break;
    default:
        return TransferError::None;
    }

    paused.store(false);
    resumePending = true;
    speedMonitor.start();
    lock.unlock();
    controlCv.notify_all();

    logger.info("Resume requested");
    return TransferError::None;
}

bool TransferController::waitForSettled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex);
    return settledCv.wait_for(lock, timeout, [this]() {
        return currentState != TransferState::Running;
        });
}

TransferState TransferController::state() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentState;
}

std::vector<Block> TransferController::blocks() const {
    std::lock_guard<std::mutex> lock(stateMutex);

    std::vector<Block> out;
    out.reserve(slots.size());
    for (const auto& slot : slots)
        out.push_back(slot->snapshot());
    return out;
}

std::string TransferController::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return lastErrorMessage;
}

void TransferController::coordinatorLoop() {
    const auto startTime = std::chrono::steady_clock::now();
    const std::uint64_t startBytes = transferStatus.downloaded();

    for (;;) {
        std::string dispatchError;
        const bool dispatched = runRound(dispatchError);

        std::size_t doneBlocks = 0;
        std::size_t gaveUp = 0;
        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (slots[i]->complete())
                ++doneBlocks;
            if (reports[i].gaveUp)
                ++gaveUp;
        }

        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (shuttingDown)
                return;
        }

        std::ostringstream round;
        round << "Round settled: blocks " << doneBlocks << "/" << slots.size()
            << ", downloaded " << transferStatus.downloaded() << " bytes";
        logger.debug(round.str());

        const bool wasPaused = paused.load();

        if (!wasPaused && doneBlocks == slots.size()) {
            speedMonitor.stop();

            const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;
            const std::uint64_t bytes = transferStatus.downloaded() - startBytes;
            const double avgSpeed = duration.count() > 0 ? static_cast<double>(bytes) / duration.count() : 0.0;

            std::ostringstream conclusion;
            conclusion << "Transfer completed in " << std::fixed << std::setprecision(2)
                << duration.count() << "s, " << transferStatus.downloaded() << " bytes, avg speed "
                << std::setprecision(2) << (avgSpeed * 8.0 / 1'000'000.0)
                << " Mbps, blocks " << slots.size();
            logger.info(conclusion.str());

            events.onFinish();
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                // a pause/resume pair that raced the decision may have restarted it
                speedMonitor.stop();
                currentState = TransferState::Finished;
            }
            settledCv.notify_all();
            return;
        }

        speedMonitor.stop();

        TransferState parkAs = TransferState::Paused;
        if (!wasPaused && !dispatched) {
            const std::string message = "could not launch block workers: " + dispatchError;
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                lastErrorMessage = message;
            }
            logger.error("Transfer failed: " + message);
            events.onError(TransferError::Dispatch, message);
            parkAs = TransferState::Failed;
        }
        else if (!wasPaused && gaveUp > 0) {
            const std::string message = std::to_string(gaveUp) + " block(s) gave up, " +
                std::to_string(slots.size() - doneBlocks) + " incomplete";
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                lastErrorMessage = message;
            }
            logger.error("Transfer failed: " + message);
            events.onError(TransferError::RetriesExhausted, message);
            parkAs = TransferState::Failed;
        }
        else {
            logger.info("Transfer paused at " + std::to_string(transferStatus.downloaded()) + " bytes");
            events.onPause();
        }

        if (!parkUntilResumed(parkAs))
            return;

        {
            // resume() may have started it before this round settled
            std::lock_guard<std::mutex> lock(stateMutex);
            if (!paused.load())
                speedMonitor.start();
        }
        logger.info("Transfer resumed");
        events.onResume();
    }
}

bool TransferController::runRound(std::string& error) {
    reports.assign(slots.size(), WorkerReport{});

    WorkerGroup group;
    try {
        group.start(slots.size(), [this](std::size_t index) { runBlock(index); });
    }
    catch (const std::system_error& e) {
        // Workers already launched finish their blocks before the round settles
        error = e.what();
        group.wait();
        return false;
    }
    group.wait();
    return true;
}

void TransferController::runBlock(std::size_t index) {
    BlockSlot& slot = *slots[index];
    WorkerReport& report = reports[index];
    report.blockIndex = index;

    std::size_t failures = 0;
    std::size_t writeFailures = 0;

    while (!paused.load()) {
        if (failures > 0) {
            if (!cfg.retry.allowsAttempt(failures)) {
                report.gaveUp = true;
                break;
            }
            sleepUnlessPaused(cfg.retry.delayBefore(failures));
            if (paused.load())
                break;
        }

        ++report.attempts;
        const FetchResult result = fetcher->fetch(slot);

        if (result.error == TransferError::None) {
            if (result.completed) {
                report.completed = true;
                break;
            }
            // Stopped at a checkpoint, the loop condition decides
            continue;
        }

        ++failures;
        writeFailures = result.error == TransferError::Write ? writeFailures + 1 : 0;
        report.lastError = result.error;
        report.error = result.message;

        std::ostringstream os;
        os << "block " << index << " attempt " << report.attempts << ": "
            << toString(result.error) << ": " << result.message;
        logger.warn(os.str());
        reportError(result.error, os.str());

        if (result.error == TransferError::Write && cfg.retry.writeFailuresExhausted(writeFailures)) {
            report.gaveUp = true;
            break;
        }
    }
}

bool TransferController::parkUntilResumed(TransferState parkedAs) {
    std::unique_lock<std::mutex> lock(stateMutex);

    while (!resumePending && !shuttingDown) {
        currentState = parkedAs;
        settledCv.notify_all();
        controlCv.wait(lock);
    }

    if (shuttingDown)
        return false;

    resumePending = false;
    currentState = TransferState::Running;
    return true;
}

void TransferController::reportError(TransferError code, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        lastErrorMessage = message;
    }
    events.onError(code, message);
}

void TransferController::sleepUnlessPaused(std::chrono::milliseconds delay) {
    if (delay.count() <= 0)
        return;

    std::unique_lock<std::mutex> lock(stateMutex);
    controlCv.wait_for(lock, delay, [this]() { return paused.load() || shuttingDown; });
}
