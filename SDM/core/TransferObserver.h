#pragma once
#include <string>

#include "utils.h"

// Lifecycle hooks of a transfer.
//
// onStart runs on its own thread and may stay busy (a progress loop, say);
// the engine never waits for it. onPause, onResume and onFinish run on the
// coordinator thread. onError may be called from any block worker, so
// implementations must be thread-safe and return promptly.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void onStart() = 0;
    virtual void onPause() = 0;
    virtual void onResume() = 0;
    virtual void onFinish() = 0;
    virtual void onError(TransferError code, const std::string& message) = 0;
};

// Ignores everything; handy for headless use.
class NullTransferObserver : public TransferObserver {
public:
    void onStart() override {}
    void onPause() override {}
    void onResume() override {}
    void onFinish() override {}
    void onError(TransferError, const std::string&) override {}
};
