#pragma once
#include <condition_variable>
#include <mutex>
#include <ostream>

#include "../core/TransferObserver.h"
#include "../monitor/TransferStatus.h"

// Draws a one-line progress bar while the transfer runs. onStart is the
// drawing loop; it returns once close() is called.
class ConsoleObserver : public TransferObserver {
public:
    explicit ConsoleObserver(std::ostream& out);

    void attach(const TransferStatus& status);
    void close();

    void onStart() override;
    void onPause() override;
    void onResume() override;
    void onFinish() override;
    void onError(TransferError code, const std::string& message) override;

private:
    void draw(const char* label);

private:
    std::ostream& output;
    const TransferStatus* status{ nullptr };

    std::mutex mtx;
    std::condition_variable cv;
    bool paused{ false };
    bool finished{ false };
    bool closed{ false };
};
