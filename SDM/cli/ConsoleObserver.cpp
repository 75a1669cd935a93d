#include "ConsoleObserver.h"

#include <chrono>
#include <string>

ConsoleObserver::ConsoleObserver(std::ostream& out)
    : output(out) {
}

void ConsoleObserver::attach(const TransferStatus& s) {
    std::lock_guard<std::mutex> lock(mtx);
    status = &s;
}

void ConsoleObserver::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
    }
    cv.notify_all();
}

void ConsoleObserver::onStart() {
    std::unique_lock<std::mutex> lock(mtx);
    output << "download started\n";

    while (!closed) {
        cv.wait_for(lock, std::chrono::seconds(1));
        if (finished) {
            draw("[FINISH]");
            output << "\ndownload finished\n";
            output.flush();
            return;
        }
        draw(paused ? "[PAUSE]" : "[DOWNLOADING]");
    }
    output << "\n";
}

void ConsoleObserver::onPause() {
    std::lock_guard<std::mutex> lock(mtx);
    paused = true;
}

void ConsoleObserver::onResume() {
    std::lock_guard<std::mutex> lock(mtx);
    paused = false;
}

void ConsoleObserver::onFinish() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        finished = true;
    }
    cv.notify_all();
}

void ConsoleObserver::onError(TransferError code, const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx);
    output << "\033[2K\r" << toString(code) << ": " << message << "\n";
}

void ConsoleObserver::draw(const char* label) {
    if (!status)
        return;

    const int width = 50;
    const std::uint64_t downloaded = status->downloaded();
    const std::int64_t total = status->total();
    int filled = static_cast<int>(status->progress() * width);
    if (filled > width)
        filled = width;

    output << "\033[2K\r" << downloaded << "/"
        << (total >= 0 ? std::to_string(total) : std::string("?"))
        << " [" << std::string(filled, '=') << std::string(width - filled, ' ') << "] "
        << (paused || finished ? 0 : status->speed()) << " byte/s " << label;
    output.flush();
}
