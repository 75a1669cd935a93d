#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::ostream& out, LogLevel minLevel)
    : output(out), minimum(minLevel) {
}

Logger::Logger()
    : Logger(std::cerr) {
}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (running.load())
        return;

    running.store(true);
    worker = std::thread(&Logger::run, this);
}

void Logger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();

    // Anything logged while no worker ran
    std::lock_guard<std::mutex> lock(mtx);
    while (!messages.empty()) {
        output << messages.front() << '\n';
        messages.pop();
    }
    output.flush();
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < minimum.load())
        return;

    std::ostringstream line;
    line << timestamp() << " [" << toString(level) << "] " << msg;
    {
        std::lock_guard<std::mutex> lock(mtx);
        messages.push(line.str());
    }
    cv.notify_one();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            output << messages.front() << '\n';
            messages.pop();
        }
        output.flush();
    }
}

std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream os;
    os << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return os.str();
}
