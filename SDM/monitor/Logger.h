#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <ostream>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

const char* toString(LogLevel level);

// Asynchronous line logger: callers enqueue, one background thread writes.
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel minLevel = LogLevel::Info);
    Logger();
    ~Logger();

    void start();
    void stop();

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void error(const std::string& msg) { log(LogLevel::Error, msg); }

private:
    void run();
    static std::string timestamp();

private:
    std::ostream& output;
    std::atomic<LogLevel> minimum;

    std::queue<std::string> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> running{ false };
    std::thread worker;
};
