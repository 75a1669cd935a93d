#pragma once
#include <queue>
#include <memory>
#include <mutex>

#include "../net/HttpClient.h"

// Recycles HTTP clients between fetch attempts so keep-alive connections
// survive retries and pause/resume rounds.
class ConnectionPool {
public:
    ConnectionPool(const std::string& url, std::size_t maxSize, HttpClientFactory factory);

    std::unique_ptr<HttpClient> acquire();
    void release(std::unique_ptr<HttpClient> client);

    std::size_t idle() const;

private:
    std::size_t maxPoolSize;
    std::string url;
    HttpClientFactory makeClient;
    std::queue<std::unique_ptr<HttpClient>> pool;
    mutable std::mutex mtx;
};
