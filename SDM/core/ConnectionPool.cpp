#include "ConnectionPool.h"

ConnectionPool::ConnectionPool(const std::string& u, std::size_t maxSize, HttpClientFactory factory)
    : maxPoolSize(maxSize), url(u), makeClient(std::move(factory)) {
}

std::unique_ptr<HttpClient> ConnectionPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mtx);

        if (!pool.empty()) {
            auto client = std::move(pool.front());
            pool.pop();
            return client;
        }
    }

    return makeClient(url);
}

void ConnectionPool::release(std::unique_ptr<HttpClient> client) {
    if (!client)
        return;

    std::lock_guard<std::mutex> lock(mtx);

    if (pool.size() < maxPoolSize) {
        pool.push(std::move(client));
    }
}

std::size_t ConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pool.size();
}
