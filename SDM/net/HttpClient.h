#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include <cstdint>

struct HttpHeadResult {
    std::int64_t contentLength = -1;
    std::string etag;
    bool acceptRanges = false;
    long status = 0;
};

struct HttpOptions {
    std::chrono::milliseconds connectTimeout{ 15000 };
    std::chrono::milliseconds stallTimeout{ 30000 };
};

enum class HttpGetStatus {
    Ok,       // body read to the end
    Stopped,  // onData returned false
    Aborted,  // shouldAbort returned true
    Failed
};

class HttpClient {
public:
    // Return false to stop the transfer early
    using DataCallback = std::function<bool(const char*, std::size_t)>;
    using AbortCheck = std::function<bool()>;

    virtual ~HttpClient() = default;

    virtual bool head(HttpHeadResult& out, std::string& error) = 0;

    // GET bytes [begin, end] of the resource. end == -1 reads to the end,
    // and begin == 0 with end == -1 sends no Range header at all.
    virtual HttpGetStatus get(std::int64_t begin,
        std::int64_t end,
        const DataCallback& onData,
        const AbortCheck& shouldAbort,
        std::string& error) = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>(const std::string& url)>;

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient(const std::string& url, const HttpOptions& options);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    bool head(HttpHeadResult& out, std::string& error) override;
    HttpGetStatus get(std::int64_t begin,
        std::int64_t end,
        const DataCallback& onData,
        const AbortCheck& shouldAbort,
        std::string& error) override;

private:
    bool probeWithGet(HttpHeadResult& out, std::string& error);
    void applyCommonOptions();

private:
    void* curl;
    std::string url;
    HttpOptions options;
    char errorBuffer[256];
};

HttpClientFactory curlClientFactory(const HttpOptions& options);

// "bytes=<begin>-<end>" style value without the "bytes=" prefix, empty when no range applies
std::string formatRange(std::int64_t begin, std::int64_t end);
