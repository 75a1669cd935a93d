#include "HttpClient.h"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {
struct GetContext {
    const HttpClient::DataCallback* onData = nullptr;
    CURL* handle = nullptr;
    bool rangeFromMiddle = false;
    bool checkedStatus = false;
    bool stopped = false;
    bool ignoredRange = false;
};

struct ProgressContext {
    const HttpClient::AbortCheck* shouldAbort = nullptr;
    bool aborted = false;
};

bool startsWithNoCase(const std::string& text, const char* prefix) {
    const std::size_t n = std::strlen(prefix);
    if (text.size() < n)
        return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string headerValue(const std::string& header, std::size_t nameLength) {
    std::string value = header.substr(nameLength);
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}
}

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    std::size_t total = size * nmemb;

    if (!ctx->checkedStatus) {
        ctx->checkedStatus = true;
        long status = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
        // A 200 here means the whole resource is coming, not our range
        if (ctx->rangeFromMiddle && status == 200) {
            ctx->ignoredRange = true;
            return 0;
        }
    }

    if (!(*ctx->onData)(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

static size_t discardCallback(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

static size_t refuseBodyCallback(char*, size_t, size_t, void* userdata) {
    *static_cast<bool*>(userdata) = true;
    return 0;
}

static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ProgressContext*>(userdata);
    if (*ctx->shouldAbort && (*ctx->shouldAbort)()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* result = static_cast<HttpHeadResult*>(userdata);

    std::string header(buffer, total);

    // Every redirect hop starts a new header block
    if (startsWithNoCase(header, "HTTP/")) {
        result->contentLength = -1;
        result->etag.clear();
        result->acceptRanges = false;
    }
    else if (startsWithNoCase(header, "Content-Length:")) {
        const std::string value = headerValue(header, 15);
        char* endPtr = nullptr;
        const long long parsed = std::strtoll(value.c_str(), &endPtr, 10);
        if (endPtr != value.c_str() && parsed >= 0)
            result->contentLength = parsed;
    }
    else if (startsWithNoCase(header, "ETag:")) {
        result->etag = headerValue(header, 5);
    }
    else if (startsWithNoCase(header, "Accept-Ranges:")) {
        if (headerValue(header, 14).find("bytes") != std::string::npos)
            result->acceptRanges = true;
    }

    return total;
}

std::string formatRange(std::int64_t begin, std::int64_t end) {
    if (begin <= 0 && end == -1)
        return std::string();

    std::ostringstream range;
    range << begin << "-";
    if (end != -1)
        range << end;
    return range.str();
}

CurlHttpClient::CurlHttpClient(const std::string& u, const HttpOptions& opts)
    : url(u), options(opts) {
    curl = curl_easy_init();
    errorBuffer[0] = '\0';
}

CurlHttpClient::~CurlHttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

void CurlHttpClient::applyCommonOptions() {
    CURL* c = static_cast<CURL*>(curl);

    errorBuffer[0] = '\0';
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connectTimeout.count()));

    if (options.stallTimeout.count() > 0) {
        const long seconds = std::max<long>(1, static_cast<long>(options.stallTimeout.count() / 1000));
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, seconds);
    }
}

bool CurlHttpClient::head(HttpHeadResult& out, std::string& error) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        error = "curl_easy_init failed";
        return false;
    }

    curl_easy_reset(c);
    applyCommonOptions();

    out = HttpHeadResult{};
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    // file:// only reports its size as headers when asked for them
    curl_easy_setopt(c, CURLOPT_HEADER, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out);

    CURLcode res = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);

    if (res != CURLE_OK) {
        // Some servers refuse HEAD, ask for the body and hang up after the headers
        if (res == CURLE_HTTP_RETURNED_ERROR && (out.status == 403 || out.status == 405 || out.status == 501))
            return probeWithGet(out, error);

        error = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        return false;
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0)
        out.contentLength = static_cast<std::int64_t>(length);

    return true;
}

bool CurlHttpClient::probeWithGet(HttpHeadResult& out, std::string& error) {
    CURL* c = static_cast<CURL*>(curl);

    curl_easy_reset(c);
    applyCommonOptions();

    out = HttpHeadResult{};
    bool bodyStarted = false;
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, refuseBodyCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &bodyStarted);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out);

    CURLcode res = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);

    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && bodyStarted)) {
        error = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        return false;
    }

    return true;
}

HttpGetStatus CurlHttpClient::get(std::int64_t begin,
    std::int64_t end,
    const DataCallback& onData,
    const AbortCheck& shouldAbort,
    std::string& error) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        error = "curl_easy_init failed";
        return HttpGetStatus::Failed;
    }

    curl_easy_reset(c);
    applyCommonOptions();

    const std::string range = formatRange(begin, end);
    if (!range.empty())
        curl_easy_setopt(c, CURLOPT_RANGE, range.c_str());

    GetContext ctx;
    ctx.onData = &onData;
    ctx.handle = c;
    ctx.rangeFromMiddle = begin > 0;

    ProgressContext progress;
    progress.shouldAbort = &shouldAbort;

    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &progress);

    CURLcode res = curl_easy_perform(c);

    if (ctx.stopped)
        return HttpGetStatus::Stopped;
    if (progress.aborted)
        return HttpGetStatus::Aborted;
    if (ctx.ignoredRange) {
        error = "server ignored range " + range;
        return HttpGetStatus::Failed;
    }
    if (res != CURLE_OK) {
        error = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        return HttpGetStatus::Failed;
    }

    return HttpGetStatus::Ok;
}

HttpClientFactory curlClientFactory(const HttpOptions& options) {
    return [options](const std::string& url) -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>(url, options);
    };
}
