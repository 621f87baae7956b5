#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <curl/curl.h>

class ConnectionPool;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::string body;
    std::string effectiveUrl;
    std::optional<std::chrono::seconds> retryAfter;
    int redirectCount = 0;
};

enum class FailureKind {
    Timeout,
    TooManyRedirects,
    ConnectionFailure,
    RequestFailure
};

struct TransportFailure {
    FailureKind kind;
    std::string message;
    // Connection dropped after it was established (send/recv error, empty reply)
    bool dropped = false;
};

// Either a completed response (any status) or a transport-level failure.
struct TransportResult {
    std::optional<HttpResponse> response;
    std::optional<TransportFailure> failure;

    static TransportResult completed(HttpResponse response);
    static TransportResult failed(FailureKind kind, std::string message, bool dropped = false);

    bool ok() const { return response.has_value(); }
};

class HttpTransport {
   public:
    virtual ~HttpTransport() = default;

    // Performs a single attempt. Never retries.
    virtual TransportResult perform(ConnectionPool& pool, const HttpRequest& request) = 0;
};

// libcurl-backed transport; borrows easy handles from the pool.
class CurlTransport : public HttpTransport {
   public:
    static constexpr long MaxRedirects = 30;

    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportResult perform(ConnectionPool& pool, const HttpRequest& request) override;
};

// Response metadata collected from header lines as libcurl delivers them.
struct ResponseHeaders {
    std::string reason;
    std::optional<std::chrono::seconds> retryAfter;
};

// Feeds one raw header line. A status line starts a new response (redirect hop),
// so it clears what earlier hops left behind.
void parseHeaderLine(const std::string& line, ResponseHeaders& headers);

// Maps a failed curl_easy_perform to a transport failure. detail replaces the
// generic curl message when non-empty.
TransportResult classifyCurlError(CURLcode code, const std::string& detail = "");

// Standard reason phrase for a status code, empty when unknown.
std::string reasonPhrase(int status);
