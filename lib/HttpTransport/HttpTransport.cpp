#include "HttpTransport.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>

#include "ConnectionPool.hpp"
#include "StringUtils.hpp"

namespace {

// curl_global_init must run once per process, before any handle exists.
class CurlGlobal {
   public:
    static CurlGlobal& getInstance() {
        static CurlGlobal instance;
        return instance;
    }

   private:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    parseHeaderLine(std::string(buffer, total), *static_cast<ResponseHeaders*>(userdata));
    return total;
}

}  // namespace

void parseHeaderLine(const std::string& raw, ResponseHeaders& headers) {
    std::string line = trim(raw);

    if (line.compare(0, 5, "HTTP/") == 0) {
        headers.reason.clear();
        headers.retryAfter.reset();
        size_t codeStart = line.find(' ');
        size_t reasonStart =
            codeStart == std::string::npos ? std::string::npos : line.find(' ', codeStart + 1);
        if (reasonStart != std::string::npos) {
            headers.reason = trim(line.substr(reasonStart + 1));
        }
        return;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    std::string name = trim(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name == "retry-after") {
        // Only the delta-seconds form; HTTP dates fall back to the computed backoff
        std::string value = trim(line.substr(colon + 1));
        if (!value.empty() && value.size() <= 9 && std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            headers.retryAfter = std::chrono::seconds(std::stoll(value));
        }
    }
}

TransportResult classifyCurlError(CURLcode code, const std::string& detail) {
    std::string message = detail.empty() ? curl_easy_strerror(code) : detail;
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportResult::failed(FailureKind::Timeout, message);
        case CURLE_TOO_MANY_REDIRECTS:
            return TransportResult::failed(FailureKind::TooManyRedirects, message);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return TransportResult::failed(FailureKind::ConnectionFailure, message);
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportResult::failed(FailureKind::ConnectionFailure, message, true);
        default:
            return TransportResult::failed(FailureKind::RequestFailure, message);
    }
}

TransportResult TransportResult::completed(HttpResponse response) {
    TransportResult result;
    result.response = std::move(response);
    return result;
}

TransportResult TransportResult::failed(FailureKind kind, std::string message, bool dropped) {
    TransportResult result;
    result.failure = TransportFailure{kind, std::move(message), dropped};
    return result;
}

CurlTransport::CurlTransport() {
    CurlGlobal::getInstance();
}

CurlTransport::~CurlTransport() = default;

TransportResult CurlTransport::perform(ConnectionPool& pool, const HttpRequest& request) {
    // A timeout curl rejects would leave the request without a deadline
    if (request.timeout.count() <= 0 ||
        request.timeout.count() > std::numeric_limits<long>::max()) {
        return TransportResult::failed(FailureKind::RequestFailure,
                                       "Invalid timeout of " +
                                           std::to_string(request.timeout.count()) + "ms");
    }

    PooledHandle handle = pool.acquire(request.url);
    if (!handle) {
        return TransportResult::failed(FailureKind::RequestFailure, "Failed to acquire curl handle");
    }
    CURL* curl = handle.get();

    long timeoutMs = static_cast<long>(request.timeout.count());
    if (curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs) != CURLE_OK ||
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs) != CURLE_OK) {
        return TransportResult::failed(FailureKind::RequestFailure,
                                       "Rejected timeout of " + std::to_string(timeoutMs) + "ms");
    }

    std::string body;
    ResponseHeaders headerData;
    char errorBuffer[CURL_ERROR_SIZE];
    errorBuffer[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headerData);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MaxRedirects);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        if (name == "User-Agent") {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, value.c_str());
            continue;
        }
        std::string line = name + ": " + value;
        headers = curl_slist_append(headers, line.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);

    // The handle goes back to the pool; the list must not outlive this call
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, static_cast<struct curl_slist*>(nullptr));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, static_cast<char*>(nullptr));
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        spdlog::debug("curl error {} for {}: {}", static_cast<int>(res), request.url,
                      curl_easy_strerror(res));
        return classifyCurlError(res, errorBuffer);
    }

    HttpResponse response;
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    char* effectiveUrl = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl);
    response.effectiveUrl = effectiveUrl ? effectiveUrl : request.url;

    long redirects = 0;
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
    response.redirectCount = static_cast<int>(redirects);

    response.reason = headerData.reason.empty() ? reasonPhrase(response.status) : headerData.reason;
    response.retryAfter = headerData.retryAfter;
    response.body = std::move(body);
    return TransportResult::completed(std::move(response));
}

std::string reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 410: return "Gone";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}
