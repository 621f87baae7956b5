#include "DocumentFetcher.hpp"

#include <spdlog/spdlog.h>
#include <exception>

DocumentFetcher::DocumentFetcher(Session& session) : _session(session) {}

FetchResult DocumentFetcher::fetch(const std::string& target,
                                   const std::optional<std::string>& overrideUrl) {
    const std::string url = overrideUrl && !overrideUrl->empty() ? *overrideUrl : target;

    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.timeout = _session.settings().requestTimeout;
    request.headers["User-Agent"] = UserAgent;
    request.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";

    RatePacer& pacer = _session.pacer();
    pacer.awaitTurn();
    spdlog::debug("GET {}", url);

    FetchResult outcome;
    try {
        TransportResult result = _session.pool().send(request);
        pacer.recordCompletion();
        outcome = classify(url, result);
    } catch (const std::exception& e) {
        pacer.recordCompletion();
        outcome = ScrapeError::unexpectedFailure(url, e.what());
    } catch (...) {
        pacer.recordCompletion();
        outcome = ScrapeError::unexpectedFailure(url, "unknown exception");
    }

    if (auto* error = std::get_if<ScrapeError>(&outcome)) {
        spdlog::error("{} fetching {}: {}", error->kindName(), url, error->message());
    }
    return outcome;
}

FetchResult DocumentFetcher::classify(const std::string& url, const TransportResult& result) const {
    if (!result.ok()) {
        const TransportFailure& failure = *result.failure;
        switch (failure.kind) {
            case FailureKind::Timeout:
                return ScrapeError::timedOut(url, _session.settings().requestTimeout);
            case FailureKind::TooManyRedirects:
                return ScrapeError::tooManyRedirects(url);
            case FailureKind::ConnectionFailure:
                return ScrapeError::connectionFailure(url, failure.message);
            case FailureKind::RequestFailure:
            default:
                return ScrapeError::requestFailure(url, failure.message);
        }
    }

    const HttpResponse& response = *result.response;
    if (response.status >= 400 && response.status < 500) {
        return ScrapeError::clientError(url, response.status, response.reason);
    }
    if (response.status >= 500 && response.status < 600) {
        return ScrapeError::serverError(url, response.status, response.reason);
    }
    spdlog::debug("{} {} for {} ({} bytes)", response.status, response.reason, url,
                  response.body.size());
    return response;
}
