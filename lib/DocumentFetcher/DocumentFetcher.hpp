#pragma once

#include <optional>
#include <string>
#include <variant>

#include "HttpTransport.hpp"
#include "ScrapeError.hpp"
#include "Session.hpp"

using FetchResult = std::variant<HttpResponse, ScrapeError>;

class DocumentFetcher {
   public:
    static constexpr const char* UserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
        "AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/113.0.0.0 "
        "Safari/537.36";

    explicit DocumentFetcher(Session& session);

    // GET the target (or overrideUrl when given), paced and retried through the
    // session, and classify the final outcome.
    FetchResult fetch(const std::string& target,
                      const std::optional<std::string>& overrideUrl = std::nullopt);

   private:
    FetchResult classify(const std::string& url, const TransportResult& result) const;

    Session& _session;
};
