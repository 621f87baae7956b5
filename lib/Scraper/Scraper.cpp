#include "Scraper.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

#include "HtmlDocument.hpp"
#include "Pagination.hpp"

Page::Page(std::unique_ptr<QueryableDocument> document) : _document(std::move(document)) {}

std::vector<std::string> Page::queryList(const std::string& path, bool removeEmpty) const {
    return _document->queryList(path, removeEmpty);
}

std::optional<std::string> Page::queryText(const std::string& path, const TextQuery& query) const {
    return _document->queryText(path, query);
}

std::optional<ScrapeError> Page::require(const std::string& path) const {
    auto text = _document->queryText(path);
    if (!text || text->empty()) {
        spdlog::warn("Required path {} not found in {}", path, url());
        return ScrapeError::notFoundInPage(url());
    }
    return std::nullopt;
}

int Page::lastPageNumber(const std::string& pathPrefix) const {
    return ::lastPageNumber(*_document, pathPrefix);
}

Scraper::Scraper(Session& session, std::string url) : _fetcher(session), _url(std::move(url)) {}

FetchResult Scraper::makeRequest(const std::optional<std::string>& overrideUrl) {
    return _fetcher.fetch(_url, overrideUrl);
}

PageResult Scraper::requestPage() {
    return requestPage(_url);
}

PageResult Scraper::requestPage(const std::string& url) {
    FetchResult fetched = makeRequest(url);
    if (auto* error = std::get_if<ScrapeError>(&fetched)) {
        return *error;
    }
    const HttpResponse& response = std::get<HttpResponse>(fetched);
    try {
        auto document = std::make_unique<HtmlDocument>(HtmlDocument::parse(url, response.body));
        return Page(std::move(document));
    } catch (const std::runtime_error& e) {
        spdlog::error("Parsing {} failed: {}", url, e.what());
        return ScrapeError::unexpectedFailure(url, e.what());
    }
}
