#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "DocumentFetcher.hpp"
#include "QueryableDocument.hpp"
#include "ScrapeError.hpp"
#include "Session.hpp"

// A fetched and parsed page, bound to the address it came from.
class Page {
   public:
    explicit Page(std::unique_ptr<QueryableDocument> document);

    const std::string& url() const { return _document->url(); }

    std::vector<std::string> queryList(const std::string& path, bool removeEmpty = true) const;

    std::optional<std::string> queryText(const std::string& path, const TextQuery& query = {}) const;

    // NotFoundInPage when the path yields no text, nothing otherwise.
    std::optional<ScrapeError> require(const std::string& path) const;

    int lastPageNumber(const std::string& pathPrefix = "") const;

    const QueryableDocument& document() const { return *_document; }

   private:
    std::unique_ptr<QueryableDocument> _document;
};

using PageResult = std::variant<Page, ScrapeError>;

// Base for the per-entity page parsers: one target address, fetched through
// the shared session.
class Scraper {
   public:
    Scraper(Session& session, std::string url);

    const std::string& url() const { return _url; }

    FetchResult makeRequest(const std::optional<std::string>& overrideUrl = std::nullopt);

    // Fetches and parses the target address.
    PageResult requestPage();

    PageResult requestPage(const std::string& url);

   private:
    DocumentFetcher _fetcher;
    std::string _url;
};
