#include "Pagination.hpp"

#include <spdlog/spdlog.h>
#include <cctype>

int parsePageNumber(const std::string& link) {
    size_t eq = link.rfind('=');
    std::string segment = eq == std::string::npos ? link : link.substr(eq + 1);
    size_t slash = segment.rfind('/');
    if (slash != std::string::npos) {
        segment = segment.substr(slash + 1);
    }
    segment = trimText(segment);

    if (segment.empty() || segment.size() > 9) {
        throw PageStructureError("Malformed page number '" + segment + "' in link '" + link + "'");
    }
    int page = 0;
    for (unsigned char c : segment) {
        if (!std::isdigit(c)) {
            throw PageStructureError("Malformed page number '" + segment + "' in link '" + link +
                                     "'");
        }
        page = page * 10 + (c - '0');
    }
    if (page < 1) {
        throw PageStructureError("Page number must be positive in link '" + link + "'");
    }
    return page;
}

int lastPageNumber(const QueryableDocument& document, const std::string& pathPrefix) {
    for (const std::string& suffix : {PaginationPaths::LastPage, PaginationPaths::ActivePage}) {
        auto link = document.queryText(pathPrefix + suffix);
        if (link) {
            int page = parsePageNumber(*link);
            spdlog::debug("Last page of {} is {}", document.url(), page);
            return page;
        }
    }
    return 1;
}
