#pragma once

#include <stdexcept>
#include <string>

#include "QueryableDocument.hpp"

namespace PaginationPaths {
// Appended to the caller's prefix; tried in this order
inline const std::string LastPage =
    "//li[contains(@class,'tm-pagination__list-item--icon-last-page')]/a/@href";
inline const std::string ActivePage =
    "//li[contains(@class,'tm-pagination__list-item--active')]/a/@href";
}  // namespace PaginationPaths

// The page markup carried something that should have been a page number.
class PageStructureError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Last page of a paginated listing, or 1 when the page has no pagination.
// Throws PageStructureError when the link text holds no positive page number.
int lastPageNumber(const QueryableDocument& document, const std::string& pathPrefix = "");

// Page number at the end of a pagination link: last '='-separated segment,
// then its last '/'-separated segment.
int parsePageNumber(const std::string& link);
