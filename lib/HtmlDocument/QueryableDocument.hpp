#pragma once

#include <optional>
#include <string>
#include <vector>

// Options for QueryableDocument::queryText.
//
// Matched values are trimmed and empty ones dropped. Then from/to slice the
// sequence (both: [from, to), to only: prefix, from only: suffix), at picks one
// element of what is left, and joinWith joins what is left. Without joinWith the
// element at pos is returned. Negative indices count from the end; an index out
// of range gives no value.
struct TextQuery {
    int pos = 0;
    std::optional<int> at;
    std::optional<int> from;
    std::optional<int> to;
    std::optional<std::string> joinWith;
};

// Collapses runs of whitespace (including U+00A0) to one space and strips both ends.
std::string trimText(const std::string& text);

// A parsed page that answers path queries. Backends only implement select();
// the extraction rules live here so every backend behaves the same.
class QueryableDocument {
   public:
    virtual ~QueryableDocument() = default;

    // Address the document was fetched from
    virtual const std::string& url() const = 0;

    // Trimmed text of every match in document order; never fails on no match.
    std::vector<std::string> queryList(const std::string& path, bool removeEmpty = true) const;

    std::optional<std::string> queryText(const std::string& path, const TextQuery& query = {}) const;

   protected:
    // Raw text of each match in document order; empty when nothing matches.
    virtual std::vector<std::string> select(const std::string& path) const = 0;
};
