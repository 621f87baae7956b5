#pragma once

#include <memory>
#include <string>
#include <vector>
#include <libxml/HTMLparser.h>

#include "QueryableDocument.hpp"

// libxml2-backed document answering XPath 1.0 queries.
class HtmlDocument : public QueryableDocument {
   public:
    // Throws std::runtime_error when the bytes do not yield a document.
    static HtmlDocument parse(std::string url, const std::string& html);

    const std::string& url() const override { return _url; }

   protected:
    // Throws std::invalid_argument for a malformed expression.
    std::vector<std::string> select(const std::string& path) const override;

   private:
    struct DocFree {
        void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
    };

    HtmlDocument(std::string url, xmlDocPtr doc);

    std::string _url;
    std::unique_ptr<xmlDoc, DocFree> _doc;
};
