#include "HtmlDocument.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace {

// xmlInitParser must run once, on one thread, before documents are parsed
// concurrently. The parser is never cleaned up; documents may outlive statics.
class LibXmlGlobal {
   public:
    static LibXmlGlobal& getInstance() {
        static LibXmlGlobal instance;
        return instance;
    }

   private:
    LibXmlGlobal() { xmlInitParser(); }
    LibXmlGlobal(const LibXmlGlobal&) = delete;
    LibXmlGlobal& operator=(const LibXmlGlobal&) = delete;
};

const int HtmlParseFlags =
    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

class XPathContextGuard {
   public:
    explicit XPathContextGuard(xmlXPathContextPtr ctx) : _ctx(ctx) {}
    ~XPathContextGuard() {
        if (_ctx) {
            xmlXPathFreeContext(_ctx);
        }
    }
    XPathContextGuard(const XPathContextGuard&) = delete;
    XPathContextGuard& operator=(const XPathContextGuard&) = delete;

    xmlXPathContextPtr get() const { return _ctx; }

   private:
    xmlXPathContextPtr _ctx;
};

class XPathObjectGuard {
   public:
    explicit XPathObjectGuard(xmlXPathObjectPtr obj) : _obj(obj) {}
    ~XPathObjectGuard() {
        if (_obj) {
            xmlXPathFreeObject(_obj);
        }
    }
    XPathObjectGuard(const XPathObjectGuard&) = delete;
    XPathObjectGuard& operator=(const XPathObjectGuard&) = delete;

    xmlXPathObjectPtr get() const { return _obj; }

   private:
    xmlXPathObjectPtr _obj;
};

// Keeps XPath errors off stderr and remembers the first message
void collectXPathError(void* userData, xmlErrorPtr error) {
    auto* message = static_cast<std::string*>(userData);
    if (message->empty() && error && error->message) {
        *message = error->message;
        while (!message->empty() && message->back() == '\n') {
            message->pop_back();
        }
    }
}

std::string nodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

std::string formatNumber(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    return std::to_string(value);
}

}  // namespace

HtmlDocument::HtmlDocument(std::string url, xmlDocPtr doc) : _url(std::move(url)), _doc(doc) {}

HtmlDocument HtmlDocument::parse(std::string url, const std::string& html) {
    LibXmlGlobal::getInstance();
    htmlDocPtr doc = htmlReadMemory(html.data(), static_cast<int>(html.size()), url.c_str(),
                                    nullptr, HtmlParseFlags);
    if (!doc) {
        throw std::runtime_error("Unable to parse the document at " + url);
    }
    spdlog::debug("Parsed {} bytes from {}", html.size(), url);
    return HtmlDocument(std::move(url), doc);
}

std::vector<std::string> HtmlDocument::select(const std::string& path) const {
    XPathContextGuard context(xmlXPathNewContext(_doc.get()));
    if (!context.get()) {
        throw std::runtime_error("Unable to create an XPath context for " + _url);
    }
    std::string errorMessage;
    context.get()->userData = &errorMessage;
    context.get()->error = collectXPathError;

    XPathObjectGuard result(
        xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(path.c_str()), context.get()));
    if (!result.get()) {
        throw std::invalid_argument("Invalid XPath expression '" + path + "'" +
                                    (errorMessage.empty() ? "" : ": " + errorMessage));
    }

    std::vector<std::string> values;
    xmlXPathObjectPtr obj = result.get();
    switch (obj->type) {
        case XPATH_NODESET:
            if (obj->nodesetval) {
                for (int i = 0; i < obj->nodesetval->nodeNr; ++i) {
                    values.push_back(nodeText(obj->nodesetval->nodeTab[i]));
                }
            }
            break;
        case XPATH_STRING:
            if (obj->stringval && obj->stringval[0]) {
                values.emplace_back(reinterpret_cast<const char*>(obj->stringval));
            }
            break;
        case XPATH_NUMBER:
            values.push_back(formatNumber(obj->floatval));
            break;
        case XPATH_BOOLEAN:
            if (obj->boolval) {
                values.emplace_back("true");
            }
            break;
        default:
            break;
    }
    return values;
}
