#include "QueryableDocument.hpp"

#include <algorithm>

namespace {

bool isSpace(const std::string& text, size_t i, size_t& width) {
    unsigned char c = text[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
        width = 1;
        return true;
    }
    // U+00A0 NO-BREAK SPACE
    if (c == 0xC2 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xA0) {
        width = 2;
        return true;
    }
    return false;
}

std::optional<size_t> resolveIndex(int index, size_t size) {
    long long resolved = index < 0 ? static_cast<long long>(size) + index : index;
    if (resolved < 0 || resolved >= static_cast<long long>(size)) {
        return std::nullopt;
    }
    return static_cast<size_t>(resolved);
}

size_t clampBound(int bound, size_t size) {
    long long resolved = bound < 0 ? static_cast<long long>(size) + bound : bound;
    resolved = std::max(0LL, std::min(resolved, static_cast<long long>(size)));
    return static_cast<size_t>(resolved);
}

std::vector<std::string> slice(const std::vector<std::string>& items, std::optional<int> from,
                               std::optional<int> to) {
    size_t begin = from ? clampBound(*from, items.size()) : 0;
    size_t end = to ? clampBound(*to, items.size()) : items.size();
    if (begin >= end) {
        return {};
    }
    return std::vector<std::string>(items.begin() + begin, items.begin() + end);
}

}  // namespace

std::string trimText(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pendingSpace = false;
    for (size_t i = 0; i < text.size();) {
        size_t width = 0;
        if (isSpace(text, i, width)) {
            pendingSpace = !result.empty();
            i += width;
            continue;
        }
        if (pendingSpace) {
            result += ' ';
            pendingSpace = false;
        }
        result += text[i];
        ++i;
    }
    return result;
}

std::vector<std::string> QueryableDocument::queryList(const std::string& path,
                                                      bool removeEmpty) const {
    std::vector<std::string> values;
    for (const std::string& raw : select(path)) {
        std::string value = trimText(raw);
        if (removeEmpty && value.empty()) {
            continue;
        }
        values.push_back(std::move(value));
    }
    return values;
}

std::optional<std::string> QueryableDocument::queryText(const std::string& path,
                                                        const TextQuery& query) const {
    std::vector<std::string> matches = select(path);
    if (matches.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> items;
    for (const std::string& raw : matches) {
        std::string value = trimText(raw);
        if (!value.empty()) {
            items.push_back(std::move(value));
        }
    }

    if (query.from || query.to) {
        items = slice(items, query.from, query.to);
    }

    if (query.at) {
        auto index = resolveIndex(*query.at, items.size());
        if (!index) {
            return std::nullopt;
        }
        items = {items[*index]};
    }

    if (query.joinWith) {
        std::string joined;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                joined += *query.joinWith;
            }
            joined += items[i];
        }
        return joined;
    }

    auto index = resolveIndex(query.pos, items.size());
    if (!index) {
        return std::nullopt;
    }
    return items[*index];
}
