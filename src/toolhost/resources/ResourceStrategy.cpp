//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceStrategy.cpp
// Purpose: Pagination, byte-window and JSON helpers shared by resource strategies
//==========================================================================================================

#include "toolhost/resources/ResourceStrategy.h"

namespace toolhost {
namespace resources {

JSONValue ResourceListResult::ToJSON() const {
    JSONValue::Array arr;
    for (const auto& item : items) {
        JSONValue::Object o;
        o["uri"] = std::make_shared<JSONValue>(item.uri);
        o["size"] = std::make_shared<JSONValue>(item.size);
        if (item.entries.has_value()) {
            o["entries"] = std::make_shared<JSONValue>(item.entries.value());
        }
        arr.push_back(std::make_shared<JSONValue>(JSONValue{o}));
    }
    JSONValue::Object obj;
    obj["items"] = std::make_shared<JSONValue>(arr);
    obj["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(total));
    obj["page"] = std::make_shared<JSONValue>(static_cast<int64_t>(page));
    obj["pageSize"] = std::make_shared<JSONValue>(static_cast<int64_t>(pageSize));
    return JSONValue{obj};
}

JSONValue ResourceReadResult::ToJSON() const {
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["encoding"] = std::make_shared<JSONValue>(encoding);
    obj["start"] = std::make_shared<JSONValue>(start);
    obj["length"] = std::make_shared<JSONValue>(length);
    obj["total"] = std::make_shared<JSONValue>(total);
    if (mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(mimeType.value());
    }
    return JSONValue{obj};
}

ResourceListResult Paginate(std::vector<ResourceItem> sorted, size_t page, size_t pageSize) {
    if (pageSize == 0) {
        pageSize = kDefaultPageSize;
    }
    ResourceListResult out;
    out.total = sorted.size();
    out.page = page;
    out.pageSize = pageSize;
    // Division keeps huge page or pageSize values from overflowing
    if (sorted.empty() || page > (sorted.size() - 1) / pageSize) {
        return out;
    }
    const size_t begin = page * pageSize;
    const size_t end = begin + std::min(pageSize, sorted.size() - begin);
    out.items.assign(std::make_move_iterator(sorted.begin() + static_cast<std::ptrdiff_t>(begin)),
                     std::make_move_iterator(sorted.begin() + static_cast<std::ptrdiff_t>(end)));
    return out;
}

void ClampWindow(int64_t total, const std::optional<int64_t>& start, const std::optional<int64_t>& length,
                 int64_t& outStart, int64_t& outLength) {
    outStart = std::clamp<int64_t>(start.value_or(0), 0, total);
    const int64_t remaining = total - outStart;
    if (!length.has_value()) {
        outLength = remaining;
        return;
    }
    outLength = std::clamp<int64_t>(length.value(), 0, remaining);
}

size_t ReplaceInvalidUtf8(std::string& text) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    size_t replaced = 0;
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c < 0x80) {
            len = 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;      // overlong
            if (c == 0xED) hi = 0x9F;      // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;      // overlong
            if (c == 0xF4) hi = 0x8F;      // above U+10FFFF
        }
        bool ok = len > 0 && i + len <= n;
        for (size_t k = 1; ok && k < len; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            const unsigned char min = (k == 1) ? lo : 0x80;
            const unsigned char max = (k == 1) ? hi : 0xBF;
            ok = cc >= min && cc <= max;
        }
        if (ok) {
            if (replaced > 0) out.append(text, i, len);
            i += len;
            continue;
        }
        if (replaced == 0) {
            out.reserve(n + 8);
            out.assign(text, 0, i);
        }
        out.append(kReplacement, 3);
        ++replaced;
        ++i;
    }
    if (replaced > 0) {
        text.swap(out);
    }
    return replaced;
}

std::string StripPrefix(const std::string& uri, const std::string& prefix) {
    if (uri.compare(0, prefix.size(), prefix) == 0) {
        return uri.substr(prefix.size());
    }
    return uri;
}

} // namespace resources
} // namespace toolhost
