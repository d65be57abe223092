//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framing
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string_view>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"

namespace toolhost {

namespace {

constexpr std::string_view kHeaderEnd = "\r\n\r\n";
constexpr std::string_view kLineEnd = "\r\n";

std::string_view trim(std::string_view v) {
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
    return v;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size());
        frame.append(kHeaderEnd);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::size_t headerEnd = buffer.find(kHeaderEnd);
        if (headerEnd == std::string::npos) {
            return {DecodeStatus::Incomplete, std::nullopt, 0};
        }
        const std::size_t bodyStart = headerEnd + kHeaderEnd.size();
        const std::string_view header(buffer.data(), headerEnd);

        std::optional<std::size_t> contentLength;
        std::size_t pos = 0;
        while (pos <= header.size()) {
            std::size_t eol = header.find(kLineEnd, pos);
            if (eol == std::string_view::npos) eol = header.size();
            std::string_view line = header.substr(pos, eol - pos);
            pos = eol + kLineEnd.size();

            auto colon = line.find(':');
            if (colon == std::string_view::npos) continue;
            if (!equalsIgnoreCase(trim(line.substr(0, colon)), "content-length")) continue;

            std::string_view value = trim(line.substr(colon + 1));
            unsigned long long parsed = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec == std::errc::result_out_of_range) {
                LOG_WARN("Content-Length out of range: {}", value);
                return {DecodeStatus::BodyTooLarge, std::nullopt, bodyStart};
            }
            if (ec != std::errc() || end != value.data() + value.size() || value.empty()) {
                LOG_WARN("Invalid Content-Length header: {}", value);
                return {DecodeStatus::InvalidHeader, std::nullopt, bodyStart};
            }
            if (parsed > maxContentLength) {
                LOG_WARN("Content-Length {} exceeds limit {}", parsed, maxContentLength);
                // Skip the announced body as well so the stream resyncs on the next frame
                const std::size_t skip = parsed > std::numeric_limits<std::size_t>::max() - bodyStart
                                             ? bodyStart
                                             : bodyStart + static_cast<std::size_t>(parsed);
                return {DecodeStatus::BodyTooLarge, std::nullopt, skip};
            }
            contentLength = static_cast<std::size_t>(parsed);
        }

        if (!contentLength) {
            LOG_WARN("Missing Content-Length header");
            return {DecodeStatus::InvalidHeader, std::nullopt, bodyStart};
        }
        // maxContentLength bounds the body, so this cannot overflow for a buffer that exists
        if (buffer.size() - bodyStart < *contentLength) {
            return {DecodeStatus::Incomplete, std::nullopt, 0};
        }
        return {DecodeStatus::Ok, buffer.substr(bodyStart, *contentLength), bodyStart + *contentLength};
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status != DecodeStatus::Ok) {
            return std::nullopt;
        }
        buffer.erase(0, r.bytesConsumed);
        return r.payload;
    }

private:
    std::size_t maxContentLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace toolhost
