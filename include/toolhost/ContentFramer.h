//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Message framing for byte-stream transports
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace toolhost {

//========================================================================================================
// IContentFramer
// Purpose: Splits a byte stream into JSON-RPC payloads and wraps outgoing payloads.
// Notes:
//   tryDecodeEx never mutates the buffer; bytesConsumed tells the caller how much to drop. For
//   InvalidHeader that is the offending header block. For BodyTooLarge it also covers the announced
//   body, which may extend past the end of the buffer.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;

    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };

    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload;
        std::size_t bytesConsumed{0};
    };

    virtual std::string encode(const std::string& payload) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;

    // Decodes one complete frame and erases it from buffer; nullopt when none is available.
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
};

// "Content-Length: N\r\n\r\n<body>" framing. Bodies above maxContentLength are rejected.
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 2 * 1024 * 1024);

} // namespace toolhost
