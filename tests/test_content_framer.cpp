//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Content-Length framing used by the stdio transport
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "toolhost/ContentFramer.h"

using toolhost::IContentFramer;
using toolhost::MakeContentLengthFramer;
using Status = IContentFramer::DecodeStatus;

namespace {
const std::string kCall = R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo"}})";

std::string frameOf(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}
} // namespace

TEST(ContentLengthFramer, EncodeWritesHeaderThenBody) {
    auto framer = MakeContentLengthFramer();
    EXPECT_EQ(framer->encode(kCall), frameOf(kCall));
    EXPECT_EQ(framer->encode(""), "Content-Length: 0\r\n\r\n");
}

TEST(ContentLengthFramer, DecodesFrameAndReportsConsumedBytes) {
    auto framer = MakeContentLengthFramer();
    const std::string frame = frameOf(kCall);
    auto r = framer->tryDecodeEx(frame + "Content-Len");
    EXPECT_EQ(r.status, Status::Ok);
    ASSERT_TRUE(r.payload.has_value());
    EXPECT_EQ(*r.payload, kCall);
    EXPECT_EQ(r.bytesConsumed, frame.size());
}

TEST(ContentLengthFramer, HeaderNameIsCaseInsensitiveAndOtherHeadersIgnored) {
    auto framer = MakeContentLengthFramer();
    std::string buffer = "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\ncontent-length:  2 \r\n\r\n{}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramer, PartialInputWaitsForMore) {
    auto framer = MakeContentLengthFramer();
    const std::string frame = frameOf(kCall);
    for (size_t cut : {size_t{0}, size_t{10}, frame.find("\r\n\r\n"), frame.size() - 1}) {
        std::string buffer = frame.substr(0, cut);
        auto r = framer->tryDecodeEx(buffer);
        EXPECT_EQ(r.status, Status::Incomplete) << cut;
        EXPECT_EQ(r.bytesConsumed, 0u) << cut;
        EXPECT_FALSE(framer->tryDecode(buffer).has_value());
        EXPECT_EQ(buffer, frame.substr(0, cut));
    }
}

TEST(ContentLengthFramer, BackToBackFramesDecodeInOrder) {
    auto framer = MakeContentLengthFramer();
    std::string buffer = frameOf("[1]") + frameOf("") + frameOf(kCall);
    EXPECT_EQ(framer->tryDecode(buffer).value_or("?"), "[1]");
    EXPECT_EQ(framer->tryDecode(buffer).value_or("?"), "");
    EXPECT_EQ(framer->tryDecode(buffer).value_or("?"), kCall);
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
}

TEST(ContentLengthFramer, OversizedBodyIsSkippedWhole) {
    auto framer = MakeContentLengthFramer(8);
    const std::string big = frameOf("0123456789");
    auto r = framer->tryDecodeEx(big + frameOf("{}"));
    EXPECT_EQ(r.status, Status::BodyTooLarge);
    EXPECT_FALSE(r.payload.has_value());
    EXPECT_EQ(r.bytesConsumed, big.size());

    // Exactly at the limit is fine
    EXPECT_EQ(framer->tryDecodeEx(frameOf("01234567")).status, Status::Ok);
}

TEST(ContentLengthFramer, HugeLengthIsTooLargeNotOverflow) {
    auto framer = MakeContentLengthFramer(1024);
    std::string header = "Content-Length: 99999999999999999999999\r\n\r\n";
    auto r = framer->tryDecodeEx(header + "x");
    EXPECT_EQ(r.status, Status::BodyTooLarge);
    EXPECT_EQ(r.bytesConsumed, header.size());
}

TEST(ContentLengthFramer, MalformedHeadersConsumeOnlyTheHeader) {
    auto framer = MakeContentLengthFramer();
    for (const std::string header : {"Content-Length: 12abc\r\n\r\n", "Content-Length: -4\r\n\r\n",
                                     "Content-Length:\r\n\r\n", "X-Length: 2\r\n\r\n"}) {
        std::string buffer = header + "{}";
        auto r = framer->tryDecodeEx(buffer);
        EXPECT_EQ(r.status, Status::InvalidHeader) << header;
        EXPECT_EQ(r.bytesConsumed, header.size()) << header;
        // tryDecode leaves recovery to the caller
        EXPECT_FALSE(framer->tryDecode(buffer).has_value());
        EXPECT_EQ(buffer, header + "{}");
    }
}
