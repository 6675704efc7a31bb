//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the Content-Length, line-delimited, and auto-detecting framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "fileio/ContentFramer.h"

using fileio::IContentFramer;
using fileio::FramingDiscipline;

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, TryDecodeExOkAtBoundary) {
    auto framer = fileio::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 4\r\n\r\nabcd";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), "abcd");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, BodyTooLargeAboveBoundary) {
    auto framer = fileio::MakeContentLengthFramer(4);
    auto ex = framer->tryDecodeEx("Content-Length: 5\r\n\r\nabcde");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
}

TEST(ContentLengthFramerTest, NonNumericLengthIsInvalidHeader) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Length: abc\r\n\r\n{}");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, MissingLengthIsInvalidHeader) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Type: application/json\r\n\r\n{}");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, ExtraHeadersAreIgnored) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Type: application/json\r\ncontent-length: 2\r\n\r\n{}");
    ASSERT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(ex.payload.value(), "{}");
}

TEST(ContentLengthFramerTest, ShortBodyIsIncomplete) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 10\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, DecodesBackToBackFrames) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 2\r\n\r\n{}\r\nContent-Length: 5\r\n\r\n[1,2]";
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "[1,2]");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, JsonLineIsFramingMismatch) {
    auto framer = fileio::MakeContentLengthFramer(1024);
    auto ex = framer->tryDecodeEx("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::FramingMismatch);
}

TEST(LineDelimitedFramerTest, EncodeAppendsNewline) {
    auto framer = fileio::MakeLineDelimitedFramer(1024);
    EXPECT_EQ(framer->encode("{}"), "{}\n");
}

TEST(LineDelimitedFramerTest, SkipsBlankLinesAndStripsCarriageReturn) {
    auto framer = fileio::MakeLineDelimitedFramer(1024);
    std::string buffer = "\n\r\n{\"a\":1}\r\n";
    auto line = framer->tryDecode(buffer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "{\"a\":1}");
    EXPECT_TRUE(buffer.empty());
}

TEST(LineDelimitedFramerTest, PartialLineIsIncomplete) {
    auto framer = fileio::MakeLineDelimitedFramer(1024);
    auto ex = framer->tryDecodeEx("{\"a\":");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
}

TEST(LineDelimitedFramerTest, OverlongLineIsBodyTooLarge) {
    auto framer = fileio::MakeLineDelimitedFramer(8);
    auto ex = framer->tryDecodeEx(std::string(32, 'x'));
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
}

TEST(LineDelimitedFramerTest, HeaderLineIsFramingMismatch) {
    auto framer = fileio::MakeLineDelimitedFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Length: 2\r\n\r\n{}");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::FramingMismatch);
}

TEST(AutoDetectFramerTest, StartsUndetected) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    EXPECT_EQ(framer->discipline(), FramingDiscipline::Undetected);
    auto ex = framer->tryDecodeEx("  \r\n");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(framer->discipline(), FramingDiscipline::Undetected);
}

TEST(AutoDetectFramerTest, DetectsLengthPrefixedCaseInsensitive) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    std::string buffer = "\r\ncontent-LENGTH: 2\r\n\r\n{}";
    auto payload = framer->tryDecode(buffer);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, "{}");
    EXPECT_EQ(framer->discipline(), FramingDiscipline::LengthPrefixed);
    EXPECT_EQ(framer->encode("{}"), "Content-Length: 2\r\n\r\n{}");
}

TEST(AutoDetectFramerTest, DetectsLineDelimited) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    std::string buffer = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n";
    auto payload = framer->tryDecode(buffer);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(framer->discipline(), FramingDiscipline::LineDelimited);
    EXPECT_EQ(framer->encode("{}"), "{}\n");
}

TEST(AutoDetectFramerTest, WaitsWhileHeaderPrefixIsAmbiguous) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Le");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(framer->discipline(), FramingDiscipline::Undetected);
}

TEST(AutoDetectFramerTest, DisciplineIsFixedAfterDetection) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    std::string buffer = "Content-Length: 2\r\n\r\n{}";
    ASSERT_TRUE(framer->tryDecode(buffer).has_value());

    std::string line = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":2}\n";
    auto ex = framer->tryDecodeEx(line);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::FramingMismatch);
    EXPECT_EQ(framer->discipline(), FramingDiscipline::LengthPrefixed);
}

TEST(AutoDetectFramerTest, LineThenHeaderIsFramingMismatch) {
    auto framer = fileio::MakeAutoDetectFramer(1024);
    std::string buffer = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n";
    ASSERT_TRUE(framer->tryDecode(buffer).has_value());
    auto ex = framer->tryDecodeEx("Content-Length: 2\r\n\r\n{}");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::FramingMismatch);
}
