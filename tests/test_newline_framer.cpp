//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_newline_framer.cpp
// Purpose: Tests for the newline-delimited frame codec
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "toolclient/ContentFramer.h"

using toolclient::IContentFramer;
using toolclient::MakeNewlineFramer;

TEST(NewlineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = MakeNewlineFramer(1024);
    EXPECT_EQ(framer->encode("{}"), "{}\n");
    EXPECT_EQ(framer->encode("{\"a\":\n1}\r"), "{\"a\":1}\n");
}

TEST(NewlineFramerTest, DecodesFramesInOrder) {
    auto framer = MakeNewlineFramer(1024);
    std::string buffer = "{\"id\":1}\n{\"id\":2}\r\n{\"id\"";
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{\"id\":1}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "{\"id\":2}");
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "{\"id\"");
}

TEST(NewlineFramerTest, BlankLinesAreSkipped) {
    auto framer = MakeNewlineFramer(1024);
    std::string buffer = "\n  \r\n\t{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::EmptyFrame);
    EXPECT_EQ(ex.bytesConsumed, 1u);
    auto frame = framer->tryDecode(buffer);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, IncompleteWithoutTerminator) {
    auto framer = MakeNewlineFramer(1024);
    auto ex = framer->tryDecodeEx("{\"partial\":");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
    EXPECT_FALSE(ex.payload.has_value());
}

TEST(NewlineFramerTest, FrameAtLimitIsAccepted) {
    auto framer = MakeNewlineFramer(4);
    auto ex = framer->tryDecodeEx("abcd\n");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(ex.payload.value(), "abcd");
    EXPECT_EQ(ex.bytesConsumed, 5u);
}

TEST(NewlineFramerTest, OversizedFramesAreReported) {
    auto framer = MakeNewlineFramer(4);
    auto terminated = framer->tryDecodeEx("abcde\n");
    EXPECT_EQ(terminated.status, IContentFramer::DecodeStatus::FrameTooLarge);
    EXPECT_EQ(terminated.bytesConsumed, 6u);

    auto unterminated = framer->tryDecodeEx("abcdef");
    EXPECT_EQ(unterminated.status, IContentFramer::DecodeStatus::FrameTooLarge);

    std::string buffer = "abcde\n";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "abcde\n");
}
