/*
* PopState
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of PopState.
 *
 * PopState is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * PopState is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with PopState.  If not, see <https://www.gnu.org/licenses/>.
 */

// tests/FileFramingTest.cpp
#include "core/Errors.hpp"
#include "format/FileFraming.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace popstate::core;
using popstate::format::FileFraming;

TEST(FileFramingTest, PreambleLayout) {
    std::ostringstream out;
    FileFraming::write_preamble(out, R"({"version":6})");

    const std::string bytes = out.str();
    EXPECT_EQ(bytes.substr(0, 4), "IDTK");
    EXPECT_EQ(bytes.substr(4, 12), "          13");
    EXPECT_EQ(bytes.substr(16), R"({"version":6})");
}

TEST(FileFramingTest, ReadsBackPreamble) {
    std::stringstream io;
    FileFraming::write_preamble(io, "{}");

    FileFraming::read_magic(io);
    const uint64_t size = FileFraming::read_header_size(io);
    EXPECT_EQ(size, 2u);
    EXPECT_EQ(FileFraming::read_header_text(io, size), "{}");
}

TEST(FileFramingTest, BadMagic) {
    std::istringstream in("IDTX          2{}");
    EXPECT_THROW(FileFraming::read_magic(in), BadMagic);

    std::istringstream short_in("ID");
    EXPECT_THROW(FileFraming::read_magic(short_in), BadMagic);
}

TEST(FileFramingTest, HeaderSizeField) {
    std::istringstream zero_padded("000000000042");
    EXPECT_EQ(FileFraming::read_header_size(zero_padded), 42u);

    std::istringstream zero("           0");
    EXPECT_THROW((void)FileFraming::read_header_size(zero), BadHeaderSize);

    std::istringstream negative("         -10");
    EXPECT_THROW((void)FileFraming::read_header_size(negative), BadHeaderSize);

    std::istringstream letters("   12abc    ");
    EXPECT_THROW((void)FileFraming::read_header_size(letters), BadHeaderSize);

    std::istringstream truncated("   12");
    EXPECT_THROW((void)FileFraming::read_header_size(truncated), BadHeaderSize);
}

TEST(FileFramingTest, TruncatedHeaderText) {
    std::istringstream in(R"({"version")");
    EXPECT_THROW((void)FileFraming::read_header_text(in, 64), BadHeaderSize);
}

TEST(FileFramingTest, OversizedHeaderSizeIsRejectedBeforeReading) {
    std::istringstream in("IDTK 99999999999{}");
    FileFraming::read_magic(in);
    const uint64_t size = FileFraming::read_header_size(in);
    EXPECT_EQ(size, 99999999999ULL);

    try {
        (void)FileFraming::read_header_text(in, size);
        FAIL() << "expected BadHeaderSize";
    }
    catch (const BadHeaderSize& e) {
        EXPECT_EQ(e.code(), ErrorCode::BadHeaderSize);
        EXPECT_NE(std::string{e.what()}.find("2 bytes remain"), std::string::npos);
    }
}

TEST(FileFramingTest, ReadChunk) {
    std::istringstream in("abcdefgh");
    const auto first = FileFraming::read_chunk(in, 3, "chunk 0");
    const auto second = FileFraming::read_chunk(in, 5, "chunk 1");
    EXPECT_EQ(first.as_string_view(), "abc");
    EXPECT_EQ(second.as_string_view(), "defgh");
}

TEST(FileFramingTest, TruncatedChunkIsSizeMismatch) {
    std::istringstream in("abcdefgh");
    try {
        (void)FileFraming::read_chunk(in, 100, "node chunk 4");
        FAIL() << "expected ChunkSizeMismatch";
    }
    catch (const ChunkSizeMismatch& e) {
        EXPECT_EQ(e.code(), ErrorCode::ChunkSizeMismatch);
        EXPECT_NE(std::string{e.what()}.find("node chunk 4"), std::string::npos);
        EXPECT_NE(std::string{e.what()}.find("100"), std::string::npos);
    }
}

TEST(FileFramingTest, OversizedHeaderDoesNotFit) {
    EXPECT_EQ(FileFraming::format_header_size(999999999999ULL), "999999999999");
    EXPECT_THROW((void)FileFraming::format_header_size(1000000000000ULL), BadHeaderSize);
}
