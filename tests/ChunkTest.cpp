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

// tests/ChunkTest.cpp
#include "core/Errors.hpp"
#include "core/codec/Codec.hpp"
#include "format/chunk/Chunk.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace popstate::core;
using namespace popstate::format::chunk;
using popstate::core::codec::Compression;

namespace {
    class ChunkTest : public ::testing::Test {
    protected:
        void SetUp() override {
            context = std::make_shared<ChunkContext>();
            context->source = "unit.dtk";
        }

        OwnedBuffer packed(const std::string& text, Compression scheme) {
            return codec::compress(std::span<const uint8_t>{reinterpret_cast<const uint8_t*>(text.data()), text.size()}, scheme);
        }

        Chunk node_chunk(const std::string& text, Compression scheme = Compression::Snappy) {
            return Chunk{context, ChunkOrigin{ChunkKind::Node, 3, 7}, packed(text, scheme), scheme};
        }

        std::shared_ptr<ChunkContext> context;
    };
} // anonymous namespace

TEST_F(ChunkTest, StartsCompressedAndMaterializesOnAccess) {
    Chunk c = node_chunk(R"({"externalId":100})");
    EXPECT_FALSE(c.is_materialized());
    EXPECT_EQ(c.compression(), Compression::Snappy);

    EXPECT_EQ(c.json()["externalId"], 100);
    EXPECT_TRUE(c.is_materialized());
    EXPECT_EQ(context->stats[ChunkKind::Node].live, 1u);
    EXPECT_EQ(context->stats[ChunkKind::Node].materializations, 1u);

    EXPECT_THROW((void)c.byte_size(), std::logic_error);
}

TEST_F(ChunkTest, CommitKeepsPayloadAndCodec) {
    Chunk c = node_chunk(R"({"externalId":100})", Compression::Lz4);
    c.json()["externalId"] = 200;
    c.commit();

    EXPECT_FALSE(c.is_materialized());
    EXPECT_EQ(c.compression(), Compression::Lz4);
    EXPECT_EQ(context->stats[ChunkKind::Node].live, 0u);
    EXPECT_EQ(context->stats[ChunkKind::Node].commits, 1u);
    EXPECT_EQ(Json::parse(c.decompressed_text())["externalId"], 200);
}

TEST_F(ChunkTest, PinnedCodecWinsOnCommit) {
    context->pinned = Compression::None;
    Chunk c = node_chunk(R"({"a":1})", Compression::Lz4);
    (void)c.json();
    c.commit();

    EXPECT_EQ(c.compression(), Compression::None);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(c.bytes().data()), c.bytes().size()), R"({"a":1})");
}

TEST_F(ChunkTest, CommitWhileCompressedIsNoOp) {
    Chunk c = node_chunk(R"({"a":1})");
    const uint64_t size = c.byte_size();
    c.commit();
    EXPECT_EQ(c.byte_size(), size);
    EXPECT_EQ(context->stats[ChunkKind::Node].commits, 0u);
}

TEST_F(ChunkTest, CorruptPayloadLeavesStateUnchanged) {
    Chunk c = node_chunk("{not json", Compression::Lz4);

    try {
        (void)c.json();
        FAIL() << "expected CorruptChunk";
    }
    catch (const CorruptChunk& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("node chunk 3"), std::string::npos);
        EXPECT_NE(what.find("node suid 7"), std::string::npos);
        EXPECT_NE(what.find("unit.dtk"), std::string::npos);
    }

    EXPECT_FALSE(c.is_materialized());
    EXPECT_EQ(c.compression(), Compression::Lz4);
    EXPECT_EQ(context->stats[ChunkKind::Node].live, 0u);
}

TEST_F(ChunkTest, WrongCodecIsCorruptChunk) {
    Chunk c{context, ChunkOrigin{ChunkKind::Simulation, 0, std::nullopt}, packed(R"({"a":1})", Compression::None),
            Compression::Snappy};
    EXPECT_THROW((void)c.json(), CorruptChunk);
    EXPECT_FALSE(c.is_materialized());
}

TEST_F(ChunkTest, RecompressPreservesContent) {
    Chunk c = node_chunk(R"({"a":[1,2,3]})", Compression::Snappy);
    c.recompress(Compression::Lz4);
    EXPECT_EQ(c.compression(), Compression::Lz4);
    EXPECT_EQ(c.json()["a"][2], 3);
}

TEST_F(ChunkTest, DestroyingMaterializedChunkReleasesLiveCount) {
    {
        Chunk c = node_chunk(R"({"a":1})");
        (void)c.json();
        EXPECT_EQ(context->stats.live_total(), 1u);
    }
    EXPECT_EQ(context->stats.live_total(), 0u);
    EXPECT_EQ(context->stats.peak_total(), 1u);
}

TEST_F(ChunkTest, FromRecordAutoSelectsCodec) {
    Chunk c = Chunk::from_record(context, ChunkOrigin{ChunkKind::Simulation, 0, std::nullopt}, Json{{"nodes", Json::array()}});
    EXPECT_FALSE(c.is_materialized());
    EXPECT_EQ(c.compression(), Compression::Lz4);
    EXPECT_EQ(c.decompressed_text(), R"({"nodes":[]})");
}

TEST_F(ChunkTest, ReplaceMaterializesWithoutDecoding) {
    Chunk c = node_chunk("garbage that never decodes", Compression::None);
    c.replace(Json{{"fresh", true}});
    EXPECT_TRUE(c.is_materialized());
    c.commit();
    EXPECT_EQ(Json::parse(c.decompressed_text())["fresh"], true);
}

TEST_F(ChunkTest, LabelNamesKindIndexAndFile) {
    Chunk c = node_chunk("{}");
    EXPECT_EQ(c.label(), "node chunk 3 (node suid 7) of 'unit.dtk'");
}

// ==================== HumanCollectionChunk ====================

TEST_F(ChunkTest, HumanCollectionUnwrapsRecords) {
    auto h = HumanCollectionChunk{context, ChunkOrigin{ChunkKind::Node, 0, 7},
                                  packed(R"({"human_collection":[{"id":1},{"id":2}]})", Compression::Lz4), Compression::Lz4, 2};
    EXPECT_EQ(h.origin().kind, ChunkKind::HumanCollection);
    EXPECT_EQ(h.node_suid(), 7u);
    ASSERT_EQ(h.records().size(), 2u);
    EXPECT_EQ(h.records()[1]["id"], 2);
    EXPECT_EQ(context->stats[ChunkKind::HumanCollection].live, 1u);
}

TEST_F(ChunkTest, HumanCollectionCountMismatch) {
    auto h = HumanCollectionChunk{context, ChunkOrigin{ChunkKind::HumanCollection, 0, 7},
                                  packed(R"({"human_collection":[{"id":1}]})", Compression::Lz4), Compression::Lz4, 2};
    EXPECT_THROW((void)h.records(), RecordCountMismatch);
    EXPECT_FALSE(h.is_materialized());
}

TEST_F(ChunkTest, HumanCollectionWithoutArrayIsCorrupt) {
    auto h = HumanCollectionChunk{context, ChunkOrigin{ChunkKind::HumanCollection, 0, 7},
                                  packed(R"({"humans":[]})", Compression::Lz4), Compression::Lz4, 0};
    EXPECT_THROW((void)h.records(), CorruptChunk);
}

TEST_F(ChunkTest, HumanCollectionSerializesWrapped) {
    auto h = HumanCollectionChunk::from_records(context, 9, Json::array({Json{{"id", 1}}}));
    EXPECT_EQ(h.declared_count(), 1u);
    EXPECT_EQ(h.decompressed_text(), R"({"human_collection":[{"id":1}]})");

    h.append(Json{{"id", 2}});
    EXPECT_EQ(h.declared_count(), 2u);
    h.commit();
    EXPECT_EQ(h.decompressed_text(), R"({"human_collection":[{"id":1},{"id":2}]})");
}

TEST_F(ChunkTest, HumanCollectionOrdinalsFollowCreation) {
    auto a = HumanCollectionChunk::from_records(context, 1, Json::array());
    auto b = HumanCollectionChunk::from_records(context, 1, Json::array());
    EXPECT_LT(a.ordinal(), b.ordinal());
    EXPECT_EQ(context->next_human_ordinal, 2u);
}
