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

// tests/PagedRecordListTest.cpp
#include "core/Errors.hpp"
#include "core/codec/Codec.hpp"
#include "engine/node/PagedRecordList.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace popstate::core;
using namespace popstate::engine::node;
using namespace popstate::format::chunk;

namespace {
    constexpr uint64_t NODE_SUID = 1;

    Json records(size_t first, size_t count) {
        Json out = Json::array();
        for (size_t i = first; i < first + count; ++i) { out.push_back(Json{{"id", i}}); }
        return out;
    }

    /**
     * Three collections of 10, 10 and 5 records, ids 0..24.
     */
    class PagedRecordListTest : public ::testing::Test {
    protected:
        void SetUp() override {
            context = std::make_shared<ChunkContext>();

            std::vector<HumanCollectionChunk> chunks;
            chunks.push_back(HumanCollectionChunk::from_records(context, NODE_SUID, records(0, 10)));
            chunks.push_back(HumanCollectionChunk::from_records(context, NODE_SUID, records(10, 10)));
            chunks.push_back(HumanCollectionChunk::from_records(context, NODE_SUID, records(20, 5)));
            list = std::make_unique<PagedRecordList>(context, NODE_SUID, std::move(chunks));
        }

        const ChunkStats::Counter& humans() const { return context->stats[ChunkKind::HumanCollection]; }

        std::shared_ptr<ChunkContext> context;
        std::unique_ptr<PagedRecordList> list;
    };
} // anonymous namespace

TEST_F(PagedRecordListTest, SizeIsKnownWithoutDecoding) {
    EXPECT_EQ(list->size(), 25u);
    EXPECT_FALSE(list->empty());
    EXPECT_EQ(list->chunk_count(), 3u);
    EXPECT_FALSE(list->cursor().has_value());
    EXPECT_EQ(humans().materializations, 0u);
}

TEST_F(PagedRecordListTest, RandomAccessToLastRecord) {
    EXPECT_EQ(list->get(24)["id"], 24);
    EXPECT_EQ(list->cursor().value_or(99), 2u);
    EXPECT_EQ(humans().live, 1u);
    EXPECT_EQ(humans().peak, 1u);
    EXPECT_EQ(humans().commits, 2u);
}

TEST_F(PagedRecordListTest, SequentialScanHoldsOneChunk) {
    size_t expected = 0;
    for (auto& record : *list) {
        EXPECT_EQ(record["id"], expected);
        ++expected;
    }
    EXPECT_EQ(expected, 25u);

    EXPECT_EQ(humans().commits, 2u);
    EXPECT_EQ(humans().materializations, 3u);
    EXPECT_EQ(humans().peak, 1u);

    list->commit();
    EXPECT_EQ(humans().commits, 3u);
    EXPECT_EQ(humans().live, 0u);
    EXPECT_FALSE(list->cursor().has_value());
}

TEST_F(PagedRecordListTest, BackwardAccessStepsBack) {
    (void)list->get(22);
    EXPECT_EQ(list->get(3)["id"], 3);
    EXPECT_EQ(list->cursor().value_or(99), 0u);
    EXPECT_EQ(humans().peak, 1u);
}

TEST_F(PagedRecordListTest, EditsSurviveLeavingTheChunk) {
    list->set(5, Json{{"id", 500}});
    (void)list->get(24);
    list->commit();

    EXPECT_EQ(list->get(5)["id"], 500);
    EXPECT_EQ(list->size(), 25u);
}

TEST_F(PagedRecordListTest, AppendGoesToLastChunk) {
    (void)list->get(0);
    list->append(Json{{"id", 25}});

    EXPECT_EQ(list->size(), 26u);
    EXPECT_EQ(list->chunks()[2].declared_count(), 6u);
    EXPECT_EQ(list->get(25)["id"], 25);
    EXPECT_EQ(list->get(19)["id"], 19);
    EXPECT_EQ(humans().peak, 1u);
}

TEST_F(PagedRecordListTest, ReplaceRebuildsAsOneChunk) {
    (void)list->get(12);
    list->replace(records(100, 4));

    EXPECT_EQ(list->size(), 4u);
    EXPECT_EQ(list->chunk_count(), 1u);
    EXPECT_FALSE(list->cursor().has_value());
    EXPECT_EQ(humans().live, 0u);
    EXPECT_EQ(list->get(3)["id"], 103);
}

TEST_F(PagedRecordListTest, OutOfRange) {
    EXPECT_THROW((void)list->get(25), IndexOutOfRange);
    EXPECT_THROW(list->set(100, Json::object()), IndexOutOfRange);
    EXPECT_FALSE(list->cursor().has_value());
}

TEST(PagedRecordListStandaloneTest, AppendToEmptyList) {
    auto context = std::make_shared<ChunkContext>();
    PagedRecordList list{context, 4, {}};
    EXPECT_TRUE(list.empty());

    list.append(Json{{"id", 1}});
    list.append(Json{{"id", 2}});
    EXPECT_EQ(list.size(), 2u);
    EXPECT_EQ(list.chunk_count(), 1u);
    EXPECT_EQ(list.chunks()[0].node_suid(), 4u);

    list.commit();
    EXPECT_EQ(list.get(1)["id"], 2);
}

TEST(PagedRecordListStandaloneTest, DeclaredCountMismatchSurfacesOnLoad) {
    auto context = std::make_shared<ChunkContext>();
    const std::string text = R"({"human_collection":[{"id":1},{"id":2}]})";
    auto bytes = codec::compress(std::span<const uint8_t>{reinterpret_cast<const uint8_t*>(text.data()), text.size()},
                                 codec::Compression::Lz4);

    std::vector<HumanCollectionChunk> chunks;
    chunks.emplace_back(context, ChunkOrigin{ChunkKind::HumanCollection, 0, 4}, std::move(bytes), codec::Compression::Lz4, 3);

    PagedRecordList list{context, 4, std::move(chunks)};
    EXPECT_EQ(list.size(), 3u);
    EXPECT_THROW((void)list.get(0), RecordCountMismatch);
    EXPECT_FALSE(list.cursor().has_value());
}
