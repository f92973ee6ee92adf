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

// tests/NodeHandleTest.cpp
#include "core/Errors.hpp"
#include "engine/node/NodeHandle.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <vector>

using namespace popstate::core;
using namespace popstate::engine::node;
using namespace popstate::format::chunk;

namespace {
    constexpr uint64_t SUID = 5;

    class NodeHandleTest : public ::testing::Test {
    protected:
        void SetUp() override {
            context = std::make_shared<ChunkContext>();

            Json node = {{"externalId", 105}, {"suid", {{"id", SUID}}}, {"m_Ind_Sample_Rate", 1.0}};
            auto node_chunk = Chunk::from_record(context, ChunkOrigin{ChunkKind::Node, 0, SUID}, node);

            Json humans = Json::array();
            for (int i = 0; i < 3; ++i) { humans.push_back(Json{{"suid", {{"id", i}}}, {"m_age", 10.0 * i}}); }
            std::vector<HumanCollectionChunk> chunks;
            chunks.push_back(HumanCollectionChunk::from_records(context, SUID, humans));

            handle = std::make_unique<NodeHandle>(std::move(node_chunk), PagedRecordList{context, SUID, std::move(chunks)});
        }

        std::shared_ptr<ChunkContext> context;
        std::unique_ptr<NodeHandle> handle;
    };
} // anonymous namespace

TEST_F(NodeHandleTest, FieldAccess) {
    EXPECT_EQ(handle->suid(), SUID);
    EXPECT_FALSE(handle->is_loaded());

    EXPECT_EQ((*handle)["externalId"], 105);
    EXPECT_TRUE(handle->is_loaded());
    EXPECT_EQ(handle->at("m_Ind_Sample_Rate"), 1.0);
    EXPECT_THROW((void)handle->at("missing"), std::out_of_range);
    EXPECT_TRUE(handle->contains("suid"));
    EXPECT_FALSE(handle->contains("missing"));
    EXPECT_EQ(handle->size(), 3u);
}

TEST_F(NodeHandleTest, KeysExcludeRecords) {
    const auto keys = handle->keys();
    EXPECT_EQ(keys.size(), 3u);
    EXPECT_EQ(std::ranges::count(keys, "individualHumans"), 0);
}

TEST_F(NodeHandleTest, RecordsKeyIsAlwaysPresent) {
    EXPECT_TRUE(handle->contains(NodeHandle::HUMANS_KEY));
    EXPECT_EQ(handle->individual_humans().size(), 3u);
}

TEST_F(NodeHandleTest, RecordsKeyRejectsDirectAccess) {
    EXPECT_THROW((void)(*handle)["individualHumans"], ProtectedKey);
    EXPECT_THROW((void)handle->at("individualHumans"), ProtectedKey);
    EXPECT_THROW((void)handle->erase("individualHumans"), ProtectedKey);

    try {
        (void)handle->erase("individualHumans");
    }
    catch (const ProtectedKey& e) {
        EXPECT_EQ(e.code(), ErrorCode::ProtectedKey);
        EXPECT_NE(std::string{e.what()}.find("suid 5"), std::string::npos);
    }
}

TEST_F(NodeHandleTest, SettingRecordsRebuildsCollection) {
    Json replacement = Json::array({Json{{"m_age", 1.0}}, Json{{"m_age", 2.0}}});
    handle->set("individualHumans", replacement);

    auto& humans = handle->individual_humans();
    EXPECT_EQ(humans.size(), 2u);
    EXPECT_EQ(humans.chunk_count(), 1u);
    EXPECT_EQ(humans[1]["m_age"], 2.0);
}

TEST_F(NodeHandleTest, SettingRecordsNeedsArray) {
    EXPECT_THROW(handle->set("individualHumans", Json{{"m_age", 1.0}}), std::invalid_argument);
    EXPECT_EQ(handle->individual_humans().size(), 3u);
}

TEST_F(NodeHandleTest, ReplaceFromVector) {
    std::vector<Json> records;
    records.push_back(Json{{"m_age", 7.0}});
    handle->replace_individual_humans(records);
    EXPECT_EQ(handle->individual_humans().size(), 1u);
    EXPECT_EQ(handle->individual_humans()[0]["m_age"], 7.0);
}

TEST_F(NodeHandleTest, OrdinaryFieldEdits) {
    handle->set("externalId", 999);
    (*handle)["newField"] = "x";
    EXPECT_EQ(handle->erase("m_Ind_Sample_Rate"), 1u);
    EXPECT_EQ(handle->erase("never-there"), 0u);

    handle->store();
    EXPECT_FALSE(handle->is_loaded());

    EXPECT_EQ(handle->at("externalId"), 999);
    EXPECT_EQ(handle->at("newField"), "x");
    EXPECT_FALSE(handle->contains("m_Ind_Sample_Rate"));
}

TEST_F(NodeHandleTest, StoreCommitsRecordsThenNode) {
    (*handle)["externalId"] = 1;
    handle->individual_humans()[2]["m_age"] = 99.0;

    handle->store();
    EXPECT_EQ(context->stats.live_total(), 0u);
    EXPECT_EQ(context->stats[ChunkKind::Node].commits, 1u);
    EXPECT_EQ(context->stats[ChunkKind::HumanCollection].commits, 1u);

    EXPECT_EQ(handle->individual_humans()[2]["m_age"], 99.0);
}
