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


// tests/NodeViewTest.cpp
#include "popstate/PopState.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>

using namespace popstate;

namespace {
    Json make_records(size_t count) {
        Json out = Json::array();
        for (size_t i = 0; i < count; ++i) { out.push_back(Json{{"id", i}, {"m_age", 10.0 * static_cast<double>(i)}}); }
        return out;
    }

    Container make_container(int gen) {
        auto c = Container::create(gen);
        c.set_simulation(Json{{"m_Time", 1.0}});
        for (int k = 1; k <= 3; ++k) {
            Json node{{"externalId", 100 + k}, {"suid", {{"id", k}}}};
            const Json records = make_records(static_cast<size_t>(k));
            if (c.is_chunked()) { c.chunked().add_node(static_cast<uint64_t>(k), node, records); }
            else {
                node["individualHumans"] = records;
                c.legacy().append_node(node);
            }
        }
        return c;
    }

    Container round_trip(Container& c) {
        std::stringstream io;
        PopulationWriter{}.write(c, io);
        PopulationReader reader{io, "nodes.dtk"};
        return reader.read();
    }

    class NodeViewTest : public ::testing::TestWithParam<int> {};
} // anonymous namespace

TEST_P(NodeViewTest, IteratesNodesOfEveryGeneration) {
    auto written = make_container(GetParam());
    auto c = round_trip(written);

    EXPECT_EQ(c.nodes().size(), 3u);

    size_t seen = 0;
    for (auto node : c.nodes()) {
        const auto k = static_cast<int>(++seen);
        EXPECT_EQ(node.at("externalId"), 100 + k);
        ASSERT_TRUE(node.suid().has_value());
        EXPECT_EQ(*node.suid(), static_cast<uint64_t>(k));
        EXPECT_EQ(node.handle() != nullptr, c.is_chunked());

        auto humans = node.individual_humans();
        EXPECT_EQ(humans.is_paged(), c.is_chunked());
        ASSERT_EQ(humans.size(), static_cast<size_t>(k));
        EXPECT_EQ(humans[humans.size() - 1]["id"], k - 1);

        const auto keys = node.keys();
        EXPECT_EQ(std::ranges::count(keys, "individualHumans"), 0);
        EXPECT_NE(std::ranges::find(keys, "externalId"), keys.end());
    }
    EXPECT_EQ(seen, 3u);
}

TEST_P(NodeViewTest, EditsThroughTheViewAreWritten) {
    auto written = make_container(GetParam());
    auto c = round_trip(written);

    auto nodes = c.nodes();
    for (auto it = nodes.begin(); it != nodes.end(); ++it) {
        (*it)["visited"] = true;
        auto humans = it->individual_humans();
        humans.set(0, Json{{"id", 99}});
        humans.append(Json{{"id", 100}});
    }

    auto again = round_trip(c);
    size_t index = 0;
    for (auto node : again.nodes()) {
        ++index;
        EXPECT_EQ(node.at("visited"), true);
        auto humans = node.individual_humans();
        ASSERT_EQ(humans.size(), index + 1);
        EXPECT_EQ(humans[0]["id"], 99);
        EXPECT_EQ(humans[index]["id"], 100);
    }
    EXPECT_EQ(index, 3u);
}

TEST_P(NodeViewTest, RecordsKeyIsReachedOnlyThroughTheSequence) {
    auto c = make_container(GetParam());
    auto node = c.nodes().loaded(0);

    EXPECT_THROW((void)node["individualHumans"], core::ProtectedKey);
    EXPECT_THROW((void)node.at("individualHumans"), core::ProtectedKey);
    EXPECT_THROW((void)node.erase("individualHumans"), core::ProtectedKey);
    EXPECT_THROW((void)node.at("missing"), std::out_of_range);
    EXPECT_THROW((void)node.individual_humans()[5], core::IndexOutOfRange);
    EXPECT_THROW((void)c.nodes().loaded(3), core::IndexOutOfRange);
}

INSTANTIATE_TEST_SUITE_P(AllGenerations, NodeViewTest, ::testing::Range(1, 7));

TEST(NodeViewLegacyTest, MissingRecordsArrayReadsEmpty) {
    auto c = Container::create(3);
    c.legacy().append_node(Json{{"externalId", 7}});

    auto node = c.nodes().loaded(0);
    EXPECT_FALSE(node.suid().has_value());

    auto humans = node.individual_humans();
    EXPECT_TRUE(humans.empty());
    humans.append(Json{{"id", 1}});
    EXPECT_EQ(c.legacy().node(0)["individualHumans"].size(), 1u);
}

TEST(NodeViewChunkedTest, ForwardScanHoldsOneNodeAndOneCollection) {
    auto written = make_container(6);
    auto c = round_trip(written);
    c.stats().reset();

    size_t records = 0;
    for (auto node : c.nodes()) {
        auto humans = node.individual_humans();
        for (size_t i = 0; i < humans.size(); ++i) { records += humans[i].contains("id") ? 1 : 0; }
    }

    EXPECT_EQ(records, 6u);
    EXPECT_EQ(c.stats()[format::chunk::ChunkKind::Node].peak, 1u);
    EXPECT_EQ(c.stats()[format::chunk::ChunkKind::HumanCollection].peak, 1u);
    EXPECT_EQ(c.stats().live_total(), 0u);
}
