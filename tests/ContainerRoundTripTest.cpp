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

// tests/ContainerRoundTripTest.cpp
#include "popstate/PopState.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <tuple>

using namespace popstate;
using popstate::format::chunk::ChunkKind;

namespace {
    Json make_records(size_t count, size_t first_id = 0) {
        Json out = Json::array();
        for (size_t i = 0; i < count; ++i) {
            out.push_back(Json{{"id", first_id + i}, {"m_age", 365.0 * static_cast<double>(i % 80)}, {"m_gender", i % 2}});
        }
        return out;
    }

    Json make_legacy_node(int k) {
        return Json{
            {"externalId", 100 + k},
            {"suid", {{"id", k}}},
            {"individualHumans", make_records(static_cast<size_t>(2 * k))}
        };
    }

    std::string write_to_string(Container& c, const PopulationWriter::Options& options = {}) {
        std::ostringstream out;
        PopulationWriter{options}.write(c, out);
        return out.str();
    }

    Container read_from_string(const std::string& bytes) {
        std::istringstream in(bytes);
        PopulationReader reader{in, "memory.dtk"};
        return reader.read();
    }

    Json header_of(const std::string& bytes) {
        const size_t size = std::stoul(bytes.substr(4, 12));
        return Json::parse(bytes.substr(16, size));
    }

    class LegacyRoundTripTest : public ::testing::TestWithParam<std::tuple<int, Compression>> {};

    class ChunkedRoundTripTest : public ::testing::TestWithParam<Compression> {};
} // anonymous namespace

// ==================== Generations 1-5 ====================

TEST_P(LegacyRoundTripTest, NodesAndSimulationSurvive) {
    const auto [gen, scheme] = GetParam();
    if (gen == 1 && scheme == Compression::Lz4) { GTEST_SKIP() << "generation 1 has no LZ4"; }

    auto c = Container::create(gen, scheme);
    c.set_simulation(Json{{"serializationMask", 0}, {"m_Time", 365.0}});
    for (int k = 1; k <= 3; ++k) { c.legacy().append_node(make_legacy_node(k)); }

    const std::string bytes = write_to_string(c);
    EXPECT_EQ(bytes.substr(0, 4), "IDTK");

    auto back = read_from_string(bytes);
    EXPECT_EQ(back.version(), gen);
    EXPECT_FALSE(back.is_chunked());

    auto& layout = back.legacy();
    EXPECT_EQ(layout.compression(), scheme);
    EXPECT_EQ(layout.chunk_count(), gen == 1 ? 1u : 4u);
    ASSERT_EQ(layout.node_count(), 3u);

    for (int k = 1; k <= 3; ++k) {
        Json& node = layout.node(static_cast<size_t>(k - 1));
        EXPECT_EQ(node["externalId"], 100 + k);
        EXPECT_EQ(node["individualHumans"].size(), static_cast<size_t>(2 * k));
        EXPECT_EQ(node["individualHumans"].back()["id"], 2 * k - 1);
    }

    EXPECT_EQ(back.simulation()["m_Time"], 365.0);
    if (gen >= 2) { EXPECT_FALSE(back.simulation().contains("nodes")); }
}

TEST_P(LegacyRoundTripTest, HeaderUsesGenerationLayout) {
    const auto [gen, scheme] = GetParam();
    if (gen == 1 && scheme == Compression::Lz4) { GTEST_SKIP() << "generation 1 has no LZ4"; }

    auto c = Container::create(gen, scheme);
    c.legacy().append_node(make_legacy_node(1));
    const Json header = header_of(write_to_string(c));

    const std::string name{core::codec::legacy_name(scheme)};
    if (gen <= 3) {
        ASSERT_TRUE(header.contains("metadata"));
        EXPECT_EQ(header["metadata"]["engine"], name);
        EXPECT_EQ(header["metadata"]["version"], gen);
    }
    else {
        EXPECT_FALSE(header.contains("metadata"));
        EXPECT_EQ(header["compression"], name);
        EXPECT_EQ(header["version"], gen);
    }
}

INSTANTIATE_TEST_SUITE_P(AllGenerations,
                         LegacyRoundTripTest,
                         ::testing::Combine(::testing::Range(1, 6),
                                            ::testing::Values(Compression::None, Compression::Lz4, Compression::Snappy)));

TEST(LegacyLayoutTest, StoredSimulationKeepsNodesPlaceholder) {
    auto c = Container::create(4, Compression::Lz4);
    c.set_simulation(Json{{"serializationMask", 0}});
    c.legacy().append_node(make_legacy_node(1));

    auto back = read_from_string(write_to_string(c));
    (void)back.simulation();

    const Json stored = Json::parse(back.legacy().contents(0));
    ASSERT_TRUE(stored.contains("nodes"));
    EXPECT_TRUE(stored["nodes"].empty());
}

TEST(LegacyLayoutTest, ForwardScanHoldsOneNode) {
    auto c = Container::create(5, Compression::Snappy);
    for (int k = 1; k <= 6; ++k) { c.legacy().append_node(make_legacy_node(k)); }
    auto back = read_from_string(write_to_string(c));

    size_t seen = 0;
    for (auto& node : back.legacy().nodes()) {
        node["visited"] = true;
        EXPECT_LE(back.stats()[ChunkKind::Node].live, 1u);
        ++seen;
    }

    EXPECT_EQ(seen, 6u);
    EXPECT_EQ(back.stats()[ChunkKind::Node].peak, 1u);
    EXPECT_EQ(back.stats()[ChunkKind::Node].live, 0u);
    EXPECT_EQ(back.legacy().node(5)["visited"], true);
}

TEST(LegacyLayoutTest, Generation2NodeNeedsSuid) {
    auto c = Container::create(2);
    EXPECT_THROW(c.legacy().append_node(Json{{"externalId", 1}}), std::invalid_argument);
}

TEST(LegacyLayoutTest, SetNodeKeepsStoredSuid) {
    auto c = Container::create(2);
    c.legacy().append_node(make_legacy_node(7));
    c.legacy().set_node(0, Json{{"externalId", 5}});

    const Json stored = Json::parse(c.legacy().contents(1));
    EXPECT_EQ(stored["suid"]["id"], 7);
    EXPECT_EQ(stored["node"]["externalId"], 5);
}

TEST(LegacyLayoutTest, SetCompressionRecompressesEveryChunk) {
    auto c = Container::create(4, Compression::Lz4);
    for (int k = 1; k <= 2; ++k) { c.legacy().append_node(make_legacy_node(k)); }
    auto back = read_from_string(write_to_string(c));

    back.legacy().set_compression(Compression::None);
    const std::string bytes = write_to_string(back);
    const Json header = header_of(bytes);
    EXPECT_EQ(header["compression"], "NONE");
    EXPECT_EQ(header["compressed"], false);

    auto again = read_from_string(bytes);
    EXPECT_EQ(again.legacy().compression(), Compression::None);
    EXPECT_EQ(again.legacy().node(1)["externalId"], 102);
}

TEST(LegacyLayoutTest, FailedSetCompressionLeavesEveryChunkInPlace) {
    auto c = Container::create(3, Compression::Lz4);
    c.set_simulation(Json{{"m_Time", 10.0}});
    for (int k = 1; k <= 3; ++k) { c.legacy().append_node(make_legacy_node(k)); }
    std::string bytes = write_to_string(c);

    // Declare a far larger raw length in the LZ4 prefix of node 1 (chunk 2)
    const Json header = header_of(bytes);
    const auto& sizes = header["metadata"]["chunksizes"];
    const size_t offset = 16 + std::stoul(bytes.substr(4, 12)) + sizes[0].get<size_t>() + sizes[1].get<size_t>();
    bytes[offset + 2] = '\x0F';

    auto back = read_from_string(bytes);
    EXPECT_THROW(back.legacy().set_compression(Compression::None), core::CorruptChunk);
    EXPECT_EQ(back.legacy().compression(), Compression::Lz4);

    back.legacy().set_node(1, make_legacy_node(9));
    auto again = read_from_string(write_to_string(back));

    auto& layout = again.legacy();
    EXPECT_EQ(layout.compression(), Compression::Lz4);
    EXPECT_EQ(again.simulation()["m_Time"], 10.0);
    EXPECT_EQ(layout.node(0)["externalId"], 101);
    EXPECT_EQ(layout.node(1)["externalId"], 109);
    EXPECT_EQ(layout.node(2)["externalId"], 103);
}

TEST(LegacyLayoutTest, Generation1HasNoLz4) {
    EXPECT_THROW((void)Container::create(1, Compression::Lz4), core::UnsupportedCodec);

    auto c = Container::create(1);
    EXPECT_EQ(c.legacy().compression(), Compression::Snappy);
    c.legacy().append_node(make_legacy_node(1));

    EXPECT_THROW(c.legacy().set_compression(Compression::Lz4), core::UnsupportedCodec);
    EXPECT_EQ(c.legacy().compression(), Compression::Snappy);

    c.legacy().set_compression(Compression::None);
    auto back = read_from_string(write_to_string(c));
    EXPECT_EQ(back.legacy().compression(), Compression::None);
    EXPECT_EQ(back.legacy().node(0)["externalId"], 101);
}

TEST(LegacyLayoutTest, NodeIndexOutOfRange) {
    auto c = Container::create(3);
    EXPECT_THROW((void)c.legacy().node(0), core::IndexOutOfRange);
    EXPECT_THROW((void)c.legacy().contents(4), core::IndexOutOfRange);
}

// ==================== Generation 6 ====================

TEST_P(ChunkedRoundTripTest, NodesAndRecordsSurvive) {
    const Compression scheme = GetParam();

    auto c = Container::create(6);
    auto& layout = c.chunked();
    layout.pin_compression(scheme);
    c.set_simulation(Json{{"serializationMask", 0}, {"m_Time", 730.0}});
    layout.add_node(1, Json{{"externalId", 100}}, make_records(25));
    layout.add_node(2, Json{{"externalId", 200}}, make_records(3, 1000));

    auto back = read_from_string(write_to_string(c));
    EXPECT_EQ(back.version(), 6);
    EXPECT_TRUE(back.is_chunked());
    EXPECT_EQ(back.author(), "IDM");

    const auto& table = back.header().chunked();
    EXPECT_EQ(table.simulation.compression, scheme);
    ASSERT_EQ(table.nodes.size(), 2u);
    EXPECT_EQ(table.nodes[1].suid, 2u);
    EXPECT_EQ(table.nodes[0].compression, scheme);
    ASSERT_EQ(table.humans.size(), 2u);
    EXPECT_EQ(table.humans[0].node_suid, 1u);
    EXPECT_EQ(table.humans[0].record_count, 25u);
    EXPECT_EQ(table.humans[1].record_count, 3u);
    EXPECT_EQ(table.humans[1].compression, scheme);

    EXPECT_EQ(back.simulation()["m_Time"], 730.0);

    auto& nodes = back.chunked().nodes();
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0]["externalId"], 100);
    EXPECT_EQ(nodes[0].individual_humans().size(), 25u);
    EXPECT_EQ(nodes[0].individual_humans()[24]["id"], 24);
    EXPECT_EQ(nodes[1].suid(), 2u);
    EXPECT_EQ(nodes[1].individual_humans()[0]["id"], 1000);
}

INSTANTIATE_TEST_SUITE_P(AllSchemes,
                         ChunkedRoundTripTest,
                         ::testing::Values(Compression::None, Compression::Lz4, Compression::Snappy),
                         [](const ::testing::TestParamInfo<Compression>& info) {
                             return std::string{core::codec::legacy_name(info.param)};
                         });

TEST(ChunkedLayoutTest, AutoSelectedCodecIsLz4ForSmallChunks) {
    auto c = Container::create(6);
    c.chunked().add_node(1, Json{{"externalId", 1}}, make_records(4));

    const Json header = header_of(write_to_string(c));
    EXPECT_EQ(header["sim_compression"], "LZ4");
    EXPECT_EQ(header["node_compressions"][0], "LZ4");
    EXPECT_EQ(header["human_compressions"][0], "LZ4");
    EXPECT_EQ(header["human_num_humans"][0], "0000000000000004");
    EXPECT_EQ(header["node_suids"][0], "0000000000000001");
}

TEST(ChunkedLayoutTest, ForwardScanHoldsOneNodeAndOneCollection) {
    auto c = Container::create(6);
    for (uint64_t suid = 1; suid <= 5; ++suid) {
        c.chunked().add_node(suid, Json{{"externalId", suid}}, make_records(10, suid * 100));
    }
    auto back = read_from_string(write_to_string(c));
    const auto& stats = back.stats();

    size_t records = 0;
    for (auto& node : back.chunked().nodes()) {
        node["visited"] = true;
        for (auto& human : node.individual_humans()) {
            human["m_age"] = 0.0;
            ++records;
            EXPECT_LE(stats[ChunkKind::Node].live, 1u);
            EXPECT_LE(stats[ChunkKind::HumanCollection].live, 1u);
        }
    }

    EXPECT_EQ(records, 50u);
    EXPECT_EQ(stats[ChunkKind::Node].peak, 1u);
    EXPECT_EQ(stats[ChunkKind::HumanCollection].peak, 1u);
    EXPECT_EQ(stats.live_total(), 0u);

    auto again = read_from_string(write_to_string(back));
    auto& nodes = again.chunked().nodes();
    EXPECT_EQ(nodes[4]["visited"], true);
    EXPECT_EQ(nodes[4].individual_humans()[9]["m_age"], 0.0);
    EXPECT_EQ(nodes[4].individual_humans()[9]["id"], 509);
}

TEST(ChunkedLayoutTest, ReplacingOneNodesRecordsLeavesOthersIntact) {
    auto c = Container::create(6);
    c.chunked().add_node(10, Json{{"externalId", 1}}, make_records(5));
    c.chunked().add_node(20, Json{{"externalId", 2}});

    auto first = read_from_string(write_to_string(c));
    auto& nodes = first.chunked().nodes();
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].individual_humans().size(), 5u);
    EXPECT_EQ(nodes[1].individual_humans().size(), 0u);
    EXPECT_EQ(first.header().chunked().humans.size(), 1u);

    nodes[1].set("individualHumans", make_records(3, 100));

    auto second = read_from_string(write_to_string(first));
    auto& again = second.chunked().nodes();
    ASSERT_EQ(again.size(), 2u);
    EXPECT_EQ(again[1].individual_humans().size(), 3u);
    EXPECT_EQ(again[1].individual_humans()[2]["id"], 102);

    auto& original = again[0].individual_humans();
    ASSERT_EQ(original.size(), 5u);
    for (size_t i = 0; i < 5; ++i) { EXPECT_EQ(original[i], make_records(5)[i]); }

    const auto& table = second.header().chunked();
    ASSERT_EQ(table.humans.size(), 2u);
    EXPECT_EQ(table.humans[0].node_suid, 10u);
    EXPECT_EQ(table.humans[1].node_suid, 20u);
}

TEST(ChunkedLayoutTest, AppendedRecordsAreWritten) {
    auto c = Container::create(6);
    c.chunked().add_node(3, Json{{"externalId", 3}}, make_records(2));
    c.chunked().nodes()[0].individual_humans().append(Json{{"id", 77}});

    auto back = read_from_string(write_to_string(c));
    auto& humans = back.chunked().nodes()[0].individual_humans();
    ASSERT_EQ(humans.size(), 3u);
    EXPECT_EQ(humans[2]["id"], 77);
    EXPECT_EQ(back.header().chunked().humans[0].record_count, 3u);
}

TEST(ChunkedLayoutTest, CollectionsWithoutNodeArePreserved) {
    auto c = Container::create(6);
    c.chunked().add_node(1, Json{{"externalId", 1}}, make_records(4));
    std::string bytes = write_to_string(c);

    // Point the node at a different suid; its collection is left without an owner
    const std::string from = R"("node_suids":["0000000000000001"])";
    const std::string to = R"("node_suids":["0000000000000009"])";
    const size_t at = bytes.find(from);
    ASSERT_NE(at, std::string::npos);
    bytes.replace(at, from.size(), to);

    auto back = read_from_string(bytes);
    ASSERT_EQ(back.chunked().node_count(), 1u);
    EXPECT_EQ(back.chunked().nodes()[0].suid(), 9u);
    EXPECT_EQ(back.chunked().nodes()[0].individual_humans().size(), 0u);
    EXPECT_EQ(back.chunked().orphan_collection_count(), 1u);

    auto again = read_from_string(write_to_string(back));
    const auto& table = again.header().chunked();
    ASSERT_EQ(table.humans.size(), 1u);
    EXPECT_EQ(table.humans[0].node_suid, 1u);
    EXPECT_EQ(table.humans[0].record_count, 4u);
}

TEST(ChunkedLayoutTest, RecompressAllChangesEveryTableEntry) {
    auto c = Container::create(6);
    c.chunked().add_node(1, Json{{"externalId", 1}}, make_records(8));
    c.chunked().add_node(2, Json{{"externalId", 2}}, make_records(8));
    auto back = read_from_string(write_to_string(c));

    back.chunked().recompress_all(Compression::Snappy);
    const Json header = header_of(write_to_string(back));
    EXPECT_EQ(header["sim_compression"], "SNA");
    for (const auto& code : header["node_compressions"]) { EXPECT_EQ(code, "SNA"); }
    for (const auto& code : header["human_compressions"]) { EXPECT_EQ(code, "SNA"); }

    EXPECT_EQ(back.chunked().nodes()[1].individual_humans()[7]["id"], 7);
}

TEST(ChunkedLayoutTest, RecordsKeyIsProtected) {
    auto c = Container::create(6);
    auto& node = c.chunked().add_node(1, Json{{"externalId", 1}}, make_records(1));
    EXPECT_THROW((void)node["individualHumans"], core::ProtectedKey);
    EXPECT_THROW((void)node.erase("individualHumans"), core::ProtectedKey);
    EXPECT_TRUE(node.contains("individualHumans"));
}

// ==================== Container ====================

TEST(ContainerTest, WrongLayoutAccessIsLogicError) {
    auto legacy = Container::create(3);
    auto chunked = Container::create(6);
    EXPECT_THROW((void)legacy.chunked(), std::logic_error);
    EXPECT_THROW((void)chunked.legacy(), std::logic_error);
}

TEST(ContainerTest, UnknownGenerationRejected) {
    EXPECT_THROW((void)Container::create(0), core::UnknownVersion);
    EXPECT_THROW((void)Container::create(7), core::UnknownVersion);
}

TEST(ContainerTest, WriterRestampsDateByDefault) {
    auto c = Container::create(6);
    c.set_date("Tue Jan 02 03:04:05 2024");
    c.set_author("someone");

    auto stamped = read_from_string(write_to_string(c));
    EXPECT_NE(stamped.date(), "Tue Jan 02 03:04:05 2024");
    EXPECT_EQ(stamped.author(), "someone");

    c.set_date("Tue Jan 02 03:04:05 2024");
    PopulationWriter::Options options;
    options.stamp_date = false;
    options.author = "tester";
    options.tool = "unit";

    auto kept = read_from_string(write_to_string(c, options));
    EXPECT_EQ(kept.date(), "Tue Jan 02 03:04:05 2024");
    EXPECT_EQ(kept.author(), "tester");
    EXPECT_EQ(kept.tool(), "unit");
}

TEST(ContainerTest, FileRoundTrip) {
    const auto path = std::filesystem::temp_directory_path() / "popstate_container_roundtrip.dtk";

    auto c = Container::create(6);
    c.chunked().add_node(1, Json{{"externalId", 11}}, make_records(3));
    popstate::write(c, path);

    auto back = popstate::read(path);
    EXPECT_EQ(back.source(), path.string());
    EXPECT_EQ(back.chunked().nodes()[0]["externalId"], 11);
    EXPECT_EQ(back.chunked().nodes()[0].individual_humans().size(), 3u);

    std::filesystem::remove(path);
}
