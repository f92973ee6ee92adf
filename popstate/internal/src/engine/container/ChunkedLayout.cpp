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

// internal/src/engine/container/ChunkedLayout.cpp
#include "engine/container/ChunkedLayout.hpp"
#include "core/Errors.hpp"
#include "format/FileFraming.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace popstate::engine::container {
    using engine::node::PagedRecordList;
    using format::FileFraming;
    using format::chunk::ChunkKind;
    using format::chunk::ChunkOrigin;

    namespace {
        void write_bytes(std::ostream& out, const Chunk& c) {
            const auto bytes = c.bytes();
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
    } // anonymous namespace

    // ==================== NodeList ====================

    NodeHandle& ChunkedLayout::NodeList::handle(size_t i) {
        if (i >= handles_.size()) {
            throw core::IndexOutOfRange("Node index " + std::to_string(i) + " is out of range (" + std::to_string(handles_.size())
                                        + " nodes)");
        }
        return handles_[i];
    }

    NodeHandle& ChunkedLayout::NodeList::loaded(size_t i) {
        NodeHandle& h = handle(i);
        h.load();
        return h;
    }

    void ChunkedLayout::NodeList::release(size_t i) {
        if (i < handles_.size()) { handles_[i].store(); }
    }

    // ==================== ChunkedLayout ====================

    ChunkedLayout::ChunkedLayout(std::shared_ptr<ChunkContext> context, Chunk sim)
        : context_{std::move(context)}, sim_{std::move(sim)} {}

    ChunkedLayout ChunkedLayout::read_chunks(std::istream& in,
                                             const format::header::VersionedHeader& header,
                                             std::shared_ptr<ChunkContext> context) {
        const auto& table = header.chunked();
        const std::string file = " of file '" + context->source + "'";

        auto sim_bytes = FileFraming::read_chunk(in, table.simulation.size, "sim chunk" + file);
        ChunkedLayout layout{
            context,
            Chunk{context, ChunkOrigin{ChunkKind::Simulation, 0, std::nullopt}, std::move(sim_bytes), table.simulation.compression}
        };

        std::vector<Chunk> node_chunks;
        node_chunks.reserve(table.nodes.size());
        for (size_t i = 0; i < table.nodes.size(); ++i) {
            const auto& ref = table.nodes[i];
            auto bytes = FileFraming::read_chunk(
                in, ref.size, "node chunk " + std::to_string(i) + " (suid " + std::to_string(ref.suid) + ")" + file);
            node_chunks.emplace_back(context, ChunkOrigin{ChunkKind::Node, i, ref.suid}, std::move(bytes), ref.compression);
        }

        // Node SUID -> owned collections, in file order
        std::unordered_map<uint64_t, std::vector<HumanCollectionChunk>> by_suid;
        std::vector<uint64_t> suid_order;
        for (size_t i = 0; i < table.humans.size(); ++i) {
            const auto& ref = table.humans[i];
            auto bytes = FileFraming::read_chunk(
                in, ref.size, "human chunk " + std::to_string(i) + " (node suid " + std::to_string(ref.node_suid) + ")" + file);

            auto [it, inserted] = by_suid.try_emplace(ref.node_suid);
            if (inserted) { suid_order.push_back(ref.node_suid); }
            it->second.emplace_back(context,
                                    ChunkOrigin{ChunkKind::HumanCollection, i, ref.node_suid},
                                    std::move(bytes),
                                    ref.compression,
                                    ref.record_count);
        }

        layout.nodes_.handles_.reserve(node_chunks.size());
        for (auto& chunk : node_chunks) {
            const uint64_t suid = chunk.origin().node_suid.value_or(0);

            std::vector<HumanCollectionChunk> owned;
            if (const auto it = by_suid.find(suid); it != by_suid.end()) {
                owned = std::move(it->second);
                by_suid.erase(it);
            }
            layout.nodes_.handles_.emplace_back(std::move(chunk), PagedRecordList{context, suid, std::move(owned)});
        }

        for (const uint64_t suid : suid_order) {
            const auto it = by_suid.find(suid);
            if (it == by_suid.end()) { continue; }
            for (auto& c : it->second) { layout.orphans_.push_back(std::move(c)); }
        }

        return layout;
    }

    ChunkedLayout ChunkedLayout::create(std::shared_ptr<ChunkContext> context) {
        Json sim = Json::object();
        sim["nodes"] = Json::array();
        auto chunk = Chunk::from_record(context, ChunkOrigin{ChunkKind::Simulation, 0, std::nullopt}, sim);
        return ChunkedLayout{std::move(context), std::move(chunk)};
    }

    void ChunkedLayout::set_simulation(Json value) {
        if (!value.is_object()) { throw std::invalid_argument("ChunkedLayout: simulation must be a JSON object"); }
        value["nodes"] = Json::array();
        sim_.replace(std::move(value));
        sim_.commit();
    }

    NodeHandle& ChunkedLayout::add_node(uint64_t suid, const Json& node, const Json& records) {
        if (!node.is_object()) { throw std::invalid_argument("ChunkedLayout: node must be a JSON object"); }
        if (!records.is_array()) { throw std::invalid_argument("ChunkedLayout: node records must be a JSON array"); }

        auto chunk = Chunk::from_record(context_, ChunkOrigin{ChunkKind::Node, nodes_.size(), suid}, node);

        std::vector<HumanCollectionChunk> owned;
        if (!records.empty()) { owned.push_back(HumanCollectionChunk::from_records(context_, suid, records)); }

        return nodes_.handles_.emplace_back(std::move(chunk), PagedRecordList{context_, suid, std::move(owned)});
    }

    void ChunkedLayout::recompress_all(Compression scheme) {
        pin_compression(scheme);
        commit_all();

        sim_.recompress(scheme);
        for (auto& h : nodes_.handles_) {
            h.chunk().recompress(scheme);
            h.individual_humans().recompress(scheme);
        }
        for (auto& c : orphans_) { c.recompress(scheme); }
    }

    void ChunkedLayout::commit_all() {
        sim_.commit();
        for (auto& h : nodes_.handles_) { h.store(); }
        for (auto& c : orphans_) { c.commit(); }
    }

    std::vector<const HumanCollectionChunk*> ChunkedLayout::human_write_order() const {
        std::vector<const HumanCollectionChunk*> order;
        for (const auto& h : nodes_.handles_) {
            for (const auto& c : h.individual_humans().chunks()) { order.push_back(&c); }
        }
        for (const auto& c : orphans_) { order.push_back(&c); }

        std::ranges::stable_sort(order, {}, [](const HumanCollectionChunk* c) { return c->ordinal(); });
        return order;
    }

    void ChunkedLayout::sync(format::header::ChunkTableV6& table) {
        commit_all();

        table.simulation = format::header::ChunkRef{sim_.compression(), sim_.byte_size()};

        table.nodes.clear();
        for (const auto& h : nodes_.handles_) {
            table.nodes.push_back(format::header::NodeChunkRef{h.suid(), h.chunk().compression(), h.chunk().byte_size()});
        }

        table.humans.clear();
        for (const auto* c : human_write_order()) {
            table.humans.push_back(format::header::HumanChunkRef{c->node_suid(), c->declared_count(), c->compression(), c->byte_size()});
        }
    }

    void ChunkedLayout::write_chunks(std::ostream& out) const {
        write_bytes(out, sim_);
        for (const auto& h : nodes_.handles_) { write_bytes(out, h.chunk()); }
        for (const auto* c : human_write_order()) { write_bytes(out, *c); }
    }
} // namespace popstate::engine::container
