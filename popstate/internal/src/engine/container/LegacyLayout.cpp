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

// internal/src/engine/container/LegacyLayout.cpp
#include "engine/container/LegacyLayout.hpp"
#include "core/Errors.hpp"
#include "format/FileFraming.hpp"

#include <numeric>
#include <optional>
#include <stdexcept>

namespace popstate::engine::container {
    using format::chunk::ChunkKind;
    using format::chunk::ChunkOrigin;

    namespace {
        Json& member(Json& record, const char* key, const Chunk& owner) {
            if (!record.is_object()) { throw core::CorruptChunk(owner.label() + " is not a JSON object"); }
            const auto it = record.find(key);
            if (it == record.end()) { throw core::CorruptChunk(owner.label() + " has no '" + key + "' member"); }
            return *it;
        }

        std::optional<Json> suid_id(const Json& node) {
            if (!node.is_object()) { return std::nullopt; }
            const auto suid = node.find("suid");
            if (suid == node.end() || !suid->is_object()) { return std::nullopt; }
            const auto id = suid->find("id");
            if (id == suid->end()) { return std::nullopt; }
            return *id;
        }
    } // anonymous namespace

    LegacyLayout::LegacyLayout(int version, std::shared_ptr<ChunkContext> context, std::vector<Chunk> chunks)
        : version_{version}, context_{std::move(context)}, chunks_{std::move(chunks)} {}

    LegacyLayout LegacyLayout::read_chunks(std::istream& in,
                                           const format::header::VersionedHeader& header,
                                           std::shared_ptr<ChunkContext> context) {
        const auto& table = header.legacy();
        context->pinned = table.compression;

        std::vector<Chunk> chunks;
        chunks.reserve(table.chunk_sizes.size());
        for (size_t i = 0; i < table.chunk_sizes.size(); ++i) {
            const std::string what = "chunk " + std::to_string(i) + " of file '" + context->source + "'";
            auto bytes = format::FileFraming::read_chunk(in, table.chunk_sizes[i], what);
            const ChunkOrigin origin{i == 0 ? ChunkKind::Simulation : ChunkKind::Node, i, std::nullopt};
            chunks.emplace_back(context, origin, std::move(bytes), table.compression);
        }

        return LegacyLayout{header.version(), std::move(context), std::move(chunks)};
    }

    LegacyLayout LegacyLayout::create(int version, Compression compression, std::shared_ptr<ChunkContext> context) {
        context->pinned = compression;

        Json sim = Json::object();
        sim["nodes"] = Json::array();
        Json record = sim;
        if (version <= 2) {
            record = Json::object();
            record["simulation"] = std::move(sim);
        }

        std::vector<Chunk> chunks;
        chunks.push_back(Chunk::from_record(context, ChunkOrigin{ChunkKind::Simulation, 0, std::nullopt}, record));
        return LegacyLayout{version, std::move(context), std::move(chunks)};
    }

    // ==================== Simulation ====================

    Json& LegacyLayout::simulation_record() {
        Chunk& c = chunks_.front();
        if (version_ <= 2) { return member(c.json(), "simulation", c); }

        Json& sim = c.json();
        if (!sim.is_object()) { throw core::CorruptChunk(c.label() + " is not a JSON object"); }
        return sim;
    }

    Json& LegacyLayout::simulation() {
        Json& sim = simulation_record();
        if (version_ >= 2) { sim.erase("nodes"); }
        return sim;
    }

    void LegacyLayout::set_simulation(Json value) {
        if (!value.is_object()) { throw std::invalid_argument("LegacyLayout: simulation must be a JSON object"); }
        if (version_ >= 2) { value["nodes"] = Json::array(); }
        else if (!value.contains("nodes")) {
            // Generation 1 node entries live in the simulation record
            value["nodes"] = std::move(generation1_entries());
        }

        Json record = std::move(value);
        if (version_ <= 2) {
            Json wrapped = Json::object();
            wrapped["simulation"] = std::move(record);
            record = std::move(wrapped);
        }

        chunks_.front().replace(std::move(record));
        chunks_.front().commit();
    }

    // ==================== Nodes ====================

    Json& LegacyLayout::generation1_entries() {
        Json& entries = member(simulation_record(), "nodes", chunks_.front());
        if (!entries.is_array()) { throw core::CorruptChunk(chunks_.front().label() + " has a non-array 'nodes' member"); }
        return entries;
    }

    size_t LegacyLayout::node_count() {
        if (version_ == 1) { return generation1_entries().size(); }
        return chunks_.size() - 1;
    }

    void LegacyLayout::check_node_index(size_t i) {
        const size_t count = node_count();
        if (i >= count) {
            throw core::IndexOutOfRange("Node index " + std::to_string(i) + " is out of range (" + std::to_string(count)
                                        + " nodes)");
        }
    }

    Json& LegacyLayout::node(size_t i) {
        check_node_index(i);

        if (version_ == 1) {
            Json& entry = generation1_entries()[i];
            return member(entry, "node", chunks_.front());
        }

        Chunk& c = chunks_[i + 1];
        if (version_ == 2) { return member(c.json(), "node", c); }
        return c.json();
    }

    Json LegacyLayout::wrap_node(Json value, const Json* previous) const {
        std::optional<Json> id = suid_id(value);
        if (!id && previous != nullptr) { id = suid_id(*previous); }
        if (!id) {
            throw std::invalid_argument("LegacyLayout: generation " + std::to_string(version_) + " node needs suid.id");
        }

        Json entry = Json::object();
        entry["suid"] = Json::object();
        entry["suid"]["id"] = std::move(*id);
        entry["node"] = std::move(value);
        return entry;
    }

    void LegacyLayout::set_node(size_t i, Json value) {
        check_node_index(i);

        if (version_ == 1) {
            Json& entry = generation1_entries()[i];
            entry = wrap_node(std::move(value), &entry);
            return;
        }

        Chunk& c = chunks_[i + 1];
        if (version_ == 2) {
            // Keep the stored suid when the new node does not carry one
            Json entry = suid_id(value) ? wrap_node(std::move(value), nullptr) : wrap_node(std::move(value), &c.json());
            c.replace(std::move(entry));
        }
        else { c.replace(std::move(value)); }
        c.commit();
    }

    void LegacyLayout::append_node(Json value) {
        if (version_ == 1) {
            generation1_entries().push_back(wrap_node(std::move(value), nullptr));
            return;
        }

        Json record = version_ == 2 ? wrap_node(std::move(value), nullptr) : std::move(value);
        const ChunkOrigin origin{ChunkKind::Node, chunks_.size(), std::nullopt};
        chunks_.push_back(Chunk::from_record(context_, origin, record));
    }

    void LegacyLayout::store_node(size_t i) {
        if (version_ == 1 || i + 1 >= chunks_.size()) { return; }
        chunks_[i + 1].commit();
    }

    // ==================== Chunks ====================

    Compression LegacyLayout::compression() const noexcept { return context_->pinned.value_or(Compression::None); }

    void LegacyLayout::set_compression(Compression target) {
        if (target == compression()) { return; }
        format::header::check_legacy_compression(version_, target);

        // Every chunk is re-encoded before any is replaced; one corrupt chunk leaves the layout as it was
        std::vector<std::optional<core::OwnedBuffer>> staged;
        staged.reserve(chunks_.size());
        for (const auto& c : chunks_) { staged.push_back(c.encoded_as(target)); }

        for (size_t i = 0; i < chunks_.size(); ++i) {
            if (staged[i]) { chunks_[i].adopt(std::move(*staged[i]), target); }
        }
        context_->pinned = target;
    }

    void LegacyLayout::commit_chunk(size_t i) {
        Chunk& c = chunks_[i];
        if (!c.is_materialized()) { return; }

        if (i == 0 && version_ >= 2) {
            Json& sim = simulation_record();
            if (!sim.contains("nodes")) { sim["nodes"] = Json::array(); }
        }
        c.commit();
    }

    void LegacyLayout::commit_all() {
        for (size_t i = 0; i < chunks_.size(); ++i) { commit_chunk(i); }
    }

    std::vector<uint64_t> LegacyLayout::chunk_sizes() {
        commit_all();

        std::vector<uint64_t> sizes;
        sizes.reserve(chunks_.size());
        for (const auto& c : chunks_) { sizes.push_back(c.byte_size()); }
        return sizes;
    }

    uint64_t LegacyLayout::byte_count() {
        const auto sizes = chunk_sizes();
        return std::accumulate(sizes.begin(), sizes.end(), uint64_t{0});
    }

    std::string LegacyLayout::contents(size_t i) {
        if (i >= chunks_.size()) {
            throw core::IndexOutOfRange("Chunk index " + std::to_string(i) + " is out of range (" + std::to_string(chunks_.size())
                                        + " chunks)");
        }
        commit_chunk(i);
        return chunks_[i].decompressed_text();
    }

    void LegacyLayout::sync(format::header::LegacyChunkTable& table) {
        table.chunk_sizes = chunk_sizes();
        table.compression = compression();
    }

    void LegacyLayout::write_chunks(std::ostream& out) const {
        for (const auto& c : chunks_) {
            const auto bytes = c.bytes();
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
    }
} // namespace popstate::engine::container
