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

// internal/include/engine/container/LegacyLayout.hpp
#pragma once

#include "engine/container/AutoCommitIterator.hpp"
#include "format/chunk/Chunk.hpp"
#include "format/header/VersionedHeader.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace popstate::engine::container {
    using core::Json;
    using core::codec::Compression;
    using format::chunk::Chunk;
    using format::chunk::ChunkContext;

    /**
     * LegacyLayout - Chunk set of generations 1-5.
     *
     * One codec for the whole file (pinned in the chunk context).
     *
     * Chunk contents per generation:
     *   1:   [0] {"simulation": {..., "nodes": [{"suid": {"id": n}, "node": {...}}, ...]}}
     *   2:   [0] {"simulation": {..., "nodes": []}}, [1..] {"suid": {"id": n}, "node": {...}}
     *   3-5: [0] {..., "nodes": []}, [1..] {...node...}
     *
     * Generations 2-5 hide the simulation's empty "nodes" member on read and
     * put it back before the simulation chunk is committed.
     *
     * Individual records stay inline in each node record.
     */
    class LegacyLayout {
    public:
        /**
         * Auto-committing range over the node records.
         */
        class NodeList {
        public:
            using iterator = AutoCommitIterator<NodeList>;

            explicit NodeList(LegacyLayout* layout) noexcept : layout_{layout} {}

            [[nodiscard]] size_t size() const { return layout_->node_count(); }

            [[nodiscard]] Json& loaded(size_t i) const { return layout_->node(i); }

            void release(size_t i) const { layout_->store_node(i); }

            [[nodiscard]] iterator begin() { return iterator{this, 0}; }
            [[nodiscard]] iterator end() { return iterator{this, size()}; }

        private:
            LegacyLayout* layout_;
        };

        /**
         * Reads the chunks declared by the header, in order, leaving them compressed.
         *
         * @throws ChunkSizeMismatch when the stream ends inside a chunk
         */
        [[nodiscard]] static LegacyLayout read_chunks(std::istream& in,
                                                      const format::header::VersionedHeader& header,
                                                      std::shared_ptr<ChunkContext> context);

        /**
         * Empty layout: a simulation chunk with no nodes.
         */
        [[nodiscard]] static LegacyLayout create(int version, Compression compression, std::shared_ptr<ChunkContext> context);

        [[nodiscard]] int version() const noexcept { return version_; }

        // ==================== Simulation ====================

        /**
         * Simulation record. Generation 1 includes its nodes; later
         * generations hide the empty "nodes" placeholder.
         */
        [[nodiscard]] Json& simulation();

        /**
         * Generation 1 keeps the current node entries unless value has its own "nodes".
         */
        void set_simulation(Json value);

        // ==================== Nodes ====================

        [[nodiscard]] size_t node_count();

        /**
         * Node record i (the inner "node" object for generations 1-2).
         *
         * @throws IndexOutOfRange if i >= node_count()
         */
        [[nodiscard]] Json& node(size_t i);

        void set_node(size_t i, Json value);

        /**
         * Appends a node. Generations 1-2 need node["suid"]["id"].
         *
         * @throws std::invalid_argument for a generation 1-2 node without suid.id
         */
        void append_node(Json value);

        /**
         * Commits node i (no-op for generation 1, whose nodes share one chunk).
         */
        void store_node(size_t i);

        [[nodiscard]] NodeList nodes() noexcept { return NodeList{this}; }

        // ==================== Chunks ====================

        [[nodiscard]] Compression compression() const noexcept;

        /**
         * Switches the file codec and re-encodes every committed chunk.
         * Nothing changes unless every chunk re-encodes.
         *
         * @throws UnsupportedCodec for LZ4 in generation 1
         * @throws CorruptChunk if a committed chunk does not decode
         */
        void set_compression(Compression target);

        [[nodiscard]] size_t chunk_count() const noexcept { return chunks_.size(); }

        /**
         * Committed chunk sizes (commits everything first).
         */
        [[nodiscard]] std::vector<uint64_t> chunk_sizes();

        [[nodiscard]] uint64_t byte_count();

        /**
         * Decompressed text of chunk i (commits it first).
         */
        [[nodiscard]] std::string contents(size_t i);

        void commit_all();

        /**
         * Commits everything and records codec and sizes in the table.
         */
        void sync(format::header::LegacyChunkTable& table);

        void write_chunks(std::ostream& out) const;

    private:
        LegacyLayout(int version, std::shared_ptr<ChunkContext> context, std::vector<Chunk> chunks);

        [[nodiscard]] Json& simulation_record();
        [[nodiscard]] Json& generation1_entries();
        [[nodiscard]] Json wrap_node(Json value, const Json* previous) const;
        void commit_chunk(size_t i);
        void check_node_index(size_t i);

        int version_;
        std::shared_ptr<ChunkContext> context_;
        std::vector<Chunk> chunks_;
    };
} // namespace popstate::engine::container
