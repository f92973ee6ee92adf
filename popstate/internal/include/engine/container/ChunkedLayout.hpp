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

// internal/include/engine/container/ChunkedLayout.hpp
#pragma once

#include "engine/container/AutoCommitIterator.hpp"
#include "engine/node/NodeHandle.hpp"
#include "format/chunk/Chunk.hpp"
#include "format/header/VersionedHeader.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <vector>

namespace popstate::engine::container {
    using core::Json;
    using core::codec::Compression;
    using engine::node::NodeHandle;
    using format::chunk::Chunk;
    using format::chunk::ChunkContext;
    using format::chunk::HumanCollectionChunk;

    /**
     * ChunkedLayout - Chunk set of generation 6.
     *
     * [simulation][node 0..N-1][human collection 0..M-1]
     *
     * Each chunk carries its own codec. Human collection chunks are handed to
     * the node whose SUID they name, once, when the file is read; collections
     * naming no node are kept aside and written back unchanged.
     *
     * Human collections are written in file order; collections built since
     * the read follow, in creation order.
     */
    class ChunkedLayout {
    public:
        /**
         * Node handles in table order. Iteration stores each node (and its
         * record window) when the iterator moves past it.
         */
        class NodeList {
        public:
            using iterator = AutoCommitIterator<NodeList>;

            [[nodiscard]] size_t size() const noexcept { return handles_.size(); }

            [[nodiscard]] bool empty() const noexcept { return handles_.empty(); }

            /**
             * Node i, loaded.
             *
             * @throws IndexOutOfRange if i >= size()
             */
            [[nodiscard]] NodeHandle& operator[](size_t i) { return loaded(i); }

            [[nodiscard]] NodeHandle& loaded(size_t i);

            void release(size_t i);

            /**
             * Node i, without loading it.
             */
            [[nodiscard]] NodeHandle& handle(size_t i);

            [[nodiscard]] iterator begin() { return iterator{this, 0}; }
            [[nodiscard]] iterator end() { return iterator{this, handles_.size()}; }

        private:
            friend class ChunkedLayout;

            std::vector<NodeHandle> handles_;
        };

        /**
         * Reads simulation, node and human collection chunks in table order,
         * leaving them compressed, and distributes the collections to their nodes.
         *
         * @throws ChunkSizeMismatch when the stream ends inside a chunk
         */
        [[nodiscard]] static ChunkedLayout read_chunks(std::istream& in,
                                                       const format::header::VersionedHeader& header,
                                                       std::shared_ptr<ChunkContext> context);

        /**
         * Empty layout: a simulation chunk with no nodes.
         */
        [[nodiscard]] static ChunkedLayout create(std::shared_ptr<ChunkContext> context);

        // ==================== Simulation ====================

        /**
         * Simulation record as stored (its "nodes" member is an empty placeholder;
         * nodes are reached through nodes()).
         */
        [[nodiscard]] Json& simulation() { return sim_.json(); }

        void set_simulation(Json value);

        // ==================== Nodes ====================

        [[nodiscard]] NodeList& nodes() noexcept { return nodes_; }

        [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }

        /**
         * Appends a node with the given SUID; records (a JSON array) become
         * its single collection chunk when non-empty.
         */
        NodeHandle& add_node(uint64_t suid, const Json& node, const Json& records = Json::array());

        [[nodiscard]] size_t orphan_collection_count() const noexcept { return orphans_.size(); }

        // ==================== Chunks ====================

        /**
         * Codec for subsequent commits; std::nullopt restores size-based selection.
         */
        void pin_compression(std::optional<Compression> scheme) noexcept { context_->pinned = scheme; }

        [[nodiscard]] std::optional<Compression> pinned_compression() const noexcept { return context_->pinned; }

        /**
         * Pins scheme and re-encodes every chunk with it.
         */
        void recompress_all(Compression scheme);

        void commit_all();

        /**
         * Commits everything and rebuilds the three tables.
         */
        void sync(format::header::ChunkTableV6& table);

        void write_chunks(std::ostream& out) const;

    private:
        ChunkedLayout(std::shared_ptr<ChunkContext> context, Chunk sim);

        [[nodiscard]] std::vector<const HumanCollectionChunk*> human_write_order() const;

        std::shared_ptr<ChunkContext> context_;
        Chunk sim_;
        NodeList nodes_;
        std::vector<HumanCollectionChunk> orphans_;
    };
} // namespace popstate::engine::container
