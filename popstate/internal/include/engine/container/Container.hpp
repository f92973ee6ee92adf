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

// internal/include/engine/container/Container.hpp
#pragma once

#include "engine/container/ChunkedLayout.hpp"
#include "engine/container/LegacyLayout.hpp"
#include "engine/container/NodeView.hpp"
#include "format/chunk/Chunk.hpp"
#include "format/header/VersionedHeader.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace popstate::engine::container {
    using format::chunk::ChunkStats;
    using format::header::VersionedHeader;

    /**
     * Container - One population state file in memory: header plus chunk set.
     *
     * The generation is fixed at construction and selects the layout once:
     *   1-5 -> LegacyLayout   (records inline in node chunks)
     *   6   -> ChunkedLayout  (records in detached human collection chunks)
     *
     * Chunks stay compressed until touched. The header tables describe the
     * chunk set as of the last sync_header().
     *
     * Usage:
     * ```cpp
     * auto c = Container::create(6);
     * c.set_simulation({{"serializationMask", 0}});
     * c.chunked().add_node(1, {{"externalId", 100}}, records);
     * PopulationWriter{}.write(c, "out.dtk");
     * ```
     *
     * Thread-safety: NOT thread-safe.
     */
    class Container {
    public:
        using Layout = std::variant<LegacyLayout, ChunkedLayout>;

        /**
         * Empty container of the given generation with a default header.
         *
         * @param legacy_compression File codec for generations 1-5 (ignored for 6);
         *        defaults to SNAPPY for generation 1 and LZ4 otherwise
         * @throws UnknownVersion if version is outside [1, 6]
         * @throws UnsupportedCodec for LZ4 in generation 1
         */
        [[nodiscard]] static Container create(int version, std::optional<Compression> legacy_compression = std::nullopt);

        Container(VersionedHeader header, Layout layout, std::shared_ptr<ChunkContext> context);

        Container(Container&&) noexcept = default;
        Container& operator=(Container&&) noexcept = default;
        Container(const Container&) = delete;
        Container& operator=(const Container&) = delete;

        // ==================== Header ====================

        [[nodiscard]] int version() const noexcept { return header_.version(); }

        [[nodiscard]] bool is_chunked() const noexcept { return std::holds_alternative<ChunkedLayout>(layout_); }

        [[nodiscard]] const std::string& author() const noexcept { return header_.author(); }
        [[nodiscard]] const std::string& date() const noexcept { return header_.date(); }
        [[nodiscard]] const std::string& tool() const noexcept { return header_.tool(); }

        void set_author(std::string v) { header_.set_author(std::move(v)); }
        void set_date(std::string v) { header_.set_date(std::move(v)); }
        void set_tool(std::string v) { header_.set_tool(std::move(v)); }

        /**
         * Header as of the last sync (or as read).
         */
        [[nodiscard]] const VersionedHeader& header() const noexcept { return header_; }

        [[nodiscard]] VersionedHeader& header() noexcept { return header_; }

        // ==================== Records ====================

        /**
         * Global simulation record (see the layout for the per-generation shape).
         */
        [[nodiscard]] Json& simulation();

        /**
         * Replaces the simulation record; it is stored with an empty "nodes"
         * list from generation 2 on.
         */
        void set_simulation(Json value);

        [[nodiscard]] size_t node_count();

        /**
         * Nodes of either generation family, committed as the iterator moves
         * past them. Records are inline for generations 1-5 and paged for 6.
         *
         * ```cpp
         * for (auto node : c.nodes()) {
         *     auto humans = node.individual_humans();
         *     for (size_t i = 0; i < humans.size(); ++i) { humans[i]["m_age"] = 0.0; }
         * }
         * ```
         */
        [[nodiscard]] NodeRange nodes();

        /**
         * @throws std::logic_error for generation 6
         */
        [[nodiscard]] LegacyLayout& legacy();

        /**
         * @throws std::logic_error for generations 1-5
         */
        [[nodiscard]] ChunkedLayout& chunked();

        // ==================== Persistence ====================

        /**
         * Commits every materialized chunk.
         */
        void commit_all();

        /**
         * Commits everything and rebuilds the header's chunk tables from the
         * committed sizes and codecs.
         */
        const VersionedHeader& sync_header();

        /**
         * Writes chunk payloads in header order. Call after sync_header().
         */
        void write_chunks(std::ostream& out) const;

        [[nodiscard]] const ChunkStats& stats() const noexcept { return context_->stats; }

        [[nodiscard]] ChunkStats& stats() noexcept { return context_->stats; }

        /**
         * File the container was read from ("<memory>" when created).
         */
        [[nodiscard]] const std::string& source() const noexcept { return context_->source; }

    private:
        VersionedHeader header_;
        Layout layout_;
        std::shared_ptr<ChunkContext> context_;
    };
} // namespace popstate::engine::container
