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

// internal/include/engine/node/NodeHandle.hpp
#pragma once

#include "engine/node/PagedRecordList.hpp"
#include "format/chunk/Chunk.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace popstate::engine::node {
    using format::chunk::Chunk;

    /**
     * NodeHandle - Generation 6 node: its node chunk plus the human collection
     * chunks that name it as owner.
     *
     * Field access goes through to the node chunk, which materializes on first
     * touch. The individual records key is redirected:
     *   - read:   individual_humans() returns the PagedRecordList
     *   - write:  set(HUMANS_KEY, array) / replace_individual_humans() rebuilds
     *             the collection as one new chunk
     *   - delete: erase(HUMANS_KEY) throws ProtectedKey
     *   - operator[] / at on HUMANS_KEY throw ProtectedKey, since a JSON
     *     reference cannot stand in for the paged list
     *
     * load() / store() expose materialize / commit; store() also closes the
     * record window.
     */
    class NodeHandle {
    public:
        static constexpr std::string_view HUMANS_KEY = "individualHumans";

        NodeHandle(Chunk node_chunk, PagedRecordList humans);

        NodeHandle(NodeHandle&&) noexcept = default;
        NodeHandle& operator=(NodeHandle&&) noexcept = default;
        NodeHandle(const NodeHandle&) = delete;
        NodeHandle& operator=(const NodeHandle&) = delete;

        /**
         * Node SUID (the key of the human table, not the external node id).
         */
        [[nodiscard]] uint64_t suid() const noexcept { return humans_.node_suid(); }

        void load() { node_chunk_.materialize(); }

        void store();

        [[nodiscard]] bool is_loaded() const noexcept { return node_chunk_.is_materialized(); }

        /**
         * Field reference (inserted as null when absent, like Json::operator[]).
         *
         * @throws ProtectedKey for HUMANS_KEY
         */
        [[nodiscard]] Json& operator[](std::string_view key);

        /**
         * Existing field reference.
         *
         * @throws ProtectedKey for HUMANS_KEY
         * @throws std::out_of_range when key is absent
         */
        [[nodiscard]] Json& at(std::string_view key);

        /**
         * Writes a field; HUMANS_KEY takes a JSON array of records.
         */
        void set(std::string_view key, Json value);

        /**
         * Removes a field; returns the number removed.
         *
         * @throws ProtectedKey for HUMANS_KEY
         */
        size_t erase(std::string_view key);

        [[nodiscard]] bool contains(std::string_view key);

        /**
         * Node field names, in stored order.
         */
        [[nodiscard]] std::vector<std::string> keys();

        [[nodiscard]] size_t size();

        [[nodiscard]] PagedRecordList& individual_humans() noexcept { return humans_; }

        [[nodiscard]] const PagedRecordList& individual_humans() const noexcept { return humans_; }

        void replace_individual_humans(const Json& records);
        void replace_individual_humans(const std::vector<Json>& records);

        /**
         * Whole node record (without the individual records).
         */
        [[nodiscard]] Json& json() { return node_chunk_.json(); }

        [[nodiscard]] const Chunk& chunk() const noexcept { return node_chunk_; }

        [[nodiscard]] Chunk& chunk() noexcept { return node_chunk_; }

    private:
        [[nodiscard]] Json& fields();

        Chunk node_chunk_;
        PagedRecordList humans_;
    };
} // namespace popstate::engine::node
