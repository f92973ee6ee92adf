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


// internal/include/engine/container/NodeView.hpp
#pragma once

#include "engine/container/AutoCommitIterator.hpp"
#include "engine/container/ChunkedLayout.hpp"
#include "engine/container/LegacyLayout.hpp"
#include "engine/node/NodeHandle.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace popstate::engine::container {
    using node::NodeHandle;
    using node::PagedRecordList;

    /**
     * RecordSequence - Individual records of one node, whichever generation holds them.
     *
     * Generations 1-5 keep the records inline in the node record's
     * "individualHumans" array; generation 6 pages them through the node's
     * PagedRecordList.
     */
    class RecordSequence {
    public:
        /**
         * Inline records of a generation 1-5 node record. A missing array
         * reads as empty and is created on the first append().
         */
        explicit RecordSequence(Json* node_record) noexcept : target_{node_record} {}

        explicit RecordSequence(PagedRecordList* paged) noexcept : target_{paged} {}

        [[nodiscard]] bool is_paged() const noexcept { return std::holds_alternative<PagedRecordList*>(target_); }

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const { return size() == 0; }

        /**
         * @throws IndexOutOfRange if index >= size()
         */
        [[nodiscard]] Json& operator[](size_t index);

        void set(size_t index, Json record);

        void append(Json record);

    private:
        [[nodiscard]] const Json* inline_records() const;

        std::variant<Json*, PagedRecordList*> target_;
    };

    /**
     * NodeView - One node of any generation.
     *
     * Field access goes to the node record (generations 1-5) or the node
     * handle (generation 6). In both, NodeHandle::HUMANS_KEY is reached only
     * through individual_humans(); indexing or erasing it throws ProtectedKey.
     */
    class NodeView {
    public:
        explicit NodeView(Json& record) noexcept : node_{&record} {}

        explicit NodeView(NodeHandle& handle) noexcept : node_{&handle} {}

        /**
         * @throws ProtectedKey for NodeHandle::HUMANS_KEY
         */
        [[nodiscard]] Json& operator[](std::string_view key);

        /**
         * @throws ProtectedKey for NodeHandle::HUMANS_KEY
         * @throws std::out_of_range when key is absent
         */
        [[nodiscard]] Json& at(std::string_view key);

        [[nodiscard]] bool contains(std::string_view key);

        /**
         * @throws ProtectedKey for NodeHandle::HUMANS_KEY
         */
        size_t erase(std::string_view key);

        /**
         * Field names without the individual records key.
         */
        [[nodiscard]] std::vector<std::string> keys();

        /**
         * Node SUID; for generations 1-5 the node record's suid.id, when it has one.
         */
        [[nodiscard]] std::optional<uint64_t> suid();

        [[nodiscard]] RecordSequence individual_humans();

        /**
         * Generation 6 handle, or null for generations 1-5.
         */
        [[nodiscard]] NodeHandle* handle() noexcept;

    private:
        [[nodiscard]] Json& legacy_record();

        std::variant<Json*, NodeHandle*> node_;
    };

    /**
     * NodeRange - Auto-committing range of NodeViews over either layout.
     */
    class NodeRange {
    public:
        using iterator = AutoCommitIterator<NodeRange>;

        explicit NodeRange(LegacyLayout& layout) noexcept : layout_{&layout} {}

        explicit NodeRange(ChunkedLayout& layout) noexcept : layout_{&layout} {}

        [[nodiscard]] size_t size() const;

        /**
         * @throws IndexOutOfRange if i >= size()
         */
        [[nodiscard]] NodeView loaded(size_t i) const;

        void release(size_t i) const;

        [[nodiscard]] iterator begin() { return iterator{this, 0}; }
        [[nodiscard]] iterator end() { return iterator{this, size()}; }

    private:
        std::variant<LegacyLayout*, ChunkedLayout*> layout_;
    };
} // namespace popstate::engine::container
