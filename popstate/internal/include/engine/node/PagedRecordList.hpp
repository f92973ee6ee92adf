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

// internal/include/engine/node/PagedRecordList.hpp
#pragma once

#include "format/chunk/Chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace popstate::engine::node {
    using core::Json;
    using format::chunk::ChunkContext;
    using format::chunk::HumanCollectionChunk;

    /**
     * PagedRecordList - Individual records of one node, spread over its
     * human collection chunks and seen as one index-addressable sequence.
     *
     * Exactly one chunk is materialized at a time. Its records occupy the
     * window [window_min, window_min + count). Reaching an index outside the
     * window commits the current chunk and steps the cursor one chunk at a
     * time toward the index, materializing each chunk on the way.
     *
     * Sequential scans cost one commit per chunk boundary; a far random
     * access costs one materialize per intervening chunk.
     *
     * Nothing is materialized until the first access.
     *
     * Thread-safety: NOT thread-safe. One writer per open file.
     */
    class PagedRecordList {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Json;
            using difference_type = std::ptrdiff_t;
            using pointer = Json*;
            using reference = Json&;

            iterator() = default;
            iterator(PagedRecordList* list, size_t index) noexcept : list_{list}, index_{index} {}

            reference operator*() const { return list_->get(index_); }
            pointer operator->() const { return &list_->get(index_); }

            iterator& operator++() noexcept {
                ++index_;
                return *this;
            }

            iterator operator++(int) noexcept {
                auto tmp = *this;
                ++index_;
                return tmp;
            }

            bool operator==(const iterator& other) const noexcept { return index_ == other.index_; }

        private:
            PagedRecordList* list_{nullptr};
            size_t index_{0};
        };

        PagedRecordList(std::shared_ptr<ChunkContext> context, uint64_t node_suid, std::vector<HumanCollectionChunk> chunks);

        PagedRecordList(PagedRecordList&&) noexcept = default;
        PagedRecordList& operator=(PagedRecordList&&) noexcept = default;
        PagedRecordList(const PagedRecordList&) = delete;
        PagedRecordList& operator=(const PagedRecordList&) = delete;

        /**
         * Sum of the declared counts of all chunks.
         */
        [[nodiscard]] size_t size() const noexcept { return total_; }

        [[nodiscard]] bool empty() const noexcept { return total_ == 0; }

        /**
         * Record at index, paging its chunk in.
         *
         * @throws IndexOutOfRange if index >= size()
         * @throws CorruptChunk / RecordCountMismatch from a chunk on the way
         */
        [[nodiscard]] Json& get(size_t index);

        [[nodiscard]] Json& operator[](size_t index) { return get(index); }

        void set(size_t index, Json record);

        /**
         * Appends to the last chunk (committing the current one first when
         * the cursor is elsewhere). A list without chunks gets one.
         */
        void append(Json record);

        /**
         * Discards every chunk and stores records as one new chunk.
         */
        void replace(const Json& records);

        /**
         * Commits the materialized chunk, if any, and closes the window.
         */
        void commit();

        /**
         * Commits the window and re-encodes every chunk with scheme.
         */
        void recompress(core::codec::Compression scheme);

        [[nodiscard]] iterator begin() noexcept { return iterator{this, 0}; }
        [[nodiscard]] iterator end() noexcept { return iterator{this, total_}; }

        [[nodiscard]] uint64_t node_suid() const noexcept { return node_suid_; }

        [[nodiscard]] size_t chunk_count() const noexcept { return chunks_.size(); }

        [[nodiscard]] const std::vector<HumanCollectionChunk>& chunks() const noexcept { return chunks_; }

        /**
         * Index of the materialized chunk, if any.
         */
        [[nodiscard]] std::optional<size_t> cursor() const noexcept { return cursor_; }

    private:
        void seek(size_t index);
        void load_current();
        [[nodiscard]] size_t current_count() const noexcept { return chunks_[*cursor_].declared_count(); }

        std::shared_ptr<ChunkContext> context_;
        uint64_t node_suid_;
        std::vector<HumanCollectionChunk> chunks_;
        size_t total_{0};

        std::optional<size_t> cursor_;
        size_t window_min_{0};
    };
} // namespace popstate::engine::node
