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

// internal/src/engine/node/PagedRecordList.cpp
#include "engine/node/PagedRecordList.hpp"
#include "core/Errors.hpp"

#include <stdexcept>

namespace popstate::engine::node {
    PagedRecordList::PagedRecordList(std::shared_ptr<ChunkContext> context,
                                     uint64_t node_suid,
                                     std::vector<HumanCollectionChunk> chunks)
        : context_{std::move(context)}, node_suid_{node_suid}, chunks_{std::move(chunks)} {
        if (!context_) { throw std::invalid_argument("PagedRecordList: context must not be null"); }
        for (const auto& c : chunks_) { total_ += c.declared_count(); }
    }

    Json& PagedRecordList::get(size_t index) {
        if (index >= total_) {
            throw core::IndexOutOfRange("Index " + std::to_string(index) + " is out of range for human collection of node suid "
                                        + std::to_string(node_suid_) + " (size " + std::to_string(total_) + ")");
        }

        seek(index);
        return chunks_[*cursor_].records()[index - window_min_];
    }

    void PagedRecordList::set(size_t index, Json record) { get(index) = std::move(record); }

    void PagedRecordList::append(Json record) {
        if (chunks_.empty()) { chunks_.push_back(HumanCollectionChunk::from_records(context_, node_suid_, Json::array())); }

        const size_t last = chunks_.size() - 1;
        if (cursor_ != last) {
            if (cursor_) { chunks_[*cursor_].commit(); }
            cursor_ = last;
            window_min_ = total_ - chunks_[last].declared_count();
            load_current();
        }

        chunks_[last].append(std::move(record));
        ++total_;
    }

    void PagedRecordList::replace(const Json& records) {
        auto rebuilt = HumanCollectionChunk::from_records(context_, node_suid_, records);

        chunks_.clear();
        cursor_.reset();
        window_min_ = 0;

        total_ = rebuilt.declared_count();
        chunks_.push_back(std::move(rebuilt));
    }

    void PagedRecordList::commit() {
        if (!cursor_) { return; }

        chunks_[*cursor_].commit();
        cursor_.reset();
        window_min_ = 0;
    }

    void PagedRecordList::recompress(core::codec::Compression scheme) {
        commit();
        for (auto& c : chunks_) { c.recompress(scheme); }
    }

    void PagedRecordList::seek(size_t index) {
        if (!cursor_) {
            cursor_ = 0;
            window_min_ = 0;
            load_current();
        }

        // Step backward one chunk at a time
        while (index < window_min_) {
            chunks_[*cursor_].commit();
            --*cursor_;
            load_current();
            window_min_ -= current_count();
        }

        // Step forward one chunk at a time
        while (index >= window_min_ + current_count()) {
            chunks_[*cursor_].commit();
            window_min_ += current_count();
            ++*cursor_;
            load_current();
        }
    }

    void PagedRecordList::load_current() {
        try { (void)chunks_[*cursor_].records(); }
        catch (...) {
            cursor_.reset();
            window_min_ = 0;
            throw;
        }
    }
} // namespace popstate::engine::node
