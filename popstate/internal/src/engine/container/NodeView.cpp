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


// internal/src/engine/container/NodeView.cpp
#include "engine/container/NodeView.hpp"
#include "core/Errors.hpp"

#include <stdexcept>

namespace popstate::engine::container {
    namespace {
        const std::string HUMANS{NodeHandle::HUMANS_KEY};

        [[noreturn]] void protected_key(std::string_view op) {
            throw core::ProtectedKey("NodeView: cannot " + std::string{op} + " '" + HUMANS
                                     + "' directly; use individual_humans()");
        }

        void check_index(size_t index, size_t size) {
            if (index >= size) {
                throw core::IndexOutOfRange("Record index " + std::to_string(index) + " is out of range (" + std::to_string(size)
                                            + " records)");
            }
        }
    } // anonymous namespace

    // ==================== RecordSequence ====================

    const Json* RecordSequence::inline_records() const {
        const Json& node = *std::get<Json*>(target_);
        if (!node.is_object()) { return nullptr; }
        const auto it = node.find(HUMANS);
        if (it == node.end() || it->is_null()) { return nullptr; }
        if (!it->is_array()) { throw core::CorruptChunk("Node record has a non-array '" + HUMANS + "' member"); }
        return &*it;
    }

    size_t RecordSequence::size() const {
        if (is_paged()) { return std::get<PagedRecordList*>(target_)->size(); }
        const Json* records = inline_records();
        return records == nullptr ? 0 : records->size();
    }

    Json& RecordSequence::operator[](size_t index) {
        if (is_paged()) { return std::get<PagedRecordList*>(target_)->get(index); }

        check_index(index, size());
        return (*std::get<Json*>(target_))[HUMANS][index];
    }

    void RecordSequence::set(size_t index, Json record) {
        if (is_paged()) {
            std::get<PagedRecordList*>(target_)->set(index, std::move(record));
            return;
        }
        (*this)[index] = std::move(record);
    }

    void RecordSequence::append(Json record) {
        if (is_paged()) {
            std::get<PagedRecordList*>(target_)->append(std::move(record));
            return;
        }

        Json& node = *std::get<Json*>(target_);
        if (!node.is_object()) { throw core::CorruptChunk("Node record is not a JSON object"); }
        if (inline_records() == nullptr) { node[HUMANS] = Json::array(); }
        node[HUMANS].push_back(std::move(record));
    }

    // ==================== NodeView ====================

    Json& NodeView::legacy_record() {
        Json& record = *std::get<Json*>(node_);
        if (!record.is_object()) { throw core::CorruptChunk("Node record is not a JSON object"); }
        return record;
    }

    NodeHandle* NodeView::handle() noexcept {
        auto* h = std::get_if<NodeHandle*>(&node_);
        return h == nullptr ? nullptr : *h;
    }

    Json& NodeView::operator[](std::string_view key) {
        if (key == NodeHandle::HUMANS_KEY) { protected_key("index"); }
        if (auto* h = handle()) { return (*h)[key]; }
        return legacy_record()[std::string{key}];
    }

    Json& NodeView::at(std::string_view key) {
        if (key == NodeHandle::HUMANS_KEY) { protected_key("index"); }
        if (auto* h = handle()) { return h->at(key); }

        Json& record = legacy_record();
        const auto it = record.find(std::string{key});
        if (it == record.end()) { throw std::out_of_range("NodeView: key '" + std::string{key} + "' not found"); }
        return *it;
    }

    bool NodeView::contains(std::string_view key) {
        if (auto* h = handle()) { return h->contains(key); }
        return legacy_record().contains(std::string{key});
    }

    size_t NodeView::erase(std::string_view key) {
        if (key == NodeHandle::HUMANS_KEY) { protected_key("delete"); }
        if (auto* h = handle()) { return h->erase(key); }
        return legacy_record().erase(std::string{key});
    }

    std::vector<std::string> NodeView::keys() {
        if (auto* h = handle()) { return h->keys(); }

        std::vector<std::string> out;
        Json& record = legacy_record();
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (it.key() != HUMANS) { out.push_back(it.key()); }
        }
        return out;
    }

    std::optional<uint64_t> NodeView::suid() {
        if (auto* h = handle()) { return h->suid(); }

        const Json& record = legacy_record();
        const auto suid = record.find("suid");
        if (suid == record.end() || !suid->is_object()) { return std::nullopt; }
        const auto id = suid->find("id");
        if (id == suid->end() || !id->is_number_integer()) { return std::nullopt; }
        if (id->is_number_unsigned()) { return id->get<uint64_t>(); }
        const auto value = id->get<int64_t>();
        if (value < 0) { return std::nullopt; }
        return static_cast<uint64_t>(value);
    }

    RecordSequence NodeView::individual_humans() {
        if (auto* h = handle()) { return RecordSequence{&h->individual_humans()}; }
        return RecordSequence{&legacy_record()};
    }

    // ==================== NodeRange ====================

    size_t NodeRange::size() const {
        return std::visit([](auto* layout) -> size_t { return layout->node_count(); }, layout_);
    }

    NodeView NodeRange::loaded(size_t i) const {
        if (auto* legacy = std::get_if<LegacyLayout*>(&layout_)) { return NodeView{(*legacy)->node(i)}; }
        return NodeView{std::get<ChunkedLayout*>(layout_)->nodes().loaded(i)};
    }

    void NodeRange::release(size_t i) const {
        if (auto* legacy = std::get_if<LegacyLayout*>(&layout_)) { (*legacy)->store_node(i); }
        else { std::get<ChunkedLayout*>(layout_)->nodes().release(i); }
    }
} // namespace popstate::engine::container
