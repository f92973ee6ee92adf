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

// internal/src/engine/node/NodeHandle.cpp
#include "engine/node/NodeHandle.hpp"
#include "core/Errors.hpp"

#include <stdexcept>

namespace popstate::engine::node {
    namespace {
        [[noreturn]] void protected_key(std::string_view op, uint64_t suid) {
            throw core::ProtectedKey("NodeHandle: cannot " + std::string{op} + " '" + std::string{NodeHandle::HUMANS_KEY}
                                     + "' directly on node suid " + std::to_string(suid));
        }
    } // anonymous namespace

    NodeHandle::NodeHandle(Chunk node_chunk, PagedRecordList humans)
        : node_chunk_{std::move(node_chunk)}, humans_{std::move(humans)} {}

    void NodeHandle::store() {
        humans_.commit();
        node_chunk_.commit();
    }

    Json& NodeHandle::fields() {
        Json& j = node_chunk_.json();
        if (!j.is_object()) { throw core::CorruptChunk(node_chunk_.label() + " is not a JSON object"); }
        return j;
    }

    Json& NodeHandle::operator[](std::string_view key) {
        if (key == HUMANS_KEY) { protected_key("index", suid()); }
        return fields()[std::string{key}];
    }

    Json& NodeHandle::at(std::string_view key) {
        if (key == HUMANS_KEY) { protected_key("index", suid()); }

        Json& j = fields();
        const auto it = j.find(std::string{key});
        if (it == j.end()) { throw std::out_of_range("NodeHandle: key '" + std::string{key} + "' not found"); }
        return *it;
    }

    void NodeHandle::set(std::string_view key, Json value) {
        if (key == HUMANS_KEY) {
            replace_individual_humans(value);
            return;
        }
        fields()[std::string{key}] = std::move(value);
    }

    size_t NodeHandle::erase(std::string_view key) {
        if (key == HUMANS_KEY) { protected_key("delete", suid()); }
        return fields().erase(std::string{key});
    }

    bool NodeHandle::contains(std::string_view key) {
        if (key == HUMANS_KEY) { return true; }
        return fields().contains(std::string{key});
    }

    std::vector<std::string> NodeHandle::keys() {
        std::vector<std::string> out;
        Json& j = fields();
        for (auto it = j.begin(); it != j.end(); ++it) { out.push_back(it.key()); }
        return out;
    }

    size_t NodeHandle::size() { return fields().size(); }

    void NodeHandle::replace_individual_humans(const Json& records) {
        if (!records.is_array()) {
            throw std::invalid_argument("NodeHandle: '" + std::string{HUMANS_KEY} + "' must be a JSON array");
        }
        humans_.replace(records);
    }

    void NodeHandle::replace_individual_humans(const std::vector<Json>& records) {
        Json array = Json::array();
        for (const auto& r : records) { array.push_back(r); }
        humans_.replace(array);
    }
} // namespace popstate::engine::node
