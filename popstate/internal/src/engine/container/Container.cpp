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

// internal/src/engine/container/Container.cpp
#include "engine/container/Container.hpp"

#include <stdexcept>

namespace popstate::engine::container {
    Container Container::create(int version, std::optional<Compression> legacy_compression) {
        const Compression scheme = legacy_compression.value_or(version == 1 ? Compression::Snappy : Compression::Lz4);
        auto header = VersionedHeader::make_default(version, scheme);
        auto context = std::make_shared<ChunkContext>();

        if (header.is_chunked()) {
            auto layout = ChunkedLayout::create(context);
            return Container{std::move(header), Layout{std::move(layout)}, std::move(context)};
        }

        auto layout = LegacyLayout::create(version, scheme, context);
        return Container{std::move(header), Layout{std::move(layout)}, std::move(context)};
    }

    Container::Container(VersionedHeader header, Layout layout, std::shared_ptr<ChunkContext> context)
        : header_{std::move(header)}, layout_{std::move(layout)}, context_{std::move(context)} {
        if (!context_) { throw std::invalid_argument("Container: context must not be null"); }
        if (header_.is_chunked() != std::holds_alternative<ChunkedLayout>(layout_)) {
            throw std::invalid_argument("Container: layout does not match header generation "
                                        + std::to_string(header_.version()));
        }
    }

    Json& Container::simulation() {
        return std::visit([](auto& layout) -> Json& { return layout.simulation(); }, layout_);
    }

    void Container::set_simulation(Json value) {
        std::visit([&value](auto& layout) { layout.set_simulation(std::move(value)); }, layout_);
    }

    size_t Container::node_count() {
        return std::visit([](auto& layout) -> size_t { return layout.node_count(); }, layout_);
    }

    NodeRange Container::nodes() {
        return std::visit([](auto& layout) { return NodeRange{layout}; }, layout_);
    }

    LegacyLayout& Container::legacy() {
        if (auto* layout = std::get_if<LegacyLayout>(&layout_)) { return *layout; }
        throw std::logic_error("Container: generation " + std::to_string(version()) + " has no legacy layout");
    }

    ChunkedLayout& Container::chunked() {
        if (auto* layout = std::get_if<ChunkedLayout>(&layout_)) { return *layout; }
        throw std::logic_error("Container: generation " + std::to_string(version()) + " has no chunked layout");
    }

    void Container::commit_all() {
        std::visit([](auto& layout) { layout.commit_all(); }, layout_);
    }

    const VersionedHeader& Container::sync_header() {
        if (auto* layout = std::get_if<LegacyLayout>(&layout_)) { layout->sync(header_.legacy()); }
        else { std::get<ChunkedLayout>(layout_).sync(header_.chunked()); }
        return header_;
    }

    void Container::write_chunks(std::ostream& out) const {
        std::visit([&out](const auto& layout) { layout.write_chunks(out); }, layout_);
    }
} // namespace popstate::engine::container
