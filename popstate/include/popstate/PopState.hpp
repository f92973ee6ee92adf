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

// popstate/include/popstate/PopState.hpp
#pragma once

#include "popstate/Export.hpp"

#include "core/Errors.hpp"
#include "core/Json.hpp"
#include "core/codec/Compression.hpp"
#include "engine/container/Container.hpp"
#include "engine/io/PopulationReader.hpp"
#include "engine/io/PopulationWriter.hpp"

#include <filesystem>

/**
 * PopState Public API
 *
 * Reads and writes population state files (generations 1-6) without
 * decoding more than one node and one record chunk at a time.
 *
 * ```cpp
 * auto c = popstate::read("state.dtk");
 * for (auto node : c.nodes()) {
 *     auto humans = node.individual_humans();
 *     for (size_t i = 0; i < humans.size(); ++i) { humans[i]["m_age"] = 0.0; }
 * }
 * popstate::write(c, "state_edited.dtk");
 * ```
 */
namespace popstate {
    using core::Json;
    using core::PopStateError;
    using core::ErrorCode;
    using core::codec::Compression;
    using engine::container::Container;
    using engine::container::LegacyLayout;
    using engine::container::ChunkedLayout;
    using engine::container::NodeView;
    using engine::container::NodeRange;
    using engine::container::RecordSequence;
    using engine::node::NodeHandle;
    using engine::node::PagedRecordList;
    using engine::io::PopulationReader;
    using engine::io::PopulationWriter;

    /**
     * Reads a population state file. Chunks stay compressed until touched.
     *
     * @throws PopStateError subclasses for malformed files
     * @throws std::runtime_error if the file cannot be opened
     */
    [[nodiscard]] POPSTATE_API Container read(const std::filesystem::path& path);

    /**
     * Writes a container (restamping the header date).
     *
     * @throws std::runtime_error if the file cannot be written
     */
    POPSTATE_API void write(Container& container, const std::filesystem::path& path);

    POPSTATE_API void write(Container& container, const std::filesystem::path& path, const PopulationWriter::Options& options);
} // namespace popstate
