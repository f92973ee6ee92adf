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

// internal/include/engine/io/PopulationWriter.hpp
#pragma once

#include "engine/container/Container.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace popstate::engine::io {
    using container::Container;

    /**
     * PopulationWriter - Serializes a container to a population state file.
     *
     * Order of operations:
     *   1. commit every materialized chunk
     *   2. rebuild the header tables from the committed sizes
     *   3. magic, header size field, header text
     *   4. chunk payloads in header order
     *
     * The container stays usable afterwards; its chunks are left committed.
     */
    class PopulationWriter {
    public:
        struct Options {
            bool stamp_date = true; ///< Restamp the header date with the current local time
            std::optional<std::string> author; ///< Overrides the header author
            std::optional<std::string> tool; ///< Overrides the header tool
        };

        PopulationWriter() = default;

        explicit PopulationWriter(Options options) : options_{std::move(options)} {}

        /**
         * @throws std::runtime_error if the stream fails
         */
        void write(Container& container, std::ostream& out) const;

        /**
         * @throws std::runtime_error if the file cannot be created or written
         */
        void write(Container& container, const std::filesystem::path& path) const;

        [[nodiscard]] const Options& options() const noexcept { return options_; }

    private:
        Options options_;
    };
} // namespace popstate::engine::io
