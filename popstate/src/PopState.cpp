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

// popstate/src/PopState.cpp
#include "popstate/PopState.hpp"

namespace popstate {
    Container read(const std::filesystem::path& path) { return PopulationReader::open(path)->read(); }

    void write(Container& container, const std::filesystem::path& path) { PopulationWriter{}.write(container, path); }

    void write(Container& container, const std::filesystem::path& path, const PopulationWriter::Options& options) {
        PopulationWriter{options}.write(container, path);
    }
} // namespace popstate
