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

// internal/src/engine/io/PopulationWriter.cpp
#include "engine/io/PopulationWriter.hpp"
#include "format/FileFraming.hpp"

#include <fstream>
#include <stdexcept>

namespace popstate::engine::io {
    void PopulationWriter::write(Container& container, std::ostream& out) const {
        if (options_.author) { container.set_author(*options_.author); }
        if (options_.tool) { container.set_tool(*options_.tool); }
        if (options_.stamp_date) { container.set_date(format::header::VersionedHeader::now_string()); }

        const std::string header_text = container.sync_header().serialize();

        format::FileFraming::write_preamble(out, header_text);
        container.write_chunks(out);

        out.flush();
        if (!out) { throw std::runtime_error("PopulationWriter: stream write failed"); }
    }

    void PopulationWriter::write(Container& container, const std::filesystem::path& path) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) { throw std::runtime_error("PopulationWriter: failed to create file '" + path.string() + "'"); }

        write(container, file);

        file.close();
        if (!file) { throw std::runtime_error("PopulationWriter: failed to close file '" + path.string() + "'"); }
    }
} // namespace popstate::engine::io
