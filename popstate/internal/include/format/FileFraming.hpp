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

// internal/include/format/FileFraming.hpp
#pragma once

#include "core/buffer/OwnedBuffer.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace popstate::format {
    /**
     * File preamble of a population state file.
     *
     * On-disk layout (no padding):
     * [magic:"IDTK"][header_len:12 ASCII digits, right-justified, space-padded][header:header_len bytes][chunks...]
     */
    struct FileFraming {
        static constexpr std::string_view MAGIC = "IDTK";
        static constexpr size_t MAGIC_SIZE = 4;
        static constexpr size_t SIZE_FIELD_WIDTH = 12;

        /**
         * Reads and checks the 4-byte magic.
         *
         * @throws BadMagic if the bytes differ or the stream ends early
         */
        static void read_magic(std::istream& in);

        /**
         * Reads the 12-byte header length field.
         *
         * @throws BadHeaderSize if the field is not a positive decimal integer
         */
        [[nodiscard]] static uint64_t read_header_size(std::istream& in);

        /**
         * Reads exactly size bytes of header text.
         *
         * @throws BadHeaderSize if the stream ends before size bytes
         */
        [[nodiscard]] static std::string read_header_text(std::istream& in, uint64_t size);

        /**
         * Reads exactly size bytes of chunk payload.
         *
         * @param what Chunk label for the error message
         * @throws ChunkSizeMismatch if the stream ends before size bytes
         */
        [[nodiscard]] static core::OwnedBuffer read_chunk(std::istream& in, uint64_t size, const std::string& what);

        /**
         * Formats the header length field ("{:>12}").
         *
         * @throws BadHeaderSize if size does not fit in 12 digits
         */
        [[nodiscard]] static std::string format_header_size(uint64_t size);

        /**
         * Writes magic, header length field and header text.
         */
        static void write_preamble(std::ostream& out, std::string_view header_text);
    };
} // namespace popstate::format
