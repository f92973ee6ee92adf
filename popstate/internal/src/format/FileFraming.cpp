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

// internal/src/format/FileFraming.cpp
#include "format/FileFraming.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>

namespace popstate::format {
    namespace {
        // Reads up to size bytes; returns the count actually read.
        uint64_t read_some(std::istream& in, char* dst, uint64_t size) {
            in.read(dst, static_cast<std::streamsize>(size));
            return static_cast<uint64_t>(in.gcount());
        }

        // Bytes between the read position and the end; empty for unseekable streams.
        std::optional<uint64_t> remaining_bytes(std::istream& in) {
            const auto pos = in.tellg();
            if (pos == std::streampos(-1)) { return std::nullopt; }
            in.seekg(0, std::ios::end);
            const auto end = in.tellg();
            in.seekg(pos);
            if (end == std::streampos(-1) || end < pos) { return std::nullopt; }
            return static_cast<uint64_t>(end - pos);
        }

        constexpr uint64_t HEADER_READ_STEP = 64 * 1024;

        std::string_view trim(std::string_view s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) { s.remove_prefix(1); }
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) { s.remove_suffix(1); }
            return s;
        }
    } // anonymous namespace

    void FileFraming::read_magic(std::istream& in) {
        std::array<char, MAGIC_SIZE> magic{};
        const uint64_t got = read_some(in, magic.data(), magic.size());
        const std::string_view seen{magic.data(), static_cast<size_t>(got)};
        if (seen != MAGIC) { throw core::BadMagic("File has incorrect magic 'number': '" + std::string{seen} + "'"); }
    }

    uint64_t FileFraming::read_header_size(std::istream& in) {
        std::array<char, SIZE_FIELD_WIDTH> field{};
        const uint64_t got = read_some(in, field.data(), field.size());
        if (got != SIZE_FIELD_WIDTH) {
            throw core::BadHeaderSize("Header size field truncated: read " + std::to_string(got) + " of "
                                      + std::to_string(SIZE_FIELD_WIDTH) + " bytes");
        }

        const std::string_view raw{field.data(), field.size()};
        std::string_view text = trim(raw);
        bool negative = false;
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }

        uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            throw core::BadHeaderSize("Invalid header size field: '" + std::string{raw} + "'");
        }
        if (negative || value == 0) {
            throw core::BadHeaderSize("Invalid header size: " + std::string{trim(raw)});
        }
        return value;
    }

    std::string FileFraming::read_header_text(std::istream& in, uint64_t size) {
        if (const auto remaining = remaining_bytes(in); remaining && *remaining < size) {
            throw core::BadHeaderSize("Only " + std::to_string(*remaining) + " bytes remain of " + std::to_string(size)
                                      + " byte header");
        }

        // Grows step by step so an unseekable stream cannot force one huge allocation
        std::string text;
        uint64_t got = 0;
        while (got < size) {
            const uint64_t step = std::min(HEADER_READ_STEP, size - got);
            text.resize(static_cast<size_t>(got + step));
            const uint64_t n = read_some(in, text.data() + got, step);
            got += n;
            if (n != step) { break; }
        }
        if (got != size) {
            throw core::BadHeaderSize("Only read " + std::to_string(got) + " bytes of " + std::to_string(size)
                                      + " byte header");
        }
        return text;
    }

    core::OwnedBuffer FileFraming::read_chunk(std::istream& in, uint64_t size, const std::string& what) {
        // Seekable streams are checked up front so a bogus size never reaches the allocator
        if (const auto remaining = remaining_bytes(in); remaining && *remaining < size) {
            throw core::ChunkSizeMismatch("Only " + std::to_string(*remaining) + " bytes remain of " + std::to_string(size)
                                          + " for " + what);
        }

        auto buf = core::OwnedBuffer::allocate(size);
        const uint64_t got = size == 0 ? 0 : read_some(in, reinterpret_cast<char*>(buf.data()), size);
        if (got != size) {
            throw core::ChunkSizeMismatch("Only read " + std::to_string(got) + " bytes of " + std::to_string(size)
                                          + " for " + what);
        }
        return buf;
    }

    std::string FileFraming::format_header_size(uint64_t size) {
        std::string digits = std::to_string(size);
        if (digits.size() > SIZE_FIELD_WIDTH) {
            throw core::BadHeaderSize("Header of " + digits + " bytes does not fit the size field");
        }
        return std::string(SIZE_FIELD_WIDTH - digits.size(), ' ') + digits;
    }

    void FileFraming::write_preamble(std::ostream& out, std::string_view header_text) {
        const std::string size_field = format_header_size(header_text.size());
        out.write(MAGIC.data(), static_cast<std::streamsize>(MAGIC.size()));
        out.write(size_field.data(), static_cast<std::streamsize>(size_field.size()));
        out.write(header_text.data(), static_cast<std::streamsize>(header_text.size()));
    }
} // namespace popstate::format
