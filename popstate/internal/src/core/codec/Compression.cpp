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

// internal/src/core/codec/Compression.cpp
#include "core/codec/Compression.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace popstate::core::codec {
    namespace {
        std::string to_upper(std::string_view s) {
            std::string out{s};
            std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }
    } // anonymous namespace

    std::string_view legacy_name(Compression c) noexcept {
        switch (c) {
            case Compression::None: return "NONE";
            case Compression::Lz4: return "LZ4";
            case Compression::Snappy: return "SNAPPY";
        }
        return "NONE";
    }

    Compression parse_legacy_name(std::string_view name) {
        const std::string upper = to_upper(name);
        if (upper == "NONE") { return Compression::None; }
        if (upper == "LZ4") { return Compression::Lz4; }
        if (upper == "SNAPPY") { return Compression::Snappy; }
        throw UnsupportedCodec("Unknown/unsupported compression scheme '" + std::string{name} + "'");
    }

    std::string_view v6_code(Compression c) noexcept {
        switch (c) {
            case Compression::None: return "NON";
            case Compression::Lz4: return "LZ4";
            case Compression::Snappy: return "SNA";
        }
        return "NON";
    }

    Compression parse_v6_code(std::string_view code) {
        if (code == "NON") { return Compression::None; }
        if (code == "LZ4") { return Compression::Lz4; }
        if (code == "SNA") { return Compression::Snappy; }
        throw UnsupportedCodec("Unknown/unsupported compression code '" + std::string{code} + "'");
    }
} // namespace popstate::core::codec
