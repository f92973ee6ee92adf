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

// internal/include/core/codec/Compression.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace popstate::core::codec {
    /**
     * Compression scheme of a chunk payload.
     *
     * Legacy headers (generations 1-5) spell the scheme "NONE" / "LZ4" / "SNAPPY";
     * generation 6 uses the fixed-width codes "NON" / "LZ4" / "SNA" so that the
     * header length does not depend on the scheme.
     */
    enum class Compression : uint8_t { None = 0, Lz4 = 1, Snappy = 2 };

    /// Largest payload handed to LZ4 (LZ4_MAX_INPUT_SIZE).
    inline constexpr uint64_t LZ4_INPUT_LIMIT = 0x7E000000ULL;

    /// Largest payload handed to Snappy (32-bit length).
    inline constexpr uint64_t SNAPPY_INPUT_LIMIT = 0xFFFFFFFFULL;

    /**
     * Legacy scheme name ("NONE", "LZ4", "SNAPPY").
     */
    [[nodiscard]] std::string_view legacy_name(Compression c) noexcept;

    /**
     * Parses a legacy scheme name, case-insensitively.
     *
     * @throws UnsupportedCodec for any other name
     */
    [[nodiscard]] Compression parse_legacy_name(std::string_view name);

    /**
     * Generation 6 three-letter code ("NON", "LZ4", "SNA").
     */
    [[nodiscard]] std::string_view v6_code(Compression c) noexcept;

    /**
     * Parses a generation 6 three-letter code.
     *
     * @throws UnsupportedCodec for any other code
     */
    [[nodiscard]] Compression parse_v6_code(std::string_view code);

    /**
     * Codec chosen for a generation 6 chunk when none is pinned.
     *
     * < 0x7E000000 -> LZ4, < 0xFFFFFFFF -> SNAPPY, otherwise NONE. The order
     * follows the input limits of the two codecs, not their speed.
     */
    [[nodiscard]] constexpr Compression select_v6_compression(uint64_t encoded_size) noexcept {
        if (encoded_size < LZ4_INPUT_LIMIT) { return Compression::Lz4; }
        if (encoded_size < SNAPPY_INPUT_LIMIT) { return Compression::Snappy; }
        return Compression::None;
    }
} // namespace popstate::core::codec
