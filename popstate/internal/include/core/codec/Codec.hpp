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

// internal/include/core/codec/Codec.hpp
#pragma once

#include "core/buffer/OwnedBuffer.hpp"
#include "core/codec/Compression.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace popstate::core::codec {
    /**
     * Codec - Whole-buffer compressor for one chunk payload.
     *
     * Implementations are stateless; a single instance per scheme is shared.
     */
    struct Codec {
        virtual ~Codec() = default;

        [[nodiscard]] virtual const char* name() const noexcept = 0;

        [[nodiscard]] virtual Compression scheme() const noexcept = 0;

        /**
         * Compresses the whole input.
         *
         * @throws std::length_error if the input exceeds the codec's limit
         */
        [[nodiscard]] virtual OwnedBuffer compress(std::span<const uint8_t> raw) const = 0;

        /**
         * Decompresses the whole input.
         *
         * @throws CorruptChunk if the input is not a valid stream for this codec
         */
        [[nodiscard]] virtual OwnedBuffer decompress(std::span<const uint8_t> packed) const = 0;
    };

    /**
     * Returns the shared codec for a scheme.
     */
    [[nodiscard]] const Codec& codec_for(Compression scheme);

    /**
     * Creates a codec instance (implemented in src/core/codec/CodecFactory.cpp).
     */
    [[nodiscard]] std::unique_ptr<Codec> make_codec(Compression scheme);

    /**
     * compress(bytes, scheme).
     */
    [[nodiscard]] OwnedBuffer compress(std::span<const uint8_t> raw, Compression scheme);

    /**
     * decompress(bytes, scheme).
     */
    [[nodiscard]] OwnedBuffer decompress(std::span<const uint8_t> packed, Compression scheme);

    /**
     * Name-based overloads; names are parsed with parse_legacy_name().
     *
     * @throws UnsupportedCodec for an unknown scheme name
     */
    [[nodiscard]] OwnedBuffer compress(std::span<const uint8_t> raw, std::string_view scheme);
    [[nodiscard]] OwnedBuffer decompress(std::span<const uint8_t> packed, std::string_view scheme);
} // namespace popstate::core::codec
