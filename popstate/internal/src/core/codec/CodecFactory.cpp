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

// internal/src/core/codec/CodecFactory.cpp
#include "core/codec/Codec.hpp"
#include "core/Errors.hpp"

#include <string>

namespace popstate::core::codec {
    // forward decls provided by each codec TU
    std::unique_ptr<Codec> make_codec_lz4();
    std::unique_ptr<Codec> make_codec_snappy();

    namespace {
        /**
         * Identity codec for "NONE" chunks.
         */
        struct PassThrough : Codec {
            const char* name() const noexcept override { return "none"; }

            Compression scheme() const noexcept override { return Compression::None; }

            OwnedBuffer compress(std::span<const uint8_t> raw) const override { return OwnedBuffer::copy_of(raw); }

            OwnedBuffer decompress(std::span<const uint8_t> packed) const override { return OwnedBuffer::copy_of(packed); }
        };
    } // anonymous namespace

    std::unique_ptr<Codec> make_codec(Compression scheme) {
        switch (scheme) {
            case Compression::None: return std::make_unique<PassThrough>();
            case Compression::Lz4: return make_codec_lz4();
            case Compression::Snappy: return make_codec_snappy();
        }
        throw UnsupportedCodec("make_codec: unknown compression id " + std::to_string(static_cast<int>(scheme)));
    }

    const Codec& codec_for(Compression scheme) {
        static const std::unique_ptr<Codec> none = make_codec(Compression::None);
        static const std::unique_ptr<Codec> lz4 = make_codec(Compression::Lz4);
        static const std::unique_ptr<Codec> snappy = make_codec(Compression::Snappy);

        switch (scheme) {
            case Compression::None: return *none;
            case Compression::Lz4: return *lz4;
            case Compression::Snappy: return *snappy;
        }
        throw UnsupportedCodec("codec_for: unknown compression id " + std::to_string(static_cast<int>(scheme)));
    }

    OwnedBuffer compress(std::span<const uint8_t> raw, Compression scheme) { return codec_for(scheme).compress(raw); }

    OwnedBuffer decompress(std::span<const uint8_t> packed, Compression scheme) { return codec_for(scheme).decompress(packed); }

    OwnedBuffer compress(std::span<const uint8_t> raw, std::string_view scheme) { return compress(raw, parse_legacy_name(scheme)); }

    OwnedBuffer decompress(std::span<const uint8_t> packed, std::string_view scheme) { return decompress(packed, parse_legacy_name(scheme)); }
} // namespace popstate::core::codec
