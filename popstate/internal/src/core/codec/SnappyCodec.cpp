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

// internal/src/core/codec/SnappyCodec.cpp
#include "core/codec/Codec.hpp"
#include "core/Errors.hpp"

#include <snappy.h>

#include <stdexcept>
#include <string>

namespace popstate::core::codec {
    namespace {
        /**
         * Snappy raw block codec (no framing format).
         */
        struct SnappyRaw : Codec {
            const char* name() const noexcept override { return "snappy"; }

            Compression scheme() const noexcept override { return Compression::Snappy; }

            OwnedBuffer compress(std::span<const uint8_t> raw) const override {
                if (raw.size() > SNAPPY_INPUT_LIMIT) {
                    throw std::length_error("snappy: input of " + std::to_string(raw.size()) + " bytes exceeds 32-bit length");
                }

                static constexpr char EMPTY[1] = {0};
                const char* src = raw.empty() ? EMPTY : reinterpret_cast<const char*>(raw.data());

                auto out = OwnedBuffer::allocate(snappy::MaxCompressedLength(raw.size()));
                size_t written = 0;
                snappy::RawCompress(src, raw.size(), reinterpret_cast<char*>(out.data()), &written);

                out.shrink_to(written);
                return out;
            }

            OwnedBuffer decompress(std::span<const uint8_t> packed) const override {
                const auto* src = reinterpret_cast<const char*>(packed.data());

                size_t raw_len = 0;
                if (packed.empty() || !snappy::GetUncompressedLength(src, packed.size(), &raw_len)) {
                    throw CorruptChunk("snappy: invalid length preamble in " + std::to_string(packed.size()) + " byte payload");
                }
                if (raw_len == 0) { return OwnedBuffer{}; }

                auto out = OwnedBuffer::allocate(raw_len);
                if (!snappy::RawUncompress(src, packed.size(), reinterpret_cast<char*>(out.data()))) {
                    throw CorruptChunk("snappy: decompression of " + std::to_string(packed.size()) + " bytes into "
                                       + std::to_string(raw_len) + " bytes failed");
                }
                return out;
            }
        };
    } // anonymous namespace

    std::unique_ptr<Codec> make_codec_snappy() { return std::make_unique<SnappyRaw>(); }
} // namespace popstate::core::codec
