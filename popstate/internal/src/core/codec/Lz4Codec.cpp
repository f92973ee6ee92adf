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

// internal/src/core/codec/Lz4Codec.cpp
#include "core/codec/Codec.hpp"
#include "core/Errors.hpp"

#include <lz4.h>

#include <stdexcept>
#include <string>

namespace popstate::core::codec {
    namespace {
        /**
         * LZ4 block codec.
         *
         * Payload layout: [raw_len:u32 LE][lz4 block]
         *
         * The length prefix is what the simulator writes, since LZ4 blocks do not
         * record their decompressed size.
         */
        struct Lz4Block : Codec {
            static constexpr size_t PREFIX = 4;

            const char* name() const noexcept override { return "lz4"; }

            Compression scheme() const noexcept override { return Compression::Lz4; }

            OwnedBuffer compress(std::span<const uint8_t> raw) const override {
                if (raw.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
                    throw std::length_error("lz4: input of " + std::to_string(raw.size()) + " bytes exceeds LZ4_MAX_INPUT_SIZE");
                }

                static constexpr char EMPTY[1] = {0};
                const int src_len = static_cast<int>(raw.size());
                const char* src = raw.empty() ? EMPTY : reinterpret_cast<const char*>(raw.data());

                const int bound = LZ4_compressBound(src_len);
                auto out = OwnedBuffer::allocate(PREFIX + static_cast<size_t>(bound));

                const auto len = static_cast<uint32_t>(src_len);
                out.data()[0] = len & 0xFF;
                out.data()[1] = (len >> 8) & 0xFF;
                out.data()[2] = (len >> 16) & 0xFF;
                out.data()[3] = (len >> 24) & 0xFF;

                const int written = LZ4_compress_default(src, reinterpret_cast<char*>(out.data() + PREFIX), src_len, bound);
                if (written <= 0) { throw std::runtime_error("lz4: compression failed"); }

                out.shrink_to(PREFIX + static_cast<size_t>(written));
                return out;
            }

            OwnedBuffer decompress(std::span<const uint8_t> packed) const override {
                if (packed.size() < PREFIX) {
                    throw CorruptChunk("lz4: payload of " + std::to_string(packed.size()) + " bytes is shorter than the length prefix");
                }

                const uint32_t raw_len = static_cast<uint32_t>(packed[0])
                                         | (static_cast<uint32_t>(packed[1]) << 8)
                                         | (static_cast<uint32_t>(packed[2]) << 16)
                                         | (static_cast<uint32_t>(packed[3]) << 24);

                if (raw_len > static_cast<uint32_t>(LZ4_MAX_INPUT_SIZE)) {
                    throw CorruptChunk("lz4: declared size " + std::to_string(raw_len) + " exceeds LZ4_MAX_INPUT_SIZE");
                }
                if (raw_len == 0) { return OwnedBuffer{}; }

                auto out = OwnedBuffer::allocate(raw_len);
                const int got = LZ4_decompress_safe(
                    reinterpret_cast<const char*>(packed.data() + PREFIX),
                    reinterpret_cast<char*>(out.data()),
                    static_cast<int>(packed.size() - PREFIX),
                    static_cast<int>(raw_len)
                );

                if (got < 0 || static_cast<uint32_t>(got) != raw_len) {
                    throw CorruptChunk("lz4: decompression of " + std::to_string(packed.size()) + " bytes into "
                                       + std::to_string(raw_len) + " bytes failed");
                }
                return out;
            }
        };
    } // anonymous namespace

    std::unique_ptr<Codec> make_codec_lz4() { return std::make_unique<Lz4Block>(); }
} // namespace popstate::core::codec
