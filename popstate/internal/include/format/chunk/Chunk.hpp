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

// internal/include/format/chunk/Chunk.hpp
#pragma once

#include "core/Json.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "core/codec/Compression.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace popstate::format::chunk {
    using core::Json;
    using core::OwnedBuffer;
    using core::codec::Compression;

    enum class ChunkKind : uint8_t {
        Simulation = 0,
        Node = 1,
        HumanCollection = 2,
    };

    [[nodiscard]] std::string_view to_string(ChunkKind kind) noexcept;

    /**
     * ChunkStats - Materialization counters of one container.
     *
     * live counts chunks currently holding a decoded record; peak is the
     * high-water mark of live since construction (or the last reset()).
     */
    struct ChunkStats {
        struct Counter {
            uint64_t live{0};
            uint64_t peak{0};
            uint64_t materializations{0};
            uint64_t commits{0};
        };

        [[nodiscard]] const Counter& operator[](ChunkKind kind) const noexcept { return by_kind_[static_cast<size_t>(kind)]; }

        [[nodiscard]] uint64_t live_total() const noexcept;

        [[nodiscard]] uint64_t peak_total() const noexcept { return peak_total_; }

        void on_materialize(ChunkKind kind) noexcept;
        void on_commit(ChunkKind kind) noexcept;
        void on_release(ChunkKind kind) noexcept;

        /**
         * Clears the history (peaks, counts) but keeps live counts.
         */
        void reset() noexcept;

    private:
        std::array<Counter, 3> by_kind_{};
        uint64_t peak_total_{0};
    };

    /**
     * State shared by every chunk of one container.
     */
    struct ChunkContext {
        ChunkStats stats;
        std::optional<Compression> pinned; ///< Codec for commits; auto-selected when empty
        uint64_t next_human_ordinal{0}; ///< Write-order ticket for human collection chunks
        std::string source{"<memory>"}; ///< File name for error messages
    };

    /**
     * Where a chunk sits in its container (error messages only).
     */
    struct ChunkOrigin {
        ChunkKind kind{ChunkKind::Simulation};
        size_t index{0};
        std::optional<uint64_t> node_suid;
    };

    /**
     * Chunk - One lazily materialized payload unit.
     *
     * Holds either the compressed bytes (Compressed) or the decoded record
     * (Decoded), never both. materialize() and commit() move between the two
     * and drop the superseded representation immediately.
     *
     * Failure atomicity: a failed materialize() leaves the chunk compressed
     * with its bytes intact.
     *
     * Thread-safety: NOT thread-safe.
     */
    class Chunk {
    public:
        struct Compressed {
            OwnedBuffer bytes;
            Compression compression{Compression::None};
        };

        struct Decoded {
            Json record;
        };

        /**
         * Wraps payload bytes read off disk (compressed state).
         */
        Chunk(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, OwnedBuffer bytes, Compression compression);

        /**
         * Builds a chunk from a caller record and commits it immediately.
         */
        [[nodiscard]] static Chunk from_record(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, const Json& record);

        virtual ~Chunk();

        Chunk(Chunk&& other) noexcept = default;
        Chunk& operator=(Chunk&& other) noexcept;
        Chunk(const Chunk&) = delete;
        Chunk& operator=(const Chunk&) = delete;

        [[nodiscard]] bool is_materialized() const noexcept { return std::holds_alternative<Decoded>(state_); }

        /**
         * Decompresses and parses the payload. No-op when already materialized.
         *
         * @throws CorruptChunk on codec or JSON failure (state unchanged)
         */
        void materialize();

        /**
         * Serializes and compresses the record with the pinned codec, or the
         * size-based selection when none is pinned. No-op when already committed.
         */
        void commit();

        /**
         * Decoded record, materializing on first touch.
         */
        [[nodiscard]] Json& json();

        /**
         * Replaces the record (materialized state) without decoding the old payload.
         */
        void replace(Json record);

        /**
         * Re-encodes compressed bytes with another codec without parsing them.
         * A materialized chunk only changes the codec its next commit uses.
         *
         * @throws CorruptChunk if the current bytes do not decompress
         */
        void recompress(Compression target);

        /**
         * Payload bytes re-encoded with target, leaving the chunk untouched.
         * Empty while materialized or when already encoded with target.
         *
         * @throws CorruptChunk if the current bytes do not decompress
         */
        [[nodiscard]] std::optional<OwnedBuffer> encoded_as(Compression target) const;

        /**
         * Installs bytes produced by encoded_as(). No-op while materialized.
         */
        void adopt(OwnedBuffer bytes, Compression compression) noexcept;

        /**
         * Decompressed payload text.
         */
        [[nodiscard]] std::string decompressed_text() const;

        // ==================== Committed state ====================

        /**
         * @throws std::logic_error while materialized
         */
        [[nodiscard]] Compression compression() const;
        [[nodiscard]] uint64_t byte_size() const;
        [[nodiscard]] std::span<const uint8_t> bytes() const;

        [[nodiscard]] const ChunkOrigin& origin() const noexcept { return origin_; }

        void set_index(size_t index) noexcept { origin_.index = index; }

        /**
         * "node chunk 3 (suid 7) of 'file'" style label.
         */
        [[nodiscard]] std::string label() const;

    protected:
        Chunk(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, std::variant<Compressed, Decoded> state);

        /**
         * Turns the parsed payload into the stored record.
         * Throwing leaves the chunk compressed.
         */
        [[nodiscard]] virtual Json unwrap(Json parsed) const { return parsed; }

        /**
         * Serializes the stored record to payload text.
         */
        [[nodiscard]] virtual std::string serialize(const Json& record) const { return core::dump_compact(record); }

        [[nodiscard]] ChunkContext& context() const noexcept { return *context_; }

        [[nodiscard]] static Compressed encode(const ChunkContext& context, std::string_view text);

    private:
        void release_decoded() noexcept;

        std::shared_ptr<ChunkContext> context_;
        ChunkOrigin origin_;
        std::variant<Compressed, Decoded> state_;
    };

    /**
     * HumanCollectionChunk - Generation 6 chunk holding {"human_collection": [...]}.
     *
     * The decoded record is the array itself. The declared count travels with
     * the chunk (header field human_num_humans) and is checked on materialize.
     */
    class HumanCollectionChunk final : public Chunk {
    public:
        HumanCollectionChunk(std::shared_ptr<ChunkContext> context,
                             ChunkOrigin origin,
                             OwnedBuffer bytes,
                             Compression compression,
                             uint64_t declared_count);

        /**
         * Builds a committed chunk from records and takes the next write-order ordinal.
         */
        [[nodiscard]] static HumanCollectionChunk from_records(std::shared_ptr<ChunkContext> context,
                                                               uint64_t node_suid,
                                                               const Json& records);

        [[nodiscard]] uint64_t declared_count() const noexcept { return declared_count_; }

        [[nodiscard]] uint64_t node_suid() const noexcept { return origin().node_suid.value_or(0); }

        /**
         * Position in the file's human table; new chunks sort after all read ones.
         */
        [[nodiscard]] uint64_t ordinal() const noexcept { return ordinal_; }

        /**
         * Record array, materializing on first touch.
         *
         * @throws CorruptChunk / RecordCountMismatch on materialize
         */
        [[nodiscard]] Json& records() { return json(); }

        /**
         * Appends one record and bumps the declared count.
         */
        void append(Json record);

    protected:
        [[nodiscard]] Json unwrap(Json parsed) const override;

        [[nodiscard]] std::string serialize(const Json& records) const override;

    private:
        HumanCollectionChunk(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, Compressed state, uint64_t declared_count);

        uint64_t declared_count_{0};
        uint64_t ordinal_{0};
    };
} // namespace popstate::format::chunk
