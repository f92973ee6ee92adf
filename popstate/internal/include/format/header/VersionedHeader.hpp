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

// internal/include/format/header/VersionedHeader.hpp
#pragma once

#include "core/Json.hpp"
#include "core/codec/Compression.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace popstate::format::header {
    using core::Json;
    using core::codec::Compression;

    inline constexpr int MIN_VERSION = 1;
    inline constexpr int MAX_VERSION = 6;

    /**
 * Chunk table of generations 1-5.
 *
 * One scheme for the whole file and one byte size per chunk.
 * Generation 1 has exactly one chunk; generations 2-5 have the
 * simulation chunk at index 0 followed by one chunk per node.
 */
    struct LegacyChunkTable {
        Compression compression{Compression::Lz4};
        std::vector<uint64_t> chunk_sizes;

        [[nodiscard]] uint64_t byte_count() const noexcept;
    };

    /**
 * One generation 6 chunk reference.
 */
    struct ChunkRef {
        Compression compression{Compression::None};
        uint64_t size{0};
    };

    struct NodeChunkRef {
        uint64_t suid{0}; ///< Node SUID (not the external id)
        Compression compression{Compression::None};
        uint64_t size{0};
    };

    struct HumanChunkRef {
        uint64_t node_suid{0}; ///< SUID of the owning node
        uint64_t record_count{0}; ///< Individuals in the collection
        Compression compression{Compression::None};
        uint64_t size{0};
    };

    /**
 * Chunk tables of generation 6.
 *
 * Layout on disk follows the table order:
 *   [simulation][node 0..N-1][human collection 0..M-1]
 */
    struct ChunkTableV6 {
        ChunkRef simulation;
        std::vector<NodeChunkRef> nodes;
        std::vector<HumanChunkRef> humans;
    };

    /**
 * VersionedHeader - Metadata record at the front of a population state file.
 *
 * Common fields: author, date, tool, version.
 * Generation 5+: emod_info build provenance record (kept verbatim).
 * Unrecognized keys are preserved and written back after the known ones.
 *
 * Serialized key spelling:
 *   v1-3: {"metadata": {..., "compressed": bool, "engine": "LZ4", ...}}
 *   v4-5: {..., "compression": "LZ4", ...}
 *   v6:   three tables, sizes/counts/suids as 16-digit lowercase hex
 */
    class VersionedHeader {
    public:
        using Table = std::variant<LegacyChunkTable, ChunkTableV6>;

        /**
     * Creates the default header for a new file of the given generation.
     *
     * @throws UnknownVersion if version is outside [1, 6]
     * @throws UnsupportedCodec if generation 1 is asked for LZ4
     */
        [[nodiscard]] static VersionedHeader make_default(int version, Compression legacy_compression = Compression::Lz4);

        /**
     * Parses header text.
     *
     * @throws BadHeaderJson if text is not a JSON object of the expected shape
     * @throws UnknownVersion if version is outside [1, 6]
     * @throws ChunkSizeMismatch if a declared chunk size is not positive
     * @throws UnsupportedCodec if a compression name/code is unknown
     */
        [[nodiscard]] static VersionedHeader parse(std::string_view text);

        /**
     * Serializes to compact header text.
     */
        [[nodiscard]] std::string serialize() const;

        [[nodiscard]] int version() const noexcept { return version_; }

        [[nodiscard]] bool is_chunked() const noexcept { return version_ >= 6; }

        [[nodiscard]] const std::string& author() const noexcept { return author_; }
        [[nodiscard]] const std::string& date() const noexcept { return date_; }
        [[nodiscard]] const std::string& tool() const noexcept { return tool_; }

        void set_author(std::string v) { author_ = std::move(v); }
        void set_date(std::string v) { date_ = std::move(v); }
        void set_tool(std::string v) { tool_ = std::move(v); }

        [[nodiscard]] const std::optional<Json>& emod_info() const noexcept { return emod_info_; }
        void set_emod_info(std::optional<Json> info) { emod_info_ = std::move(info); }

        /**
     * Generation 1-5 table.
     *
     * @throws std::logic_error for generation 6
     */
        [[nodiscard]] const LegacyChunkTable& legacy() const;
        [[nodiscard]] LegacyChunkTable& legacy();

        /**
     * Generation 6 tables.
     *
     * @throws std::logic_error for generations 1-5
     */
        [[nodiscard]] const ChunkTableV6& chunked() const;
        [[nodiscard]] ChunkTableV6& chunked();

        [[nodiscard]] const Json& extras() const noexcept { return extras_; }

        /**
     * Current local time in the header date format ("%a %b %d %H:%M:%S %Y").
     */
        [[nodiscard]] static std::string now_string();

        /**
     * Default emod_info record (zeroed build provenance).
     */
        [[nodiscard]] static Json default_emod_info();

    private:
        VersionedHeader() = default;

        static VersionedHeader parse_legacy(Json& fields, int version);
        static VersionedHeader parse_v6(Json& fields);

        [[nodiscard]] Json legacy_fields() const;
        [[nodiscard]] Json v6_fields() const;

        int version_{MIN_VERSION};
        std::string author_;
        std::string date_;
        std::string tool_;
        std::optional<Json> emod_info_;
        Table table_;
        Json extras_ = Json::object();
    };

    /**
 * Formats a 16-digit lowercase zero-padded hex field.
 */
    [[nodiscard]] std::string to_hex16(uint64_t value);

    /**
 * Parses a hex field (either case, no prefix).
 *
 * @throws BadHeaderJson if value is not a hex string
 */
    [[nodiscard]] uint64_t parse_hex(std::string_view text, std::string_view field);

    /**
     * Generation 1 records only a compressed flag, which reads back as SNAPPY,
     * so it can hold NONE or SNAPPY chunks but not LZ4.
     *
     * @throws UnsupportedCodec when the generation cannot record scheme
     */
    void check_legacy_compression(int version, Compression scheme);
} // namespace popstate::format::header
