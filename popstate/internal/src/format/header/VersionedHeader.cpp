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

// internal/src/format/header/VersionedHeader.cpp
#include "format/header/VersionedHeader.hpp"
#include "core/Errors.hpp"

#include <array>
#include <charconv>
#include <ctime>
#include <numeric>
#include <stdexcept>

namespace popstate::format::header {
    using core::codec::legacy_name;
    using core::codec::parse_legacy_name;
    using core::codec::parse_v6_code;
    using core::codec::v6_code;

    namespace {
        constexpr std::array LEGACY_KEYS = {
            "author", "bytecount", "chunkcount", "chunksizes", "compressed", "date",
            "engine", "compression", "tool", "version", "emod_info"
        };

        constexpr std::array V6_KEYS = {
            "version", "author", "tool", "date", "emod_info",
            "sim_compression", "sim_chunk_size",
            "node_suids", "node_compressions", "node_chunk_sizes",
            "human_compressions", "human_node_suids", "human_num_humans", "human_chunk_sizes"
        };

        std::string optional_string(const Json& fields, const char* key) {
            const auto it = fields.find(key);
            if (it == fields.end() || it->is_null()) { return {}; }
            if (!it->is_string()) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' is not a string"); }
            return it->get<std::string>();
        }

        const Json& required(const Json& fields, const char* key) {
            const auto it = fields.find(key);
            if (it == fields.end()) { throw core::BadHeaderJson(std::string{"Header is missing '"} + key + "'"); }
            return *it;
        }

        std::string required_string(const Json& fields, const char* key) {
            const Json& v = required(fields, key);
            if (!v.is_string()) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' is not a string"); }
            return v.get<std::string>();
        }

        const Json& required_array(const Json& fields, const char* key) {
            const Json& v = required(fields, key);
            if (!v.is_array()) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' is not an array"); }
            return v;
        }

        int64_t as_integer(const Json& v, const char* key) {
            if (!v.is_number_integer()) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' is not an integer"); }
            if (v.is_number_unsigned()) {
                const auto u = v.get<uint64_t>();
                if (u > static_cast<uint64_t>(INT64_MAX)) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' is out of range"); }
                return static_cast<int64_t>(u);
            }
            return v.get<int64_t>();
        }

        uint64_t positive_size(int64_t size, const std::string& what) {
            if (size <= 0) { throw core::ChunkSizeMismatch("Invalid " + what + ": " + std::to_string(size)); }
            return static_cast<uint64_t>(size);
        }

        std::vector<std::string> hex_strings(const Json& fields, const char* key) {
            std::vector<std::string> out;
            for (const auto& v : required_array(fields, key)) {
                if (!v.is_string()) { throw core::BadHeaderJson(std::string{"Header field '"} + key + "' holds a non-string entry"); }
                out.push_back(v.get<std::string>());
            }
            return out;
        }

        void check_version(int64_t version) {
            if (version < MIN_VERSION || version > MAX_VERSION) {
                throw core::UnknownVersion("Unknown version: " + std::to_string(version));
            }
        }

        template<size_t N>
        Json collect_extras(const Json& fields, const std::array<const char*, N>& known) {
            Json extras = Json::object();
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                bool is_known = false;
                for (const char* k : known) {
                    if (it.key() == k) {
                        is_known = true;
                        break;
                    }
                }
                if (!is_known) { extras[it.key()] = it.value(); }
            }
            return extras;
        }
    } // anonymous namespace

    // ==================== Hex fields ====================

    std::string to_hex16(uint64_t value) {
        std::array<char, 16> buf{};
        buf.fill('0');
        std::array<char, 16> digits{};
        const auto [end, ec] = std::to_chars(digits.data(), digits.data() + digits.size(), value, 16);
        const auto n = static_cast<size_t>(end - digits.data());
        std::copy(digits.data(), end, buf.data() + (16 - n));
        return {buf.data(), buf.size()};
    }

    uint64_t parse_hex(std::string_view text, std::string_view field) {
        uint64_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value, 16);
        if (text.empty() || ec != std::errc{} || ptr != last) {
            throw core::BadHeaderJson("Header field '" + std::string{field} + "' has malformed hex value '" + std::string{text} + "'");
        }
        return value;
    }

    // ==================== LegacyChunkTable ====================

    uint64_t LegacyChunkTable::byte_count() const noexcept {
        return std::accumulate(chunk_sizes.begin(), chunk_sizes.end(), uint64_t{0});
    }

    // ==================== VersionedHeader ====================

    std::string VersionedHeader::now_string() {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::array<char, 64> buf{};
        const size_t n = std::strftime(buf.data(), buf.size(), "%a %b %d %H:%M:%S %Y", &local);
        return {buf.data(), n};
    }

    Json VersionedHeader::default_emod_info() {
        return Json{
            {"emod_major_version", 0},
            {"emod_minor_version", 0},
            {"emod_revision_number", 0},
            {"ser_pop_major_version", 0},
            {"ser_pop_minor_version", 0},
            {"ser_pop_patch_version", 0},
            {"emod_build_date", "Mon Jan 1 00:00:00 1970"},
            {"emod_builder_name", ""},
            {"emod_sccs_branch", 0},
            {"emod_sccs_date", "Mon Jan 1 00:00:00 1970"}
        };
    }

    VersionedHeader VersionedHeader::make_default(int version, Compression legacy_compression) {
        check_version(version);

        VersionedHeader h;
        h.version_ = version;
        h.date_ = now_string();

        if (version < 6) {
            check_legacy_compression(version, legacy_compression);
            h.author_ = "unknown";
            h.tool_ = "popstate";
            h.table_ = LegacyChunkTable{legacy_compression, {}};
            if (version == 5) { h.emod_info_ = default_emod_info(); }
        }
        else {
            h.author_ = "IDM";
            h.tool_ = "DTK";
            h.emod_info_ = default_emod_info();
            h.table_ = ChunkTableV6{};
        }
        return h;
    }

    VersionedHeader VersionedHeader::parse(std::string_view text) {
        Json root;
        try { root = Json::parse(text); }
        catch (const Json::parse_error& e) { throw core::BadHeaderJson(std::string{"Couldn't decode JSON header: "} + e.what()); }

        if (!root.is_object()) { throw core::BadHeaderJson("Header is not a JSON object"); }

        // v1-3 writers wrap the header in {"metadata": {...}}
        if (root.contains("metadata")) {
            Json inner = std::move(root["metadata"]);
            if (!inner.is_object()) { throw core::BadHeaderJson("Header 'metadata' is not a JSON object"); }
            root = std::move(inner);
        }

        int64_t version = 1;
        if (const auto it = root.find("version"); it != root.end()) { version = as_integer(*it, "version"); }
        check_version(version);

        try {
            if (version < 6) { return parse_legacy(root, static_cast<int>(version)); }
            return parse_v6(root);
        }
        catch (const Json::exception& e) { throw core::BadHeaderJson(std::string{"Malformed header: "} + e.what()); }
    }

    VersionedHeader VersionedHeader::parse_legacy(Json& fields, int version) {
        VersionedHeader h;
        h.version_ = version;
        h.author_ = optional_string(fields, "author");
        h.date_ = optional_string(fields, "date");
        h.tool_ = optional_string(fields, "tool");

        LegacyChunkTable table;

        if (version < 2) {
            // Original layout: compressed flag + bytecount, snappy implied; "engine" is ignored
            const auto it = fields.find("compressed");
            const bool compressed = it != fields.end() && it->is_boolean() && it->get<bool>();
            table.compression = compressed ? Compression::Snappy : Compression::None;
            table.chunk_sizes.push_back(positive_size(as_integer(required(fields, "bytecount"), "bytecount"), "chunk size"));
        }
        else {
            const char* key = (version >= 4 && fields.contains("compression")) ? "compression" : "engine";
            table.compression = parse_legacy_name(required_string(fields, key));

            for (const auto& v : required_array(fields, "chunksizes")) {
                table.chunk_sizes.push_back(positive_size(as_integer(v, "chunksizes"), "chunk size"));
            }
            if (table.chunk_sizes.empty()) { throw core::BadHeaderJson("Header declares no chunks"); }
        }

        if (const auto it = fields.find("emod_info"); it != fields.end()) { h.emod_info_ = *it; }

        h.table_ = std::move(table);
        h.extras_ = collect_extras(fields, LEGACY_KEYS);
        return h;
    }

    VersionedHeader VersionedHeader::parse_v6(Json& fields) {
        VersionedHeader h;
        h.version_ = 6;
        h.author_ = optional_string(fields, "author");
        h.date_ = optional_string(fields, "date");
        h.tool_ = optional_string(fields, "tool");
        if (const auto it = fields.find("emod_info"); it != fields.end()) { h.emod_info_ = *it; }

        ChunkTableV6 table;

        const uint64_t sim_size = parse_hex(required_string(fields, "sim_chunk_size"), "sim_chunk_size");
        if (sim_size == 0) { throw core::ChunkSizeMismatch("Invalid 'sim_chunk_size': 0"); }
        table.simulation = ChunkRef{parse_v6_code(required_string(fields, "sim_compression")), sim_size};

        const auto node_suids = hex_strings(fields, "node_suids");
        const auto node_codes = hex_strings(fields, "node_compressions");
        const auto node_sizes = hex_strings(fields, "node_chunk_sizes");
        if (node_suids.size() != node_sizes.size() || node_codes.size() != node_sizes.size()) {
            throw core::BadHeaderJson("Header node tables differ in length: suids=" + std::to_string(node_suids.size())
                                      + " compressions=" + std::to_string(node_codes.size())
                                      + " sizes=" + std::to_string(node_sizes.size()));
        }
        for (size_t i = 0; i < node_sizes.size(); ++i) {
            const uint64_t size = parse_hex(node_sizes[i], "node_chunk_sizes");
            if (size == 0) { throw core::ChunkSizeMismatch("Invalid 'node_chunk_size' at index " + std::to_string(i) + ": 0"); }
            table.nodes.push_back(NodeChunkRef{parse_hex(node_suids[i], "node_suids"), parse_v6_code(node_codes[i]), size});
        }

        const auto human_codes = hex_strings(fields, "human_compressions");
        const auto human_suids = hex_strings(fields, "human_node_suids");
        const auto human_counts = hex_strings(fields, "human_num_humans");
        const auto human_sizes = hex_strings(fields, "human_chunk_sizes");
        if (human_codes.size() != human_sizes.size() || human_suids.size() != human_sizes.size()
            || human_counts.size() != human_sizes.size()) {
            throw core::BadHeaderJson("Header human tables differ in length: compressions=" + std::to_string(human_codes.size())
                                      + " node_suids=" + std::to_string(human_suids.size())
                                      + " num_humans=" + std::to_string(human_counts.size())
                                      + " sizes=" + std::to_string(human_sizes.size()));
        }
        for (size_t i = 0; i < human_sizes.size(); ++i) {
            const uint64_t size = parse_hex(human_sizes[i], "human_chunk_sizes");
            if (size == 0) { throw core::ChunkSizeMismatch("Invalid 'human_chunk_size' at index " + std::to_string(i) + ": 0"); }
            table.humans.push_back(HumanChunkRef{
                parse_hex(human_suids[i], "human_node_suids"),
                parse_hex(human_counts[i], "human_num_humans"),
                parse_v6_code(human_codes[i]),
                size
            });
        }

        h.table_ = std::move(table);
        h.extras_ = collect_extras(fields, V6_KEYS);
        return h;
    }

    std::string VersionedHeader::serialize() const {
        if (version_ < 6) {
            Json fields = legacy_fields();
            if (version_ <= 3) { return core::dump_compact(Json{{"metadata", std::move(fields)}}); }
            return core::dump_compact(fields);
        }
        return core::dump_compact(v6_fields());
    }

    Json VersionedHeader::legacy_fields() const {
        const auto& table = legacy();

        Json j = Json::object();
        j["author"] = author_;
        j["bytecount"] = table.byte_count();
        j["chunkcount"] = table.chunk_sizes.size();
        j["chunksizes"] = table.chunk_sizes;
        j["compressed"] = table.compression != Compression::None;
        j["date"] = date_;
        j[version_ >= 4 ? "compression" : "engine"] = legacy_name(table.compression);
        j["tool"] = tool_;
        j["version"] = version_;
        if (emod_info_) { j["emod_info"] = *emod_info_; }

        for (auto it = extras_.begin(); it != extras_.end(); ++it) { j[it.key()] = it.value(); }
        return j;
    }

    Json VersionedHeader::v6_fields() const {
        const auto& table = chunked();

        Json j = Json::object();
        j["version"] = version_;
        j["author"] = author_;
        j["tool"] = tool_;
        j["date"] = date_;
        if (emod_info_) { j["emod_info"] = *emod_info_; }

        j["sim_compression"] = v6_code(table.simulation.compression);
        j["sim_chunk_size"] = to_hex16(table.simulation.size);

        Json suids = Json::array(), codes = Json::array(), sizes = Json::array();
        for (const auto& n : table.nodes) {
            suids.push_back(to_hex16(n.suid));
            codes.push_back(v6_code(n.compression));
            sizes.push_back(to_hex16(n.size));
        }
        j["node_suids"] = std::move(suids);
        j["node_compressions"] = std::move(codes);
        j["node_chunk_sizes"] = std::move(sizes);

        Json h_codes = Json::array(), h_suids = Json::array(), h_counts = Json::array(), h_sizes = Json::array();
        for (const auto& c : table.humans) {
            h_codes.push_back(v6_code(c.compression));
            h_suids.push_back(to_hex16(c.node_suid));
            h_counts.push_back(to_hex16(c.record_count));
            h_sizes.push_back(to_hex16(c.size));
        }
        j["human_compressions"] = std::move(h_codes);
        j["human_node_suids"] = std::move(h_suids);
        j["human_num_humans"] = std::move(h_counts);
        j["human_chunk_sizes"] = std::move(h_sizes);

        for (auto it = extras_.begin(); it != extras_.end(); ++it) { j[it.key()] = it.value(); }
        return j;
    }

    const LegacyChunkTable& VersionedHeader::legacy() const {
        if (const auto* t = std::get_if<LegacyChunkTable>(&table_)) { return *t; }
        throw std::logic_error("VersionedHeader: generation " + std::to_string(version_) + " has no legacy chunk table");
    }

    LegacyChunkTable& VersionedHeader::legacy() {
        if (auto* t = std::get_if<LegacyChunkTable>(&table_)) { return *t; }
        throw std::logic_error("VersionedHeader: generation " + std::to_string(version_) + " has no legacy chunk table");
    }

    const ChunkTableV6& VersionedHeader::chunked() const {
        if (const auto* t = std::get_if<ChunkTableV6>(&table_)) { return *t; }
        throw std::logic_error("VersionedHeader: generation " + std::to_string(version_) + " has no per-chunk tables");
    }

    ChunkTableV6& VersionedHeader::chunked() {
        if (auto* t = std::get_if<ChunkTableV6>(&table_)) { return *t; }
        throw std::logic_error("VersionedHeader: generation " + std::to_string(version_) + " has no per-chunk tables");
    }

    void check_legacy_compression(int version, Compression scheme) {
        if (version == 1 && scheme == Compression::Lz4) {
            throw core::UnsupportedCodec("Generation 1 files cannot record LZ4 compression (only NONE or SNAPPY)");
        }
    }
} // namespace popstate::format::header
