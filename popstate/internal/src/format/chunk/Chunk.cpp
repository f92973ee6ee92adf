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

// internal/src/format/chunk/Chunk.cpp
#include "format/chunk/Chunk.hpp"
#include "core/Errors.hpp"
#include "core/codec/Codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace popstate::format::chunk {
    namespace {
        std::span<const uint8_t> as_bytes(std::string_view text) noexcept {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        ChunkOrigin with_kind(ChunkOrigin origin, ChunkKind kind) noexcept {
            origin.kind = kind;
            return origin;
        }
    } // anonymous namespace

    std::string_view to_string(ChunkKind kind) noexcept {
        switch (kind) {
            case ChunkKind::Simulation: return "simulation";
            case ChunkKind::Node: return "node";
            case ChunkKind::HumanCollection: return "human collection";
        }
        return "unknown";
    }

    // ==================== ChunkStats ====================

    uint64_t ChunkStats::live_total() const noexcept {
        uint64_t total = 0;
        for (const auto& c : by_kind_) { total += c.live; }
        return total;
    }

    void ChunkStats::on_materialize(ChunkKind kind) noexcept {
        auto& c = by_kind_[static_cast<size_t>(kind)];
        ++c.live;
        ++c.materializations;
        c.peak = std::max(c.peak, c.live);
        peak_total_ = std::max(peak_total_, live_total());
    }

    void ChunkStats::on_commit(ChunkKind kind) noexcept {
        auto& c = by_kind_[static_cast<size_t>(kind)];
        if (c.live > 0) { --c.live; }
        ++c.commits;
    }

    void ChunkStats::on_release(ChunkKind kind) noexcept {
        auto& c = by_kind_[static_cast<size_t>(kind)];
        if (c.live > 0) { --c.live; }
    }

    void ChunkStats::reset() noexcept {
        for (auto& c : by_kind_) {
            c.peak = c.live;
            c.materializations = 0;
            c.commits = 0;
        }
        peak_total_ = live_total();
    }

    // ==================== Chunk ====================

    Chunk::Chunk(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, OwnedBuffer bytes, Compression compression)
        : Chunk{std::move(context), origin, Compressed{std::move(bytes), compression}} {}

    Chunk::Chunk(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, std::variant<Compressed, Decoded> state)
        : context_{std::move(context)}, origin_{origin}, state_{std::move(state)} {
        if (!context_) { throw std::invalid_argument("Chunk: context must not be null"); }
    }

    Chunk Chunk::from_record(std::shared_ptr<ChunkContext> context, ChunkOrigin origin, const Json& record) {
        if (!context) { throw std::invalid_argument("Chunk: context must not be null"); }
        auto committed = encode(*context, core::dump_compact(record));
        return Chunk{std::move(context), origin, std::move(committed)};
    }

    Chunk::~Chunk() { release_decoded(); }

    Chunk& Chunk::operator=(Chunk&& other) noexcept {
        if (this != &other) {
            release_decoded();
            context_ = std::move(other.context_);
            origin_ = other.origin_;
            state_ = std::move(other.state_);
        }
        return *this;
    }

    void Chunk::release_decoded() noexcept {
        if (context_ && is_materialized()) { context_->stats.on_release(origin_.kind); }
    }

    Chunk::Compressed Chunk::encode(const ChunkContext& context, std::string_view text) {
        const Compression scheme = context.pinned.value_or(core::codec::select_v6_compression(text.size()));
        return Compressed{core::codec::compress(as_bytes(text), scheme), scheme};
    }

    void Chunk::materialize() {
        if (is_materialized()) { return; }

        const auto& packed = std::get<Compressed>(state_);

        Json parsed;
        try {
            const OwnedBuffer raw = core::codec::decompress(packed.bytes.view(), packed.compression);
            parsed = Json::parse(raw.as_string_view());
        }
        catch (const core::CorruptChunk& e) { throw core::CorruptChunk(label() + ": " + e.what()); }
        catch (const Json::parse_error& e) {
            throw core::CorruptChunk("Could not parse JSON in " + label() + " with size " + std::to_string(packed.bytes.size())
                                     + ": " + e.what());
        }

        Json record = unwrap(std::move(parsed));

        state_ = Decoded{std::move(record)};
        context_->stats.on_materialize(origin_.kind);
    }

    void Chunk::commit() {
        if (!is_materialized()) { return; }

        auto committed = encode(*context_, serialize(std::get<Decoded>(state_).record));
        state_ = std::move(committed);
        context_->stats.on_commit(origin_.kind);
    }

    Json& Chunk::json() {
        materialize();
        return std::get<Decoded>(state_).record;
    }

    void Chunk::replace(Json record) {
        if (auto* decoded = std::get_if<Decoded>(&state_)) {
            decoded->record = std::move(record);
            return;
        }
        state_ = Decoded{std::move(record)};
        context_->stats.on_materialize(origin_.kind);
    }

    void Chunk::recompress(Compression target) {
        if (auto bytes = encoded_as(target)) { adopt(std::move(*bytes), target); }
    }

    std::optional<OwnedBuffer> Chunk::encoded_as(Compression target) const {
        const auto* packed = std::get_if<Compressed>(&state_);
        if (packed == nullptr || packed->compression == target) { return std::nullopt; }

        try {
            const OwnedBuffer raw = core::codec::decompress(packed->bytes.view(), packed->compression);
            return core::codec::compress(raw.view(), target);
        }
        catch (const core::CorruptChunk& e) { throw core::CorruptChunk(label() + ": " + e.what()); }
    }

    void Chunk::adopt(OwnedBuffer bytes, Compression compression) noexcept {
        if (auto* packed = std::get_if<Compressed>(&state_)) {
            packed->bytes = std::move(bytes);
            packed->compression = compression;
        }
    }

    std::string Chunk::decompressed_text() const {
        if (const auto* decoded = std::get_if<Decoded>(&state_)) { return serialize(decoded->record); }

        const auto& packed = std::get<Compressed>(state_);
        try {
            const OwnedBuffer raw = core::codec::decompress(packed.bytes.view(), packed.compression);
            return std::string{raw.as_string_view()};
        }
        catch (const core::CorruptChunk& e) { throw core::CorruptChunk(label() + ": " + e.what()); }
    }

    Compression Chunk::compression() const {
        if (const auto* packed = std::get_if<Compressed>(&state_)) { return packed->compression; }
        throw std::logic_error("Chunk: " + label() + " is materialized; commit it first");
    }

    uint64_t Chunk::byte_size() const {
        if (const auto* packed = std::get_if<Compressed>(&state_)) { return packed->bytes.size(); }
        throw std::logic_error("Chunk: " + label() + " is materialized; commit it first");
    }

    std::span<const uint8_t> Chunk::bytes() const {
        if (const auto* packed = std::get_if<Compressed>(&state_)) { return packed->bytes.view(); }
        throw std::logic_error("Chunk: " + label() + " is materialized; commit it first");
    }

    std::string Chunk::label() const {
        std::string out{to_string(origin_.kind)};
        out += " chunk " + std::to_string(origin_.index);
        if (origin_.node_suid) { out += " (node suid " + std::to_string(*origin_.node_suid) + ")"; }
        out += " of '" + (context_ ? context_->source : std::string{"<moved>"}) + "'";
        return out;
    }

    // ==================== HumanCollectionChunk ====================

    HumanCollectionChunk::HumanCollectionChunk(std::shared_ptr<ChunkContext> context,
                                               ChunkOrigin origin,
                                               OwnedBuffer bytes,
                                               Compression compression,
                                               uint64_t declared_count)
        : HumanCollectionChunk{std::move(context), origin, Compressed{std::move(bytes), compression}, declared_count} {}

    HumanCollectionChunk::HumanCollectionChunk(std::shared_ptr<ChunkContext> context,
                                               ChunkOrigin origin,
                                               Compressed state,
                                               uint64_t declared_count)
        : Chunk{std::move(context), with_kind(origin, ChunkKind::HumanCollection), std::move(state)},
          declared_count_{declared_count},
          ordinal_{this->context().next_human_ordinal++} {}

    HumanCollectionChunk HumanCollectionChunk::from_records(std::shared_ptr<ChunkContext> context,
                                                            uint64_t node_suid,
                                                            const Json& records) {
        if (!context) { throw std::invalid_argument("HumanCollectionChunk: context must not be null"); }
        if (!records.is_array()) { throw std::invalid_argument("HumanCollectionChunk: records must be a JSON array"); }

        Json wrapped = Json::object();
        wrapped["human_collection"] = records;
        auto committed = encode(*context, core::dump_compact(wrapped));

        const ChunkOrigin origin{ChunkKind::HumanCollection, context->next_human_ordinal, node_suid};
        return HumanCollectionChunk{std::move(context), origin, std::move(committed), records.size()};
    }

    void HumanCollectionChunk::append(Json record) {
        records().push_back(std::move(record));
        ++declared_count_;
    }

    Json HumanCollectionChunk::unwrap(Json parsed) const {
        const auto it = parsed.find("human_collection");
        if (!parsed.is_object() || it == parsed.end() || !it->is_array()) {
            throw core::CorruptChunk(label() + " does not hold a 'human_collection' array");
        }

        Json records = std::move(*it);
        if (records.size() != declared_count_) {
            throw core::RecordCountMismatch("Number of humans in " + label() + " [" + std::to_string(records.size())
                                            + "] does not match num_humans attribute [" + std::to_string(declared_count_) + "]");
        }
        return records;
    }

    std::string HumanCollectionChunk::serialize(const Json& records) const {
        return "{\"human_collection\":" + core::dump_compact(records) + "}";
    }
} // namespace popstate::format::chunk
