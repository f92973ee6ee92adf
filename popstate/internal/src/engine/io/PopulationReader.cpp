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

// internal/src/engine/io/PopulationReader.cpp
#include "engine/io/PopulationReader.hpp"
#include "format/FileFraming.hpp"

#include <stdexcept>

namespace popstate::engine::io {
    using container::ChunkedLayout;
    using container::LegacyLayout;
    using format::FileFraming;

    std::string_view to_string(PopulationReader::State state) noexcept {
        switch (state) {
            case PopulationReader::State::Unopened: return "Unopened";
            case PopulationReader::State::HeaderRead: return "HeaderRead";
            case PopulationReader::State::ChunksIndexed: return "ChunksIndexed";
            case PopulationReader::State::Ready: return "Ready";
            case PopulationReader::State::Failed: return "Failed";
        }
        return "Unknown";
    }

    std::unique_ptr<PopulationReader> PopulationReader::open(const std::filesystem::path& path) {
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file) { throw std::runtime_error("PopulationReader: failed to open file '" + path.string() + "'"); }

        return std::unique_ptr<PopulationReader>(new PopulationReader(std::move(file), path.string()));
    }

    PopulationReader::PopulationReader(std::istream& in, std::string source)
        : in_{&in}, context_{std::make_shared<format::chunk::ChunkContext>()} { context_->source = std::move(source); }

    PopulationReader::PopulationReader(std::unique_ptr<std::ifstream> file, std::string source)
        : file_{std::move(file)}, in_{file_.get()}, context_{std::make_shared<format::chunk::ChunkContext>()} {
        context_->source = std::move(source);
    }

    void PopulationReader::expect(State expected, std::string_view step) const {
        if (state_ != expected) {
            throw std::logic_error("PopulationReader: " + std::string{step} + " needs state " + std::string{to_string(expected)}
                                   + ", reader is " + std::string{to_string(state_)});
        }
    }

    template<typename Step>
    void PopulationReader::run(Step&& step) {
        try { step(); }
        catch (...) {
            state_ = State::Failed;
            throw;
        }
    }

    const VersionedHeader& PopulationReader::read_header() {
        expect(State::Unopened, "read_header");

        run([this] {
            FileFraming::read_magic(*in_);
            const uint64_t size = FileFraming::read_header_size(*in_);
            const std::string text = FileFraming::read_header_text(*in_, size);
            header_ = VersionedHeader::parse(text);
        });

        state_ = State::HeaderRead;
        return *header_;
    }

    void PopulationReader::index_chunks() {
        expect(State::HeaderRead, "index_chunks");

        run([this] {
            if (header_->is_chunked()) { layout_.emplace(ChunkedLayout::read_chunks(*in_, *header_, context_)); }
            else { layout_.emplace(LegacyLayout::read_chunks(*in_, *header_, context_)); }
        });

        state_ = State::ChunksIndexed;
    }

    Container PopulationReader::finish() {
        expect(State::ChunksIndexed, "finish");

        Container c{std::move(*header_), std::move(*layout_), context_};
        header_.reset();
        layout_.reset();
        file_.reset();
        state_ = State::Ready;
        return c;
    }

    Container PopulationReader::read() {
        if (state_ == State::Unopened) { read_header(); }
        if (state_ == State::HeaderRead) { index_chunks(); }
        return finish();
    }

    const VersionedHeader& PopulationReader::header() const {
        if (!header_) {
            throw std::logic_error("PopulationReader: no header in state " + std::string{to_string(state_)});
        }
        return *header_;
    }
} // namespace popstate::engine::io
