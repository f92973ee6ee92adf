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

// internal/include/engine/io/PopulationReader.hpp
#pragma once

#include "engine/container/Container.hpp"
#include "format/header/VersionedHeader.hpp"

#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace popstate::engine::io {
    using container::Container;
    using format::header::VersionedHeader;

    /**
     * PopulationReader - Opens one population state file, step by step.
     *
     * State machine:
     *   Unopened --read_header()--> HeaderRead --index_chunks()--> ChunksIndexed --finish()--> Ready
     *
     * Any failure moves the reader to Failed and rethrows:
     *   read_header():  BadMagic, BadHeaderSize, BadHeaderJson, UnknownVersion,
     *                   ChunkSizeMismatch (non-positive declared size), UnsupportedCodec
     *   index_chunks(): ChunkSizeMismatch (stream ends inside a chunk)
     *
     * Structural checks are eager. Chunk payloads are kept compressed, so
     * CorruptChunk / RecordCountMismatch surface on first access instead.
     *
     * Usage:
     * ```cpp
     * auto reader = PopulationReader::open("state.dtk");
     * Container c = reader->read();
     * ```
     */
    class PopulationReader {
    public:
        enum class State {
            Unopened,
            HeaderRead,
            ChunksIndexed,
            Ready,
            Failed,
        };

        /**
         * Opens a file for reading.
         *
         * @throws std::runtime_error if the file cannot be opened
         */
        [[nodiscard]] static std::unique_ptr<PopulationReader> open(const std::filesystem::path& path);

        /**
         * Reads from a caller-owned stream that must outlive the reader.
         *
         * @param source Name used in error messages
         */
        explicit PopulationReader(std::istream& in, std::string source = "<stream>");

        PopulationReader(const PopulationReader&) = delete;
        PopulationReader& operator=(const PopulationReader&) = delete;

        /**
         * Magic, header size field, header text.
         */
        const VersionedHeader& read_header();

        /**
         * Reads every chunk declared by the header, in order.
         */
        void index_chunks();

        /**
         * Hands the container over. The reader is spent afterwards.
         */
        [[nodiscard]] Container finish();

        /**
         * All remaining steps.
         */
        [[nodiscard]] Container read();

        [[nodiscard]] State state() const noexcept { return state_; }

        /**
         * @throws std::logic_error before read_header()
         */
        [[nodiscard]] const VersionedHeader& header() const;

    private:
        PopulationReader(std::unique_ptr<std::ifstream> file, std::string source);

        void expect(State expected, std::string_view step) const;

        template<typename Step>
        void run(Step&& step);

        std::unique_ptr<std::ifstream> file_;
        std::istream* in_;
        std::shared_ptr<format::chunk::ChunkContext> context_;
        std::optional<VersionedHeader> header_;
        std::optional<Container::Layout> layout_;
        State state_{State::Unopened};
    };

    [[nodiscard]] std::string_view to_string(PopulationReader::State state) noexcept;
} // namespace popstate::engine::io
