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

// internal/include/core/Errors.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace popstate::core {
    /**
     * Failure categories of the population state container engine.
     *
     * Every category is fatal for the open/read/write call in progress.
     */
    enum class ErrorCode {
        BadMagic,
        BadHeaderSize,
        BadHeaderJson,
        UnknownVersion,
        ChunkSizeMismatch,
        CorruptChunk,
        RecordCountMismatch,
        UnsupportedCodec,
        ProtectedKey,
        IndexOutOfRange,
    };

    /**
     * Returns the stable name of an error code ("BadMagic", ...).
     */
    [[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

    /**
     * PopStateError - Base exception for all container engine failures.
     */
    class PopStateError : public std::runtime_error {
    public:
        PopStateError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_{code} {}

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    /// First four bytes are not "IDTK".
    class BadMagic : public PopStateError {
    public:
        explicit BadMagic(const std::string& msg) : PopStateError(ErrorCode::BadMagic, msg) {}
    };

    /// Header length field is not a positive decimal, or the header is truncated.
    class BadHeaderSize : public PopStateError {
    public:
        explicit BadHeaderSize(const std::string& msg) : PopStateError(ErrorCode::BadHeaderSize, msg) {}
    };

    /// Header text is not valid JSON or does not have the expected shape.
    class BadHeaderJson : public PopStateError {
    public:
        explicit BadHeaderJson(const std::string& msg) : PopStateError(ErrorCode::BadHeaderJson, msg) {}
    };

    /// Header version outside [1, 6].
    class UnknownVersion : public PopStateError {
    public:
        explicit UnknownVersion(const std::string& msg) : PopStateError(ErrorCode::UnknownVersion, msg) {}
    };

    /// Declared chunk size is not positive, or the stream ended before the declared size.
    class ChunkSizeMismatch : public PopStateError {
    public:
        explicit ChunkSizeMismatch(const std::string& msg) : PopStateError(ErrorCode::ChunkSizeMismatch, msg) {}
    };

    /// Decompression or JSON parse failure on a well-framed chunk.
    class CorruptChunk : public PopStateError {
    public:
        explicit CorruptChunk(const std::string& msg) : PopStateError(ErrorCode::CorruptChunk, msg) {}
    };

    /// Human collection declared count differs from the decoded record count.
    class RecordCountMismatch : public PopStateError {
    public:
        explicit RecordCountMismatch(const std::string& msg) : PopStateError(ErrorCode::RecordCountMismatch, msg) {}
    };

    class UnsupportedCodec : public PopStateError {
    public:
        explicit UnsupportedCodec(const std::string& msg) : PopStateError(ErrorCode::UnsupportedCodec, msg) {}
    };

    /// Attempt to delete or subscript the reserved "individualHumans" key.
    class ProtectedKey : public PopStateError {
    public:
        explicit ProtectedKey(const std::string& msg) : PopStateError(ErrorCode::ProtectedKey, msg) {}
    };

    class IndexOutOfRange : public PopStateError {
    public:
        explicit IndexOutOfRange(const std::string& msg) : PopStateError(ErrorCode::IndexOutOfRange, msg) {}
    };
} // namespace popstate::core
