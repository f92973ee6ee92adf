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

// internal/src/core/Errors.cpp
#include "core/Errors.hpp"

namespace popstate::core {
    std::string_view to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::BadMagic: return "BadMagic";
            case ErrorCode::BadHeaderSize: return "BadHeaderSize";
            case ErrorCode::BadHeaderJson: return "BadHeaderJson";
            case ErrorCode::UnknownVersion: return "UnknownVersion";
            case ErrorCode::ChunkSizeMismatch: return "ChunkSizeMismatch";
            case ErrorCode::CorruptChunk: return "CorruptChunk";
            case ErrorCode::RecordCountMismatch: return "RecordCountMismatch";
            case ErrorCode::UnsupportedCodec: return "UnsupportedCodec";
            case ErrorCode::ProtectedKey: return "ProtectedKey";
            case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        }
        return "Unknown";
    }
} // namespace popstate::core
