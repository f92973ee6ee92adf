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

// internal/src/core/buffer/OwnedBuffer.cpp
#include "core/buffer/OwnedBuffer.hpp"
#include <stdexcept>

namespace popstate::core {
    OwnedBuffer OwnedBuffer::allocate(size_t size) {
        // Zero-sized buffer is represented as empty OwnedBuffer
        if (size == 0) { return OwnedBuffer{}; }

        return OwnedBuffer{std::make_unique_for_overwrite<uint8_t[]>(size), size};
    }

    OwnedBuffer OwnedBuffer::copy_of(std::span<const uint8_t> bytes) {
        auto buf = allocate(bytes.size());
        if (!bytes.empty()) { std::memcpy(buf.data(), bytes.data(), bytes.size()); }
        return buf;
    }

    OwnedBuffer OwnedBuffer::copy_of(std::string_view text) {
        return copy_of(std::span<const uint8_t>{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
    }

    void OwnedBuffer::shrink_to(size_t new_size) {
        if (new_size > size_) { throw std::invalid_argument("OwnedBuffer::shrink_to: cannot grow"); }
        if (new_size == size_) { return; }

        if (new_size == 0) {
            reset();
            return;
        }

        const size_t slack = size_ - new_size;
        if (slack > size_ / 4) {
            auto exact = std::make_unique_for_overwrite<uint8_t[]>(new_size);
            std::memcpy(exact.get(), data_.get(), new_size);
            data_ = std::move(exact);
        }
        size_ = new_size;
    }
} // namespace popstate::core
