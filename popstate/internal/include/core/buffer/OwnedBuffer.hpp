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

// internal/include/core/buffer/OwnedBuffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>

namespace popstate::core {
    /**
 * OwnedBuffer - RAII-managed byte buffer holding one chunk payload.
 *
 * Compressed chunk bytes live in an OwnedBuffer from the moment they are
 * read off disk (or produced by a codec) until the chunk is materialized,
 * at which point the buffer is destroyed with the state that owned it.
 *
 * Design principles:
 * - RAII: Memory released when the buffer is destroyed or moved from
 * - Move-only: A payload has exactly one owner
 * - Exact size: size() is the on-disk byte count of the payload
 *
 * Thread-safety: NOT thread-safe. Caller must ensure exclusive access.
 */
    class OwnedBuffer {
        public:
            /**
     * Constructs an empty buffer.
     */
            OwnedBuffer() noexcept = default;

            /**
     * Allocates an uninitialized buffer of the given size.
     *
     * @param size Size in bytes (0 yields an empty buffer)
     * @throws std::bad_alloc if allocation fails
     */
            [[nodiscard]] static OwnedBuffer allocate(size_t size);

            /**
     * Allocates a buffer holding a copy of the given bytes.
     */
            [[nodiscard]] static OwnedBuffer copy_of(std::span<const uint8_t> bytes);

            /**
     * Allocates a buffer holding a copy of the given text.
     */
            [[nodiscard]] static OwnedBuffer copy_of(std::string_view text);

            OwnedBuffer(OwnedBuffer&& other) noexcept
                : data_{std::move(other.data_)}, size_{other.size_} { other.size_ = 0; }

            OwnedBuffer& operator=(OwnedBuffer&& other) noexcept {
                if (this != &other) {
                    data_ = std::move(other.data_);
                    size_ = other.size_;
                    other.size_ = 0;
                }
                return *this;
            }

            OwnedBuffer(const OwnedBuffer&) = delete;
            OwnedBuffer& operator=(const OwnedBuffer&) = delete;

            [[nodiscard]] std::span<const uint8_t> view() const noexcept { return {data_.get(), size_}; }

            [[nodiscard]] std::span<uint8_t> view() noexcept { return {data_.get(), size_}; }

            [[nodiscard]] uint8_t* data() noexcept { return data_.get(); }

            [[nodiscard]] const uint8_t* data() const noexcept { return data_.get(); }

            [[nodiscard]] size_t size() const noexcept { return size_; }

            [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

            /**
     * Views the payload as text (decoded JSON payloads are UTF-8).
     */
            [[nodiscard]] std::string_view as_string_view() const noexcept {
                return {reinterpret_cast<const char*>(data_.get()), size_};
            }

            /**
     * Creates a deep copy of this buffer.
     */
            [[nodiscard]] OwnedBuffer clone() const { return copy_of(view()); }

            /**
     * Shrinks the logical size after a codec wrote fewer bytes than it reserved.
     *
     * The slack is returned to the allocator by reallocating when it exceeds
     * a quarter of the reservation.
     *
     * @throws std::invalid_argument if new_size > size()
     */
            void shrink_to(size_t new_size);

            /**
     * Releases the memory immediately.
     */
            void reset() noexcept {
                data_.reset();
                size_ = 0;
            }

        private:
            OwnedBuffer(std::unique_ptr<uint8_t[]> data, size_t size) noexcept : data_{std::move(data)}, size_{size} {}

            std::unique_ptr<uint8_t[]> data_;
            size_t size_{0};
    };
} // namespace popstate::core
