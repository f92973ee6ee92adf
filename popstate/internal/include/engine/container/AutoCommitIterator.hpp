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

// internal/include/engine/container/AutoCommitIterator.hpp
#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace popstate::engine::container {
    /**
     * AutoCommitIterator - Node iterator that commits each node as it moves past it.
     *
     * List requirements:
     *   loaded(i)  -> node i, materialized (a reference, or a view by value)
     *   release(i) -> commits node i
     *
     * A forward scan therefore holds one node decoded at a time. Leaving a
     * loop early keeps the current node decoded until the container commits.
     */
    template<typename List>
    class AutoCommitIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using reference = decltype(std::declval<List&>().loaded(0));
        using value_type = std::remove_cvref_t<reference>;
        using difference_type = std::ptrdiff_t;

        /**
         * Keeps a by-value view alive for the duration of one -> expression.
         */
        struct ArrowProxy {
            value_type value;
            value_type* operator->() noexcept { return &value; }
        };

        using pointer = std::conditional_t<std::is_reference_v<reference>, std::remove_reference_t<reference>*, ArrowProxy>;

        AutoCommitIterator() = default;
        AutoCommitIterator(List* list, size_t index) noexcept : list_{list}, index_{index} {}

        reference operator*() const { return list_->loaded(index_); }
        pointer operator->() const {
            if constexpr (std::is_reference_v<reference>) { return &list_->loaded(index_); }
            else { return ArrowProxy{list_->loaded(index_)}; }
        }

        AutoCommitIterator& operator++() {
            list_->release(index_);
            ++index_;
            return *this;
        }

        void operator++(int) { ++*this; }

        bool operator==(const AutoCommitIterator& other) const noexcept { return index_ == other.index_; }

        [[nodiscard]] size_t index() const noexcept { return index_; }

    private:
        List* list_{nullptr};
        size_t index_{0};
    };
} // namespace popstate::engine::container
