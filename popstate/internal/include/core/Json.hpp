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

// internal/include/core/Json.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace popstate::core {
    /**
     * Opaque structured record (simulation, node, individual).
     *
     * ordered_json keeps the member order of the file so that a read/write
     * cycle reproduces the serializer's key order.
     */
    using Json = nlohmann::ordered_json;

    /**
     * Compact, ASCII-escaped serialization (',' and ':' separators, no spaces).
     */
    [[nodiscard]] inline std::string dump_compact(const Json& value) { return value.dump(-1, ' ', true); }
} // namespace popstate::core
