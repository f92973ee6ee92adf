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

// popstate/include/popstate/Export.hpp
#pragma once

/**
 * Symbol visibility macros for shared library export/import.
 *
 * - POPSTATE_API: Used for public API classes and functions
 * - POPSTATE_LOCAL: Used for internal symbols (hidden visibility)
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef POPSTATE_BUILD_SHARED
        #define POPSTATE_API __declspec(dllexport)
    #else
        #define POPSTATE_API __declspec(dllimport)
    #endif
    #define POPSTATE_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef POPSTATE_BUILD_SHARED
        #define POPSTATE_API __attribute__((visibility("default")))
        #define POPSTATE_LOCAL __attribute__((visibility("hidden")))
    #else
        #define POPSTATE_API
        #define POPSTATE_LOCAL
    #endif
#else
    #define POPSTATE_API
    #define POPSTATE_LOCAL
#endif
