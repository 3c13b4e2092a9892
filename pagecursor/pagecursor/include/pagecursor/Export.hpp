/*
 * PageCursor
 * Copyright (C) 2025 Swift Storm Studio
 *
 * This file is part of PageCursor.
 *
 * PageCursor is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * PageCursor is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with PageCursor.  If not, see <https://www.gnu.org/licenses/>.
 */

// pagecursor/pagecursor/include/pagecursor/Export.hpp
#pragma once

/**
 * Symbol visibility macros for shared library export/import.
 *
 * PAGECURSOR_API marks public API classes and functions. Everything else is
 * hidden when the library is built shared.
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PAGECURSOR_BUILD_SHARED
        #define PAGECURSOR_API __declspec(dllexport)
    #elif defined(PAGECURSOR_USE_SHARED)
        #define PAGECURSOR_API __declspec(dllimport)
    #else
        #define PAGECURSOR_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PAGECURSOR_BUILD_SHARED
        #define PAGECURSOR_API __attribute__((visibility("default")))
    #else
        #define PAGECURSOR_API
    #endif
#else
    #define PAGECURSOR_API
#endif
