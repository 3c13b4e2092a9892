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

// pagecursor/pagecursor/src/Errors.cpp
#include "pagecursor/Errors.hpp"

#include <utility>

namespace pagecursor {
    namespace {
        std::string describe_fetch(FetchFailure::Kind kind, const std::string& msg) {
            return "fetch failed (" + std::string{to_string(kind)} + "): " + msg;
        }

        std::string describe_materialization(size_t entry_index, size_t page_item_count, const std::string& cause) {
            return "materialization failed at entry " + std::to_string(entry_index) +
                " of " + std::to_string(page_item_count) + "; page discarded: " + cause;
        }
    } // anonymous namespace

    std::string_view to_string(FetchFailure::Kind kind) noexcept {
        switch (kind) {
            case FetchFailure::Kind::Transient: return "transient";
            case FetchFailure::Kind::Permanent: return "permanent";
        }
        return "unknown";
    }

    FetchFailure::FetchFailure(Kind kind, const std::string& msg)
        : PageCursorError(describe_fetch(kind, msg)), kind_{kind} {}

    MaterializationFailure::MaterializationFailure(
        size_t entry_index,
        size_t page_item_count,
        std::optional<Cursor> page_cursor,
        const std::string& cause
    )
        : PageCursorError(describe_materialization(entry_index, page_item_count, cause)),
          entry_index_{entry_index},
          page_item_count_{page_item_count},
          page_cursor_{std::move(page_cursor)} {}
} // namespace pagecursor
