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

// pagecursor/pagecursor/include/pagecursor/Errors.hpp
#pragma once

#include "pagecursor/Export.hpp"
#include "pagecursor/Page.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pagecursor {
    /**
     * Base class of every failure raised by PageCursor.
     */
    class PAGECURSOR_API PageCursorError : public std::runtime_error {
    public:
        explicit PageCursorError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * FetchFailure - A page source could not answer a request.
     *
     * Raised by fetch adapters, never retried by the iterator. The kind lets
     * a caller that wraps the adapter decide whether a retry makes sense.
     */
    class PAGECURSOR_API FetchFailure : public PageCursorError {
    public:
        enum class Kind : uint8_t {
            Transient, ///< network, timeout, throttling
            Permanent ///< invalid request, unknown index, auth
        };

        FetchFailure(Kind kind, const std::string& msg);

        [[nodiscard]] Kind kind() const noexcept { return kind_; }

        [[nodiscard]] bool is_transient() const noexcept { return kind_ == Kind::Transient; }

    private:
        Kind kind_;
    };

    [[nodiscard]] PAGECURSOR_API std::string_view to_string(FetchFailure::Kind kind) noexcept;

    /**
     * MaterializationFailure - A raw entry of a fetched page could not be
     * converted into the caller's record type.
     *
     * The whole page is rejected. page_cursor() is the cursor the failing
     * page was fetched with (nullopt for the first page), so the caller can
     * request exactly that page again.
     */
    class PAGECURSOR_API MaterializationFailure : public PageCursorError {
    public:
        MaterializationFailure(
            size_t entry_index,
            size_t page_item_count,
            std::optional<Cursor> page_cursor,
            const std::string& cause
        );

        [[nodiscard]] size_t entry_index() const noexcept { return entry_index_; }

        [[nodiscard]] size_t page_item_count() const noexcept { return page_item_count_; }

        [[nodiscard]] const std::optional<Cursor>& page_cursor() const noexcept { return page_cursor_; }

    private:
        size_t entry_index_;
        size_t page_item_count_;
        std::optional<Cursor> page_cursor_;
    };

    /**
     * MisuseFailure - The API was used against its contract
     * (invalid construction arguments, re-entrant calls).
     */
    class PAGECURSOR_API MisuseFailure : public PageCursorError {
    public:
        explicit MisuseFailure(const std::string& msg) : PageCursorError("misuse: " + msg) {}
    };

    /**
     * ConfigError - A configuration document is missing or invalid.
     */
    class PAGECURSOR_API ConfigError : public PageCursorError {
    public:
        explicit ConfigError(const std::string& msg) : PageCursorError("config: " + msg) {}
    };
} // namespace pagecursor
