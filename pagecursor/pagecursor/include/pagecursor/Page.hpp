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

// pagecursor/pagecursor/include/pagecursor/Page.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Page model shared by the iterator and every page source.
 *
 * A page source answers one PageRequest with one Page. Positions inside the
 * result set are exchanged as opaque Cursor tokens issued by the source and
 * handed back verbatim on the following request.
 */
namespace pagecursor {
    // ==================== Cursor ====================

    /**
     * Cursor - Opaque position token issued by a page source.
     *
     * Only the issuing source may interpret the bytes. Everything else
     * stores, compares and forwards them.
     */
    class Cursor {
    public:
        Cursor() = default;

        explicit Cursor(std::string token) : token_{std::move(token)} {}

        [[nodiscard]] const std::string& token() const noexcept { return token_; }

        [[nodiscard]] bool empty() const noexcept { return token_.empty(); }

        [[nodiscard]] friend bool operator==(const Cursor& a, const Cursor& b) noexcept = default;

    private:
        std::string token_;
    };

    // ==================== Direction ====================

    /**
     * Traversal direction.
     *
     * Forward follows `after` cursors, Backward follows `before` cursors.
     */
    enum class Direction : uint8_t {
        Forward,
        Backward
    };

    [[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept {
        return d == Direction::Forward ? "forward" : "backward";
    }

    // ==================== Page ====================

    /**
     * Page - One response unit from a page source.
     *
     * Items keep the order the source returned them in.
     * `before` marks the position just before the first item and is present
     * iff more data exists backwards; `after` marks the position after the
     * last item and is present iff more data exists forwards.
     */
    template <typename Raw>
    struct Page {
        std::vector<Raw> items;
        std::optional<Cursor> before;
        std::optional<Cursor> after;

        /**
         * Returns the continuation cursor for the given direction.
         */
        [[nodiscard]] const std::optional<Cursor>& continuation(Direction d) const noexcept {
            return d == Direction::Forward ? after : before;
        }
    };

    // ==================== PageRequest ====================

    /**
     * PageRequest - Parameters of a single fetch.
     *
     * `cursor` is an `after` cursor for Forward requests and a `before`
     * cursor for Backward requests, so the two can never be set at once.
     * `bound` is a standing limit on the first key component: inclusive
     * upper limit for Forward, inclusive lower limit for Backward. It is
     * repeated on every request of a traversal.
     */
    template <typename Key = int64_t>
    struct PageRequest {
        std::string index;
        Direction direction = Direction::Forward;
        std::optional<Cursor> cursor;
        size_t size = 0;
        std::optional<Key> bound;

        [[nodiscard]] const Cursor* after() const noexcept {
            return direction == Direction::Forward && cursor ? &*cursor : nullptr;
        }

        [[nodiscard]] const Cursor* before() const noexcept {
            return direction == Direction::Backward && cursor ? &*cursor : nullptr;
        }
    };
} // namespace pagecursor
