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

// pagecursor/pagecursor/include/pagecursor/PageCursorIterator.hpp
#pragma once

#include "pagecursor/Errors.hpp"
#include "pagecursor/Logging.hpp"
#include "pagecursor/Page.hpp"
#include "pagecursor/RangeFilter.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * PageCursorIterator - Lazy record sequence over a cursor-paginated source.
 *
 * Pulls one page at a time through a caller-supplied fetch function,
 * filters the raw entries, materializes the survivors and hands them out
 * one by one. The continuation cursor of each page drives the next request;
 * a page without one ends the traversal.
 *
 * Usage:
 *   PageCursorIterator<Customer, IndexEntry> it{
 *       store.fetcher(),
 *       [&](const IndexEntry& e) { return load_customer(e.ref); },
 *       {.index = "customer_id_filter", .page_size = 8}
 *   };
 *
 *   while (auto customer = it.next()) {
 *       // ...
 *   }
 *
 * States:
 *   Idle      no buffered records, next() will fetch
 *   Fetching  a fetch or materialization is running
 *   Buffered  records of the current page are waiting
 *   Exhausted terminal, next() returns nullopt without fetching
 *   Failed    terminal, next() rethrows the original failure
 *
 * Thread-safety: NOT thread-safe. Independent instances share nothing.
 */
namespace pagecursor {
    enum class IteratorState : uint8_t {
        Idle,
        Fetching,
        Buffered,
        Exhausted,
        Failed
    };

    [[nodiscard]] constexpr std::string_view to_string(IteratorState s) noexcept {
        switch (s) {
            case IteratorState::Idle: return "idle";
            case IteratorState::Fetching: return "fetching";
            case IteratorState::Buffered: return "buffered";
            case IteratorState::Exhausted: return "exhausted";
            case IteratorState::Failed: return "failed";
        }
        return "unknown";
    }

    template <typename T, typename Raw, typename Key = int64_t>
    class PageCursorIterator {
    public:
        using record_type = T;
        using raw_type = Raw;
        using key_type = Key;

        using Fetch = std::function<Page<Raw>(const PageRequest<Key>&)>;
        using Materializer = std::function<T(const Raw&)>;

        static constexpr size_t DEFAULT_PAGE_SIZE = 64;
        static constexpr size_t DEFAULT_MAX_PAGE_SIZE = 100'000;

        /**
         * Traversal options.
         */
        struct Options {
            std::string index;
            size_t page_size = DEFAULT_PAGE_SIZE;
            size_t max_page_size = DEFAULT_MAX_PAGE_SIZE; ///< page_size is capped to this
            Direction direction = Direction::Forward;
            std::optional<Key> bound; ///< standing store-side bound, sent with every request
            RangeFilter<Raw> filter; ///< client-side, applied before materialization
            std::shared_ptr<spdlog::logger> logger; ///< null = discard
        };

        /**
         * Constructs an iterator. Nothing is fetched until the first next().
         *
         * @param fetch       Page source adapter
         * @param materialize Raw entry -> record conversion; throwing fails the page
         * @param options     Traversal options
         * @throws MisuseFailure if a callable is empty or a size is zero
         */
        PageCursorIterator(Fetch fetch, Materializer materialize, Options options)
            : fetch_{std::move(fetch)},
              materialize_{std::move(materialize)},
              index_{std::move(options.index)},
              page_size_{options.page_size},
              direction_{options.direction},
              bound_{std::move(options.bound)},
              filter_{std::move(options.filter)},
              logger_{options.logger ? std::move(options.logger) : logging::null_logger()} {
            if (!fetch_) { throw MisuseFailure("PageCursorIterator: fetch function is empty"); }
            if (!materialize_) { throw MisuseFailure("PageCursorIterator: materializer is empty"); }
            if (page_size_ == 0) { throw MisuseFailure("PageCursorIterator: page size must be positive"); }
            if (options.max_page_size == 0) { throw MisuseFailure("PageCursorIterator: max page size must be positive"); }

            if (page_size_ > options.max_page_size) {
                logger_->warn("page size {} exceeds maximum {} for index '{}', capping", page_size_, options.max_page_size, index_);
                page_size_ = options.max_page_size;
            }
        }

        // Non-copyable, movable
        PageCursorIterator(const PageCursorIterator&) = delete;
        PageCursorIterator& operator=(const PageCursorIterator&) = delete;
        PageCursorIterator(PageCursorIterator&&) noexcept = default;
        PageCursorIterator& operator=(PageCursorIterator&&) noexcept = default;

        /**
         * Returns the next record, or nullopt once the traversal is done.
         *
         * Fetches as many pages as needed to find a record; pages that are
         * empty or entirely filtered out do not end the traversal.
         *
         * @throws any exception raised by fetch (rethrown unchanged, also on
         *         every later call)
         * @throws MaterializationFailure if an entry of a page fails to convert
         * @throws MisuseFailure if called from inside fetch or the materializer
         */
        [[nodiscard]] std::optional<T> next() {
            switch (state_) {
                case IteratorState::Failed: std::rethrow_exception(failure_);
                case IteratorState::Exhausted: return std::nullopt;
                case IteratorState::Fetching: throw MisuseFailure("PageCursorIterator: next() re-entered while a page is being fetched");
                case IteratorState::Idle:
                case IteratorState::Buffered: break;
            }

            while (buffer_.empty()) {
                if (fetches_ > 0 && !cursor_) {
                    state_ = IteratorState::Exhausted;
                    return std::nullopt;
                }
                fetch_page();
            }

            std::optional<T> out{std::move(buffer_.front())};
            buffer_.pop_front();
            ++yielded_;

            if (buffer_.empty()) { state_ = cursor_ ? IteratorState::Idle : IteratorState::Exhausted; }
            return out;
        }

        /**
         * Collects every remaining record.
         */
        [[nodiscard]] std::vector<T> drain() {
            std::vector<T> out;
            while (auto record = next()) { out.push_back(std::move(*record)); }
            return out;
        }

        [[nodiscard]] IteratorState state() const noexcept { return state_; }

        [[nodiscard]] bool done() const noexcept { return state_ == IteratorState::Exhausted; }

        [[nodiscard]] size_t fetch_count() const noexcept { return fetches_; }

        [[nodiscard]] size_t yielded_count() const noexcept { return yielded_; }

        [[nodiscard]] size_t filtered_count() const noexcept { return filtered_; }

        [[nodiscard]] size_t buffered_count() const noexcept { return buffer_.size(); }

        [[nodiscard]] size_t page_size() const noexcept { return page_size_; }

        [[nodiscard]] Direction direction() const noexcept { return direction_; }

        /**
         * Continuation cursor of the last fetched page.
         */
        [[nodiscard]] const std::optional<Cursor>& cursor() const noexcept { return cursor_; }

        // ==================== Range Adaptor ====================

        /**
         * Single-pass input iterator; each increment calls next().
         */
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using reference = const T&;
            using pointer = const T*;

            iterator() = default;

            explicit iterator(PageCursorIterator* owner) : owner_{owner} { current_ = owner_->next(); }

            [[nodiscard]] reference operator*() const { return *current_; }

            [[nodiscard]] pointer operator->() const { return &*current_; }

            iterator& operator++() {
                current_ = owner_->next();
                return *this;
            }

            void operator++(int) { ++*this; }

            [[nodiscard]] friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept { return !it.current_; }

        private:
            PageCursorIterator* owner_ = nullptr;
            std::optional<T> current_;
        };

        [[nodiscard]] iterator begin() { return iterator{this}; }

        [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

    private:
        void fetch_page() {
            PageRequest<Key> request{
                .index = index_,
                .direction = direction_,
                .cursor = cursor_,
                .size = page_size_,
                .bound = bound_
            };

            state_ = IteratorState::Fetching;

            Page<Raw> page;
            try {
                page = fetch_(request);
            }
            catch (...) {
                fail(std::current_exception());
                logger_->error("fetch #{} on index '{}' failed", fetches_ + 1, index_);
                throw;
            }
            ++fetches_;

            const auto& continuation = page.continuation(direction_);
            if (continuation && request.cursor && *continuation == *request.cursor) {
                fail(std::make_exception_ptr(FetchFailure(
                    FetchFailure::Kind::Permanent,
                    "index '" + index_ + "' returned a continuation cursor equal to the request cursor"
                )));
                logger_->error("cursor did not advance on index '{}' (fetch #{})", index_, fetches_);
                std::rethrow_exception(failure_);
            }

            std::deque<T> staged;
            size_t dropped = 0;
            for (size_t i = 0; i < page.items.size(); ++i) {
                try {
                    if (!filter_.matches(page.items[i])) {
                        ++dropped;
                        continue;
                    }
                    staged.push_back(materialize_(page.items[i]));
                }
                catch (const std::exception& e) {
                    fail_materialization(i, page.items.size(), request.cursor, e.what());
                }
                catch (...) {
                    fail_materialization(i, page.items.size(), request.cursor, "non-standard exception");
                }
            }

            logger_->debug(
                "fetch #{} on index '{}' ({}): {} items, {} kept, {} filtered",
                fetches_, index_, to_string(direction_), page.items.size(), staged.size(), dropped
            );
            if (continuation) { logger_->trace("continuation cursor: {}", continuation->token()); }

            filtered_ += dropped;
            cursor_ = continuation;
            buffer_ = std::move(staged);

            if (!buffer_.empty()) { state_ = IteratorState::Buffered; }
            else { state_ = cursor_ ? IteratorState::Idle : IteratorState::Exhausted; }
        }

        [[noreturn]] void fail_materialization(size_t entry, size_t count, const std::optional<Cursor>& page_cursor, const std::string& cause) {
            fail(std::make_exception_ptr(MaterializationFailure(entry, count, page_cursor, cause)));
            logger_->error("materialization failed on index '{}' at entry {} of {}: {}", index_, entry, count, cause);
            std::rethrow_exception(failure_);
        }

        void fail(std::exception_ptr failure) noexcept {
            failure_ = std::move(failure);
            buffer_.clear();
            state_ = IteratorState::Failed;
        }

        Fetch fetch_;
        Materializer materialize_;
        std::string index_;
        size_t page_size_;
        Direction direction_;
        std::optional<Key> bound_;
        RangeFilter<Raw> filter_;
        std::shared_ptr<spdlog::logger> logger_;

        IteratorState state_ = IteratorState::Idle;
        std::deque<T> buffer_;
        std::optional<Cursor> cursor_;
        std::exception_ptr failure_;

        size_t fetches_ = 0;
        size_t yielded_ = 0;
        size_t filtered_ = 0;
    };
} // namespace pagecursor
