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

// pagecursor/internal/include/store/DocumentStore.hpp
#pragma once

#include "pagecursor/Errors.hpp"
#include "pagecursor/Export.hpp"
#include "pagecursor/Page.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagecursor::store {
    using json = nlohmann::json;

    // ==================== Errors ====================

    /**
     * Schema or write failure (duplicate names, unique violations, unknown
     * collections).
     */
    class PAGECURSOR_API StoreError : public PageCursorError {
    public:
        explicit StoreError(const std::string& msg) : PageCursorError("store: " + msg) {}
    };

    /**
     * Lookup of a document or index that does not exist.
     */
    class PAGECURSOR_API NotFound : public StoreError {
    public:
        explicit NotFound(const std::string& msg) : StoreError(msg) {}
    };

    // ==================== Types ====================

    /**
     * Reference to a document: collection name + id unique within the store.
     */
    struct DocRef {
        std::string collection;
        uint64_t id = 0;

        [[nodiscard]] friend bool operator==(const DocRef&, const DocRef&) = default;
        [[nodiscard]] friend auto operator<=>(const DocRef&, const DocRef&) = default;

        [[nodiscard]] std::string to_string() const { return collection + "/" + std::to_string(id); }
    };

    /**
     * Stored document. `ts` increases with every write to the store.
     */
    struct Document {
        DocRef ref;
        uint64_t ts = 0;
        json data;
    };

    /**
     * Index definition.
     *
     * term:  field of `data` used for exact-match lookups (match / match_any)
     * value: integer field of `data` used as the ordering key for paginate;
     *        entries are ordered by (value, ref)
     * unique: no two documents may share the term (or the value when the
     *        index has no term)
     */
    struct IndexDefinition {
        std::string name;
        std::string source;
        std::optional<std::string> term;
        std::optional<std::string> value;
        bool unique = false;
    };

    /**
     * One entry of a value index page: ordering key first, then the ref of
     * the indexed document.
     */
    struct IndexEntry {
        int64_t key = 0;
        DocRef ref;

        [[nodiscard]] friend bool operator==(const IndexEntry&, const IndexEntry&) = default;
    };

    PAGECURSOR_API void to_json(json& j, const DocRef& ref);
    PAGECURSOR_API void to_json(json& j, const Document& doc);
    PAGECURSOR_API void to_json(json& j, const IndexEntry& entry);

    // ==================== DocumentStore ====================

    /**
     * DocumentStore - In-process document store with term and value indexes.
     *
     * Serves cursor-paginated reads over value indexes through paginate(),
     * which honours the page source contract expected by PageCursorIterator:
     *
     * Forward requests
     *   - the `after` cursor is inclusive: the page starts at it
     *   - up to `size` entries with key <= bound
     *   - `after` is set iff more in-bound entries follow, pointing at the next one
     *   - `before` is set iff entries precede the page
     *
     * Backward requests
     *   - the `before` cursor is exclusive: the page ends just before it
     *   - up to `size` entries with key >= bound, returned in ascending order
     *   - `before` is set iff more in-bound entries precede the page
     *   - `after` is set iff entries follow the page
     *
     * Cursor tokens are compact JSON `{"k":<key>,"r":<id>}`; they are only
     * meaningful to this store.
     *
     * Thread-safety: All public methods are thread-safe.
     */
    class PAGECURSOR_API DocumentStore {
    public:
        static constexpr size_t DEFAULT_MAX_PAGE_SIZE = 100'000;

        struct Options {
            size_t max_page_size = DEFAULT_MAX_PAGE_SIZE;
            std::shared_ptr<spdlog::logger> logger; ///< null = discard
        };

        using Fetch = std::function<Page<IndexEntry>(const PageRequest<int64_t>&)>;

        DocumentStore();
        explicit DocumentStore(Options opts);
        ~DocumentStore();

        DocumentStore(const DocumentStore&) = delete;
        DocumentStore& operator=(const DocumentStore&) = delete;
        DocumentStore(DocumentStore&&) noexcept;
        DocumentStore& operator=(DocumentStore&&) noexcept;

        // ==================== Schema ====================

        /**
         * @throws StoreError if the collection already exists
         */
        void create_collection(std::string_view name);

        [[nodiscard]] bool has_collection(std::string_view name) const;

        /**
         * Creates an index and indexes the documents already in its source.
         *
         * @throws StoreError if the name is taken, the source is unknown,
         *         neither term nor value is given, or existing documents
         *         violate the unique constraint
         */
        void create_index(const IndexDefinition& def);

        [[nodiscard]] bool has_index(std::string_view name) const;

        // ==================== Writes ====================

        /**
         * Creates one document.
         *
         * @throws StoreError if the collection is unknown, data is not an
         *         object, or a unique index rejects it
         */
        DocRef create(std::string_view collection, json data);

        /**
         * Creates several documents atomically: either all are stored or,
         * on any rejection, none is.
         */
        std::vector<DocRef> create_batch(std::string_view collection, const std::vector<json>& batch);

        // ==================== Reads ====================

        /**
         * @throws NotFound if the document does not exist
         */
        [[nodiscard]] Document get(const DocRef& ref) const;

        /**
         * Refs of documents whose term equals `term`, in creation order.
         *
         * @throws NotFound if the index does not exist
         * @throws StoreError if the index has no term
         */
        [[nodiscard]] std::vector<DocRef> match(std::string_view index, const json& term) const;

        /**
         * Union of match() over several terms, without duplicates.
         */
        [[nodiscard]] std::vector<DocRef> match_any(std::string_view index, const std::vector<json>& terms) const;

        /**
         * Reads one page of a value index.
         *
         * @throws FetchFailure (Permanent) for an unknown index, an index
         *         without values, a size of 0 or above the maximum, or a
         *         malformed cursor
         */
        [[nodiscard]] Page<IndexEntry> paginate(const PageRequest<int64_t>& request) const;

        /**
         * Returns a fetch function bound to this store's contents for
         * PageCursorIterator. It stays valid when the store is moved; the
         * contents must outlive it.
         */
        [[nodiscard]] Fetch fetcher() const;

        [[nodiscard]] size_t size(std::string_view collection) const;

        [[nodiscard]] size_t max_page_size() const noexcept;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
} // namespace pagecursor::store
