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

// pagecursor/internal/src/store/DocumentStore.cpp
#include "store/DocumentStore.hpp"

#include "pagecursor/Logging.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <utility>

namespace pagecursor::store {
    namespace {
        /// (ordering key, document id)
        using Position = std::pair<int64_t, uint64_t>;

        std::string encode_cursor(const Position& pos) { return json{{"k", pos.first}, {"r", pos.second}}.dump(); }

        Position decode_cursor(const Cursor& cursor) {
            const auto j = json::parse(cursor.token(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "malformed cursor token '" + cursor.token() + "'");
            }

            const auto k = j.find("k");
            const auto r = j.find("r");
            if (k == j.end() || !k->is_number_integer() || r == j.end() || !r->is_number_unsigned()) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "malformed cursor token '" + cursor.token() + "'");
            }
            if (k->is_number_unsigned() && k->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "cursor key out of range in '" + cursor.token() + "'");
            }

            return {k->get<int64_t>(), r->get<uint64_t>()};
        }

        std::optional<std::string> term_of(const IndexDefinition& def, const json& data) {
            if (!def.term) { return std::nullopt; }
            const auto it = data.find(*def.term);
            if (it == data.end()) { return std::nullopt; }
            return it->dump();
        }

        std::optional<int64_t> value_of(const IndexDefinition& def, const json& data) {
            if (!def.value) { return std::nullopt; }
            const auto it = data.find(*def.value);
            if (it == data.end() || !it->is_number_integer()) { return std::nullopt; }
            if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return it->get<int64_t>();
        }
    } // anonymous namespace

    void to_json(json& j, const DocRef& ref) { j = json{{"collection", ref.collection}, {"id", std::to_string(ref.id)}}; }

    void to_json(json& j, const Document& doc) { j = json{{"ref", doc.ref}, {"ts", doc.ts}, {"data", doc.data}}; }

    void to_json(json& j, const IndexEntry& entry) { j = json::array({entry.key, entry.ref}); }

    // ==================== DocumentStore::Impl ====================

    class DocumentStore::Impl {
    public:
        explicit Impl(Options opts)
            : max_page_size_{opts.max_page_size},
              logger_{opts.logger ? std::move(opts.logger) : logging::null_logger()} {
            if (max_page_size_ == 0) { throw StoreError("max_page_size must be positive"); }
        }

        void create_collection(std::string_view name) {
            std::unique_lock lock{mutex_};
            if (name.empty()) { throw StoreError("collection name must not be empty"); }
            if (collections_.contains(name)) { throw StoreError("collection '" + std::string{name} + "' already exists"); }

            collections_.emplace(std::string{name}, Collection{});
            logger_->info("created collection '{}'", name);
        }

        [[nodiscard]] bool has_collection(std::string_view name) const {
            std::shared_lock lock{mutex_};
            return collections_.contains(name);
        }

        void create_index(const IndexDefinition& def) {
            std::unique_lock lock{mutex_};
            if (def.name.empty()) { throw StoreError("index name must not be empty"); }
            if (indexes_.contains(def.name)) { throw StoreError("index '" + def.name + "' already exists"); }
            if (!def.term && !def.value) { throw StoreError("index '" + def.name + "' needs a term or a value field"); }

            auto coll = collections_.find(def.source);
            if (coll == collections_.end()) { throw StoreError("index '" + def.name + "': unknown source '" + def.source + "'"); }

            IndexState state{def, {}, {}};
            for (const auto& [id, doc] : coll->second.docs) {
                if (def.unique && violates_unique(state, doc.data)) {
                    throw StoreError("index '" + def.name + "': existing documents violate uniqueness");
                }
                add_entry(state, id, doc.data);
            }

            const auto indexed = state.values.size();
            indexes_.emplace(def.name, std::move(state));
            coll->second.indexes.push_back(def.name);

            logger_->info(
                "created index '{}' on '{}' (term={}, value={}, unique={}, {} entries)",
                def.name, def.source, def.term.value_or("-"), def.value.value_or("-"), def.unique, indexed
            );
        }

        [[nodiscard]] bool has_index(std::string_view name) const {
            std::shared_lock lock{mutex_};
            return indexes_.contains(name);
        }

        std::vector<DocRef> create_batch(std::string_view collection, const std::vector<json>& batch) {
            std::unique_lock lock{mutex_};

            auto coll = collections_.find(collection);
            if (coll == collections_.end()) { throw StoreError("unknown collection '" + std::string{collection} + "'"); }

            for (size_t i = 0; i < batch.size(); ++i) {
                if (!batch[i].is_object()) {
                    throw StoreError("document " + std::to_string(i) + " of batch for '" + std::string{collection} + "' is not an object");
                }
            }
            check_unique(coll->second, batch);

            std::vector<DocRef> refs;
            refs.reserve(batch.size());
            for (const auto& data : batch) {
                const uint64_t id = next_id_++;
                DocRef ref{std::string{collection}, id};
                coll->second.docs.emplace(id, Document{ref, ++ts_, data});

                for (const auto& name : coll->second.indexes) { add_entry(indexes_.at(name), id, data); }
                refs.push_back(std::move(ref));
            }

            logger_->debug("created {} document(s) in '{}'", refs.size(), collection);
            return refs;
        }

        [[nodiscard]] Document get(const DocRef& ref) const {
            std::shared_lock lock{mutex_};

            auto coll = collections_.find(ref.collection);
            if (coll == collections_.end()) { throw NotFound("unknown collection '" + ref.collection + "'"); }

            auto doc = coll->second.docs.find(ref.id);
            if (doc == coll->second.docs.end()) { throw NotFound("document " + ref.to_string() + " not found"); }
            return doc->second;
        }

        [[nodiscard]] std::vector<DocRef> match_any(std::string_view index, const std::vector<json>& terms) const {
            std::shared_lock lock{mutex_};

            const auto& state = find_index(index);
            if (!state.def.term) { throw StoreError("index '" + state.def.name + "' has no term"); }

            std::set<uint64_t> ids;
            for (const auto& term : terms) {
                auto hit = state.terms.find(term.dump());
                if (hit != state.terms.end()) { ids.insert(hit->second.begin(), hit->second.end()); }
            }

            std::vector<DocRef> refs;
            refs.reserve(ids.size());
            for (const auto id : ids) { refs.push_back(DocRef{state.def.source, id}); }
            return refs;
        }

        [[nodiscard]] Page<IndexEntry> paginate(const PageRequest<int64_t>& request) const {
            if (request.size == 0) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "page size must be positive");
            }
            if (request.size > max_page_size_) {
                throw FetchFailure(
                    FetchFailure::Kind::Permanent,
                    "page size " + std::to_string(request.size) + " exceeds maximum " + std::to_string(max_page_size_)
                );
            }

            std::optional<Position> cursor;
            if (request.cursor) { cursor = decode_cursor(*request.cursor); }

            std::shared_lock lock{mutex_};

            const auto state_it = indexes_.find(request.index);
            if (state_it == indexes_.end()) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "unknown index '" + request.index + "'");
            }
            const auto& state = state_it->second;
            if (!state.def.value) {
                throw FetchFailure(FetchFailure::Kind::Permanent, "index '" + request.index + "' has no values to paginate");
            }

            auto page = request.direction == Direction::Forward
                            ? page_forward(state, cursor, request.size, request.bound)
                            : page_backward(state, cursor, request.size, request.bound);

            logger_->trace(
                "paginate '{}' {} size={} -> {} items (before={}, after={})",
                request.index, to_string(request.direction), request.size, page.items.size(),
                page.before.has_value(), page.after.has_value()
            );
            return page;
        }

        [[nodiscard]] size_t size(std::string_view collection) const {
            std::shared_lock lock{mutex_};
            auto coll = collections_.find(collection);
            if (coll == collections_.end()) { throw NotFound("unknown collection '" + std::string{collection} + "'"); }
            return coll->second.docs.size();
        }

        [[nodiscard]] size_t max_page_size() const noexcept { return max_page_size_; }

    private:
        struct Collection {
            std::map<uint64_t, Document> docs;
            std::vector<std::string> indexes;
        };

        struct IndexState {
            IndexDefinition def;
            std::map<std::string, std::vector<uint64_t>> terms;
            std::set<Position> values;
        };

        [[nodiscard]] const IndexState& find_index(std::string_view name) const {
            auto it = indexes_.find(name);
            if (it == indexes_.end()) { throw NotFound("unknown index '" + std::string{name} + "'"); }
            return it->second;
        }

        static void add_entry(IndexState& state, uint64_t id, const json& data) {
            if (auto term = term_of(state.def, data)) { state.terms[*term].push_back(id); }
            if (auto value = value_of(state.def, data)) { state.values.emplace(*value, id); }
        }

        [[nodiscard]] static bool has_value(const IndexState& state, int64_t value) {
            auto it = state.values.lower_bound(Position{value, 0});
            return it != state.values.end() && it->first == value;
        }

        [[nodiscard]] static bool violates_unique(const IndexState& state, const json& data) {
            if (state.def.term) {
                auto term = term_of(state.def, data);
                return term && state.terms.contains(*term);
            }
            auto value = value_of(state.def, data);
            return value && has_value(state, *value);
        }

        /**
         * Rejects the whole batch if any document collides with stored
         * documents or with an earlier document of the same batch.
         */
        void check_unique(const Collection& coll, const std::vector<json>& batch) const {
            for (const auto& name : coll.indexes) {
                const auto& state = indexes_.at(name);
                if (!state.def.unique) { continue; }

                std::set<std::string> seen_terms;
                std::set<int64_t> seen_values;
                for (const auto& data : batch) {
                    bool duplicate_in_batch = false;
                    if (state.def.term) {
                        if (auto term = term_of(state.def, data)) { duplicate_in_batch = !seen_terms.insert(*term).second; }
                    }
                    else if (auto value = value_of(state.def, data)) { duplicate_in_batch = !seen_values.insert(*value).second; }

                    if (duplicate_in_batch || violates_unique(state, data)) {
                        throw StoreError("unique index '" + name + "' rejects document " + data.dump());
                    }
                }
            }
        }

        static Page<IndexEntry> page_forward(
            const IndexState& state,
            const std::optional<Position>& cursor,
            size_t size,
            const std::optional<int64_t>& bound
        ) {
            const auto& values = state.values;
            const auto in_bound = [&](const Position& p) { return !bound || p.first <= *bound; };

            const auto start = cursor ? values.lower_bound(*cursor) : values.begin();

            Page<IndexEntry> page;
            auto it = start;
            while (it != values.end() && page.items.size() < size && in_bound(*it)) {
                page.items.push_back(IndexEntry{it->first, DocRef{state.def.source, it->second}});
                ++it;
            }

            if (it != values.end() && in_bound(*it)) { page.after = Cursor{encode_cursor(*it)}; }
            if (start != values.begin()) { page.before = Cursor{encode_cursor(start != values.end() ? *start : *cursor)}; }
            return page;
        }

        static Page<IndexEntry> page_backward(
            const IndexState& state,
            const std::optional<Position>& cursor,
            size_t size,
            const std::optional<int64_t>& bound
        ) {
            const auto& values = state.values;
            const auto in_bound = [&](const Position& p) { return !bound || p.first >= *bound; };

            const auto stop = cursor ? values.lower_bound(*cursor) : values.end();

            auto first = stop;
            size_t taken = 0;
            while (first != values.begin() && taken < size && in_bound(*std::prev(first))) {
                --first;
                ++taken;
            }

            Page<IndexEntry> page;
            page.items.reserve(taken);
            for (auto it = first; it != stop; ++it) {
                page.items.push_back(IndexEntry{it->first, DocRef{state.def.source, it->second}});
            }

            if (first != values.begin() && in_bound(*std::prev(first)) && first != values.end()) {
                page.before = Cursor{encode_cursor(*first)};
            }
            if (stop != values.end()) { page.after = Cursor{encode_cursor(*stop)}; }
            return page;
        }

        size_t max_page_size_;
        std::shared_ptr<spdlog::logger> logger_;

        std::map<std::string, Collection, std::less<>> collections_;
        std::map<std::string, IndexState, std::less<>> indexes_;
        uint64_t next_id_ = 1;
        uint64_t ts_ = 0;

        mutable std::shared_mutex mutex_;
    };

    // ==================== DocumentStore Public API ====================

    DocumentStore::DocumentStore() : DocumentStore(Options{}) {}

    DocumentStore::DocumentStore(Options opts) : impl_{std::make_unique<Impl>(std::move(opts))} {}

    DocumentStore::~DocumentStore() = default;

    DocumentStore::DocumentStore(DocumentStore&&) noexcept = default;
    DocumentStore& DocumentStore::operator=(DocumentStore&&) noexcept = default;

    void DocumentStore::create_collection(std::string_view name) { impl_->create_collection(name); }

    bool DocumentStore::has_collection(std::string_view name) const { return impl_->has_collection(name); }

    void DocumentStore::create_index(const IndexDefinition& def) { impl_->create_index(def); }

    bool DocumentStore::has_index(std::string_view name) const { return impl_->has_index(name); }

    DocRef DocumentStore::create(std::string_view collection, json data) {
        auto refs = impl_->create_batch(collection, std::vector<json>{std::move(data)});
        return std::move(refs.front());
    }

    std::vector<DocRef> DocumentStore::create_batch(std::string_view collection, const std::vector<json>& batch) {
        return impl_->create_batch(collection, batch);
    }

    Document DocumentStore::get(const DocRef& ref) const { return impl_->get(ref); }

    std::vector<DocRef> DocumentStore::match(std::string_view index, const json& term) const {
        return impl_->match_any(index, std::vector<json>{term});
    }

    std::vector<DocRef> DocumentStore::match_any(std::string_view index, const std::vector<json>& terms) const {
        return impl_->match_any(index, terms);
    }

    Page<IndexEntry> DocumentStore::paginate(const PageRequest<int64_t>& request) const { return impl_->paginate(request); }

    DocumentStore::Fetch DocumentStore::fetcher() const {
        return [impl = impl_.get()](const PageRequest<int64_t>& request) { return impl->paginate(request); };
    }

    size_t DocumentStore::size(std::string_view collection) const { return impl_->size(collection); }

    size_t DocumentStore::max_page_size() const noexcept { return impl_->max_page_size(); }
} // namespace pagecursor::store
