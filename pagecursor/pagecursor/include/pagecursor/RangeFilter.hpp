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

// pagecursor/pagecursor/include/pagecursor/RangeFilter.hpp
#pragma once

#include "pagecursor/Page.hpp"
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

/**
 * Client-side range filtering over the ordering key of raw page entries.
 *
 * Usage:
 *   auto id = filter::key<IndexEntry>(&IndexEntry::key);
 *   auto f = RangeFilter<IndexEntry>::from(id >= 5 && id != 7);
 *
 * Expressions are evaluated against raw entries before materialization,
 * so rejected entries are never converted.
 */
namespace pagecursor::filter {
    // ==================== Expression Base ====================

    /**
     * CRTP base for all filter expressions.
     */
    template <typename Derived>
    struct Expr {
        [[nodiscard]] const Derived& derived() const noexcept { return static_cast<const Derived&>(*this); }
    };

    // ==================== Literal ====================

    template <typename T>
    struct Lit : Expr<Lit<T>> {
        T value;

        explicit constexpr Lit(T v) noexcept(std::is_nothrow_move_constructible_v<T>) : value(std::move(v)) {}

        template <typename Raw>
        [[nodiscard]] constexpr const T& eval(const Raw&) const noexcept { return value; }
    };

    // ==================== Key Reference ====================

    /**
     * Ordering key of a raw entry.
     *
     * Extract is either a data member pointer of Raw or a callable taking
     * `const Raw&`; both go through std::invoke.
     */
    template <typename Raw, typename K, typename Extract>
    struct KeyExpr : Expr<KeyExpr<Raw, K, Extract>> {
        using raw_type = Raw;
        using key_type = K;

        Extract extract;

        explicit constexpr KeyExpr(Extract e) : extract(std::move(e)) {}

        [[nodiscard]] K eval(const Raw& raw) const { return std::invoke(extract, raw); }
    };

    /**
     * Key from a data member: `key(&IndexEntry::key)`.
     */
    template <typename Raw, typename K>
    [[nodiscard]] constexpr auto key(K Raw::* member) {
        return KeyExpr<Raw, K, K Raw::*>(member);
    }

    /**
     * Key from a callable: `key<IndexEntry>([](const IndexEntry& e) { ... })`.
     */
    template <typename Raw, typename F>
        requires std::is_invocable_v<const F&, const Raw&> && (!std::is_member_object_pointer_v<F>)
    [[nodiscard]] constexpr auto key(F fn) {
        using K = std::decay_t<std::invoke_result_t<const F&, const Raw&>>;
        return KeyExpr<Raw, K, F>(std::move(fn));
    }

    // ==================== Operators ====================

    struct OpEq {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l == r; }
    };

    struct OpNe {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l != r; }
    };

    struct OpGt {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l > r; }
    };

    struct OpGe {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l >= r; }
    };

    struct OpLt {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l < r; }
    };

    struct OpLe {
        template <typename L, typename R>
        [[nodiscard]] static constexpr bool apply(const L& l, const R& r) noexcept { return l <= r; }
    };

    struct OpAnd {
        [[nodiscard]] static constexpr bool apply(bool l, bool r) noexcept { return l && r; }
    };

    struct OpOr {
        [[nodiscard]] static constexpr bool apply(bool l, bool r) noexcept { return l || r; }
    };

    struct OpNot {
        [[nodiscard]] static constexpr bool apply(bool x) noexcept { return !x; }
    };

    // ==================== Binary / Unary Operation ====================

    template <typename L, typename R, typename Op>
    struct BinOp : Expr<BinOp<L, R, Op>> {
        L lhs;
        R rhs;

        constexpr BinOp(const Expr<L>& l, const Expr<R>& r) : lhs(l.derived()), rhs(r.derived()) {}

        template <typename Raw>
        [[nodiscard]] bool eval(const Raw& raw) const { return Op::apply(lhs.eval(raw), rhs.eval(raw)); }
    };

    template <typename X, typename Op>
    struct UnOp : Expr<UnOp<X, Op>> {
        X operand;

        constexpr UnOp(const Expr<X>& x) : operand(x.derived()) {}

        template <typename Raw>
        [[nodiscard]] bool eval(const Raw& raw) const { return Op::apply(operand.eval(raw)); }
    };

    // ==================== Operator Overloads ====================

    // Comparison operators

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator==(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpEq>(k, Lit<T>(std::move(val)));
    }

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator!=(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpNe>(k, Lit<T>(std::move(val)));
    }

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator>(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpGt>(k, Lit<T>(std::move(val)));
    }

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator>=(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpGe>(k, Lit<T>(std::move(val)));
    }

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator<(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpLt>(k, Lit<T>(std::move(val)));
    }

    template <typename Raw, typename K, typename E, typename T>
    [[nodiscard]] constexpr auto operator<=(const KeyExpr<Raw, K, E>& k, T val) {
        return BinOp<KeyExpr<Raw, K, E>, Lit<T>, OpLe>(k, Lit<T>(std::move(val)));
    }

    // Logical operators

    template <typename L, typename R>
    [[nodiscard]] constexpr auto operator&&(const Expr<L>& l, const Expr<R>& r) { return BinOp<L, R, OpAnd>(l, r); }

    template <typename L, typename R>
    [[nodiscard]] constexpr auto operator||(const Expr<L>& l, const Expr<R>& r) { return BinOp<L, R, OpOr>(l, r); }

    template <typename X>
    [[nodiscard]] constexpr auto operator!(const Expr<X>& x) { return UnOp<X, OpNot>(x); }
} // namespace pagecursor::filter

namespace pagecursor {
    // ==================== RangeFilter ====================

    /**
     * RangeFilter - Type-erased predicate over raw page entries.
     *
     * A default-constructed filter is the identity and accepts everything.
     * Filters are pure: the same entry always yields the same answer.
     */
    template <typename Raw>
    class RangeFilter {
    public:
        RangeFilter() = default;

        [[nodiscard]] static RangeFilter accept_all() { return RangeFilter{}; }

        template <typename E>
        [[nodiscard]] static RangeFilter from(const filter::Expr<E>& expr) {
            return RangeFilter{[e = expr.derived()](const Raw& raw) { return static_cast<bool>(e.eval(raw)); }};
        }

        /**
         * Keeps entries whose key is >= lower (inclusive).
         */
        template <typename Extract, typename K>
        [[nodiscard]] static RangeFilter at_least(Extract extract, K lower) {
            return from(filter::key<Raw>(std::move(extract)) >= std::move(lower));
        }

        /**
         * Keeps entries whose key is <= upper (inclusive).
         */
        template <typename Extract, typename K>
        [[nodiscard]] static RangeFilter at_most(Extract extract, K upper) {
            return from(filter::key<Raw>(std::move(extract)) <= std::move(upper));
        }

        [[nodiscard]] bool matches(const Raw& raw) const { return !predicate_ || predicate_(raw); }

        [[nodiscard]] bool is_identity() const noexcept { return !predicate_; }

    private:
        explicit RangeFilter(std::function<bool(const Raw&)> predicate) : predicate_{std::move(predicate)} {}

        std::function<bool(const Raw&)> predicate_;
    };

    // ==================== KeyRange ====================

    /**
     * Inclusive key range; a missing side is unbounded.
     */
    template <typename K>
    struct KeyRange {
        std::optional<K> lower;
        std::optional<K> upper;

        [[nodiscard]] bool contains(const K& k) const {
            return (!lower || !(k < *lower)) && (!upper || !(*upper < k));
        }
    };

    template <typename K>
    [[nodiscard]] KeyRange<K> between(K lower, K upper) { return KeyRange<K>{std::move(lower), std::move(upper)}; }

    template <typename K>
    [[nodiscard]] KeyRange<K> at_least(K lower) { return KeyRange<K>{std::move(lower), std::nullopt}; }

    template <typename K>
    [[nodiscard]] KeyRange<K> at_most(K upper) { return KeyRange<K>{std::nullopt, std::move(upper)}; }

    /**
     * A KeyRange divided between the store and the client.
     */
    template <typename Raw, typename K>
    struct SplitRange {
        std::optional<K> store_bound;
        RangeFilter<Raw> filter;
    };

    /**
     * Splits a range for a traversal direction.
     *
     * The side the traversal runs towards becomes the standing store bound,
     * which limits the pages fetched. The side the traversal starts from is
     * applied client-side to each fetched page.
     */
    template <typename Raw, typename K, typename Extract>
    [[nodiscard]] SplitRange<Raw, K> split_range(const KeyRange<K>& range, Direction direction, Extract extract) {
        SplitRange<Raw, K> split;
        if (direction == Direction::Forward) {
            split.store_bound = range.upper;
            if (range.lower) { split.filter = RangeFilter<Raw>::at_least(std::move(extract), *range.lower); }
        }
        else {
            split.store_bound = range.lower;
            if (range.upper) { split.filter = RangeFilter<Raw>::at_most(std::move(extract), *range.upper); }
        }
        return split;
    }
} // namespace pagecursor
