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

#include <gtest/gtest.h>

#include <pagecursor/RangeFilter.hpp>
#include "store/DocumentStore.hpp"

#include <string>

using namespace pagecursor;
using pagecursor::store::DocRef;
using pagecursor::store::IndexEntry;

namespace test {
    namespace {
        IndexEntry entry(int64_t key) { return IndexEntry{key, DocRef{"items", static_cast<uint64_t>(key)}}; }
    } // anonymous namespace

    TEST(RangeFilter, DefaultAcceptsEverything) {
        const RangeFilter<IndexEntry> f;
        EXPECT_TRUE(f.is_identity());
        EXPECT_TRUE(f.matches(entry(-100)));
        EXPECT_TRUE(RangeFilter<IndexEntry>::accept_all().matches(entry(7)));
    }

    TEST(RangeFilter, AtLeastAndAtMostAreInclusive) {
        const auto lower = RangeFilter<IndexEntry>::at_least(&IndexEntry::key, int64_t{5});
        EXPECT_FALSE(lower.is_identity());
        EXPECT_FALSE(lower.matches(entry(4)));
        EXPECT_TRUE(lower.matches(entry(5)));
        EXPECT_TRUE(lower.matches(entry(6)));

        const auto upper = RangeFilter<IndexEntry>::at_most(&IndexEntry::key, int64_t{11});
        EXPECT_TRUE(upper.matches(entry(11)));
        EXPECT_FALSE(upper.matches(entry(12)));
    }

    TEST(RangeFilter, ComposesExpressions) {
        const auto id = filter::key(&IndexEntry::key);
        const auto f = RangeFilter<IndexEntry>::from((id >= 5 && id != 7) || id == 1);

        EXPECT_TRUE(f.matches(entry(1)));
        EXPECT_FALSE(f.matches(entry(2)));
        EXPECT_TRUE(f.matches(entry(5)));
        EXPECT_FALSE(f.matches(entry(7)));
        EXPECT_TRUE(f.matches(entry(8)));

        const auto outside = RangeFilter<IndexEntry>::from(!(id > 3 && id < 6));
        EXPECT_TRUE(outside.matches(entry(3)));
        EXPECT_FALSE(outside.matches(entry(4)));
        EXPECT_TRUE(outside.matches(entry(6)));
    }

    TEST(RangeFilter, KeyFromCallable) {
        const auto doc_id = filter::key<IndexEntry>([](const IndexEntry& e) { return e.ref.id; });
        const auto f = RangeFilter<IndexEntry>::from(doc_id <= uint64_t{2});

        EXPECT_TRUE(f.matches(entry(2)));
        EXPECT_FALSE(f.matches(entry(3)));

        const auto by_collection = filter::key<IndexEntry>([](const IndexEntry& e) { return e.ref.collection; });
        EXPECT_TRUE(RangeFilter<IndexEntry>::from(by_collection == std::string{"items"}).matches(entry(1)));
    }

    TEST(KeyRange, ContainsIsInclusiveAndOpenEnded) {
        const auto r = between<int64_t>(5, 11);
        EXPECT_FALSE(r.contains(4));
        EXPECT_TRUE(r.contains(5));
        EXPECT_TRUE(r.contains(11));
        EXPECT_FALSE(r.contains(12));

        EXPECT_TRUE(at_least<int64_t>(5).contains(1'000'000));
        EXPECT_TRUE(at_most<int64_t>(5).contains(-1'000'000));
        EXPECT_TRUE(KeyRange<int64_t>{}.contains(0));
    }

    TEST(SplitRange, ForwardBoundsUpperSideAtTheStore) {
        const auto split = split_range<IndexEntry>(between<int64_t>(5, 11), Direction::Forward, &IndexEntry::key);

        EXPECT_EQ(split.store_bound, 11);
        EXPECT_FALSE(split.filter.matches(entry(4)));
        EXPECT_TRUE(split.filter.matches(entry(5)));
        EXPECT_TRUE(split.filter.matches(entry(20)));
    }

    TEST(SplitRange, BackwardBoundsLowerSideAtTheStore) {
        const auto split = split_range<IndexEntry>(between<int64_t>(5, 11), Direction::Backward, &IndexEntry::key);

        EXPECT_EQ(split.store_bound, 5);
        EXPECT_TRUE(split.filter.matches(entry(1)));
        EXPECT_TRUE(split.filter.matches(entry(11)));
        EXPECT_FALSE(split.filter.matches(entry(12)));
    }

    TEST(SplitRange, MissingSidesLeaveBoundAndFilterOpen) {
        const auto upper_only = split_range<IndexEntry>(at_most<int64_t>(5), Direction::Forward, &IndexEntry::key);
        EXPECT_EQ(upper_only.store_bound, 5);
        EXPECT_TRUE(upper_only.filter.is_identity());

        const auto lower_only = split_range<IndexEntry>(at_least<int64_t>(5), Direction::Forward, &IndexEntry::key);
        EXPECT_FALSE(lower_only.store_bound.has_value());
        EXPECT_FALSE(lower_only.filter.is_identity());

        const auto open = split_range<IndexEntry>(KeyRange<int64_t>{}, Direction::Backward, &IndexEntry::key);
        EXPECT_FALSE(open.store_bound.has_value());
        EXPECT_TRUE(open.filter.is_identity());
    }
} // namespace test
