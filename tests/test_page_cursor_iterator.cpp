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

#include <pagecursor/PageCursorIterator.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include "test_sources.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pagecursor;

namespace test {
    using IntIterator = PageCursorIterator<int, int>;

    namespace {
        IntIterator::Options opts(size_t page_size) {
            IntIterator::Options o;
            o.index = "numbers";
            o.page_size = page_size;
            return o;
        }
    } // anonymous namespace

    TEST(PageCursorIterator, YieldsEveryItemOfChainedPagesInOrder) {
        ScriptedSource source{{iota(1, 8), iota(9, 16), iota(17, 20)}};
        IntIterator it{source.fetcher(), identity, opts(8)};

        EXPECT_EQ(it.drain(), iota(1, 20));
        EXPECT_EQ(it.fetch_count(), 3u);
        EXPECT_EQ(it.yielded_count(), 20u);
        EXPECT_EQ(it.state(), IteratorState::Exhausted);
    }

    TEST(PageCursorIterator, NothingIsFetchedBeforeFirstNext) {
        ScriptedSource source{{iota(1, 3)}};
        IntIterator it{source.fetcher(), identity, opts(8)};

        EXPECT_EQ(it.state(), IteratorState::Idle);
        EXPECT_TRUE(source.requests.empty());
    }

    TEST(PageCursorIterator, PassesCursorsBackVerbatim) {
        ScriptedSource source{{iota(1, 2), iota(3, 4), iota(5, 6)}};
        IntIterator it{source.fetcher(), identity, opts(2)};
        (void)it.drain();

        ASSERT_EQ(source.requests.size(), 3u);
        EXPECT_FALSE(source.requests[0].cursor.has_value());
        EXPECT_EQ(source.requests[1].cursor, Cursor{"p1"});
        EXPECT_EQ(source.requests[2].cursor, Cursor{"p2"});
        for (const auto& r : source.requests) {
            EXPECT_EQ(r.index, "numbers");
            EXPECT_EQ(r.size, 2u);
            EXPECT_EQ(r.direction, Direction::Forward);
            EXPECT_EQ(r.before(), nullptr);
        }
        EXPECT_NE(source.requests[1].after(), nullptr);
    }

    TEST(PageCursorIterator, EmptyFirstPageIsImmediatelyDone) {
        ScriptedSource source{std::vector<std::vector<int>>{std::vector<int>{}}};
        IntIterator it{source.fetcher(), identity, opts(8)};

        EXPECT_FALSE(it.next().has_value());
        EXPECT_EQ(it.fetch_count(), 1u);
        EXPECT_EQ(it.state(), IteratorState::Exhausted);
    }

    TEST(PageCursorIterator, EmptyIntermediatePageDoesNotEndTraversal) {
        ScriptedSource source{{iota(1, 2), {}, iota(3, 3)}};
        IntIterator it{source.fetcher(), identity, opts(2)};

        EXPECT_EQ(it.drain(), iota(1, 3));
        EXPECT_EQ(it.fetch_count(), 3u);
    }

    TEST(PageCursorIterator, FullyFilteredPageDoesNotEndTraversal) {
        ScriptedSource source{{iota(1, 2), iota(3, 4), iota(10, 11)}};
        auto o = opts(2);
        o.filter = RangeFilter<int>::at_least(identity, 10);
        IntIterator it{source.fetcher(), identity, std::move(o)};

        EXPECT_EQ(it.drain(), iota(10, 11));
        EXPECT_EQ(it.fetch_count(), 3u);
        EXPECT_EQ(it.filtered_count(), 4u);
    }

    TEST(PageCursorIterator, AcceptsPagesShorterThanRequested) {
        ScriptedSource source{{iota(1, 2), iota(3, 3), iota(4, 6)}};
        IntIterator it{source.fetcher(), identity, opts(5)};

        EXPECT_EQ(it.drain(), iota(1, 6));
    }

    TEST(PageCursorIterator, ExhaustionIsIdempotentAndFetchesNothingMore) {
        ScriptedSource source{{iota(1, 2)}};
        IntIterator it{source.fetcher(), identity, opts(8)};

        EXPECT_EQ(it.next(), 1);
        EXPECT_EQ(it.next(), 2);
        EXPECT_FALSE(it.next().has_value());
        for (int i = 0; i < 3; ++i) { EXPECT_FALSE(it.next().has_value()); }
        EXPECT_EQ(source.requests.size(), 1u);
    }

    TEST(PageCursorIterator, StateFollowsBufferAndCursor) {
        ScriptedSource source{{iota(1, 2), iota(3, 3)}};
        IntIterator it{source.fetcher(), identity, opts(2)};

        EXPECT_EQ(it.next(), 1);
        EXPECT_EQ(it.state(), IteratorState::Buffered);
        EXPECT_EQ(it.buffered_count(), 1u);
        EXPECT_EQ(it.next(), 2);
        EXPECT_EQ(it.state(), IteratorState::Idle);
        ASSERT_TRUE(it.cursor().has_value());
        EXPECT_EQ(it.cursor()->token(), "p1");
        EXPECT_EQ(it.next(), 3);
        EXPECT_EQ(it.state(), IteratorState::Exhausted);
        EXPECT_FALSE(it.cursor().has_value());
    }

    TEST(PageCursorIterator, MalformedEntryFailsTheWholePage) {
        // second page: nine valid entries and one malformed (-1)
        std::vector<int> second = iota(4, 12);
        second.insert(second.begin() + 5, -1);
        ScriptedSource source{{iota(1, 3), second}};

        auto materialize = [](const int& v) {
            if (v < 0) { throw std::invalid_argument("negative entry"); }
            return v;
        };
        IntIterator it{source.fetcher(), materialize, opts(10)};

        EXPECT_EQ(it.next(), 1);
        EXPECT_EQ(it.next(), 2);
        EXPECT_EQ(it.next(), 3);

        try {
            (void)it.next();
            FAIL() << "expected MaterializationFailure";
        }
        catch (const MaterializationFailure& e) {
            EXPECT_EQ(e.entry_index(), 5u);
            EXPECT_EQ(e.page_item_count(), 10u);
            ASSERT_TRUE(e.page_cursor().has_value());
            EXPECT_EQ(e.page_cursor()->token(), "p1");
            EXPECT_NE(std::string{e.what()}.find("negative entry"), std::string::npos);
        }

        EXPECT_EQ(it.yielded_count(), 3u);
        EXPECT_EQ(it.buffered_count(), 0u);
        EXPECT_EQ(it.state(), IteratorState::Failed);
        EXPECT_THROW((void)it.next(), MaterializationFailure);
        EXPECT_EQ(source.requests.size(), 2u);
    }

    TEST(PageCursorIterator, FetchFailureIsTerminalAndRethrownUnchanged) {
        int calls = 0;
        auto fetch = [&calls](const PageRequest<int64_t>& request) -> Page<int> {
            ++calls;
            if (request.cursor) { throw FetchFailure(FetchFailure::Kind::Transient, "connection reset"); }
            return Page<int>{{1, 2}, std::nullopt, Cursor{"next"}};
        };
        IntIterator it{fetch, identity, opts(2)};

        EXPECT_EQ(it.next(), 1);
        EXPECT_EQ(it.next(), 2);

        bool caught = false;
        try {
            (void)it.next();
        }
        catch (const FetchFailure& e) {
            caught = true;
            EXPECT_TRUE(e.is_transient());
            EXPECT_NE(std::string{e.what()}.find("connection reset"), std::string::npos);
        }
        ASSERT_TRUE(caught);
        EXPECT_EQ(it.state(), IteratorState::Failed);

        try {
            (void)it.next();
            FAIL() << "expected FetchFailure";
        }
        catch (const FetchFailure& e) {
            EXPECT_TRUE(e.is_transient());
            EXPECT_EQ(e.kind(), FetchFailure::Kind::Transient);
        }
        EXPECT_EQ(calls, 2);
    }

    TEST(PageCursorIterator, ForeignExceptionsFromFetchPropagateVerbatim) {
        auto fetch = [](const PageRequest<int64_t>&) -> Page<int> { throw std::out_of_range("shard missing"); };
        IntIterator it{fetch, identity, opts(2)};

        EXPECT_THROW((void)it.next(), std::out_of_range);
        EXPECT_THROW((void)it.next(), std::out_of_range);
        EXPECT_EQ(it.fetch_count(), 0u);
    }

    TEST(PageCursorIterator, CursorThatDoesNotAdvanceFails) {
        auto fetch = [](const PageRequest<int64_t>&) { return Page<int>{{7}, std::nullopt, Cursor{"same"}}; };
        IntIterator it{fetch, identity, opts(1)};

        EXPECT_EQ(it.next(), 7);
        try {
            (void)it.next();
            FAIL() << "expected FetchFailure";
        }
        catch (const FetchFailure& e) {
            EXPECT_FALSE(e.is_transient());
        }
        EXPECT_EQ(it.state(), IteratorState::Failed);
    }

    TEST(PageCursorIterator, RejectsInvalidConstruction) {
        ScriptedSource source{{iota(1, 2)}};

        EXPECT_THROW((IntIterator{source.fetcher(), identity, opts(0)}), MisuseFailure);
        EXPECT_THROW((IntIterator{nullptr, identity, opts(4)}), MisuseFailure);
        EXPECT_THROW((IntIterator{source.fetcher(), nullptr, opts(4)}), MisuseFailure);

        auto o = opts(4);
        o.max_page_size = 0;
        EXPECT_THROW((IntIterator{source.fetcher(), identity, std::move(o)}), MisuseFailure);
    }

    TEST(PageCursorIterator, CapsPageSizeAtMaximum) {
        ScriptedSource source{{iota(1, 2)}};
        auto o = opts(500);
        o.max_page_size = 100;
        IntIterator it{source.fetcher(), identity, std::move(o)};

        EXPECT_EQ(it.page_size(), 100u);
        (void)it.drain();
        ASSERT_EQ(source.requests.size(), 1u);
        EXPECT_EQ(source.requests[0].size, 100u);
    }

    TEST(PageCursorIterator, ReentrantNextIsMisuse) {
        IntIterator* self = nullptr;
        auto fetch = [&self](const PageRequest<int64_t>&) -> Page<int> {
            (void)self->next();
            return Page<int>{{1}, std::nullopt, std::nullopt};
        };
        IntIterator it{fetch, identity, opts(1)};
        self = &it;

        EXPECT_THROW((void)it.next(), MisuseFailure);
        EXPECT_EQ(it.state(), IteratorState::Failed);
    }

    TEST(PageCursorIterator, SendsStandingBoundWithEveryRequest) {
        ScriptedSource source{{iota(1, 2), iota(3, 4), iota(5, 5)}};
        auto o = opts(2);
        o.bound = 11;
        IntIterator it{source.fetcher(), identity, std::move(o)};
        (void)it.drain();

        ASSERT_EQ(source.requests.size(), 3u);
        for (const auto& r : source.requests) { EXPECT_EQ(r.bound, 11); }
    }

    TEST(PageCursorIterator, BackwardTraversalFollowsBeforeCursors) {
        ScriptedSource source{{iota(7, 9), iota(4, 6), iota(1, 3)}, Direction::Backward};
        auto o = opts(3);
        o.direction = Direction::Backward;
        IntIterator it{source.fetcher(), identity, std::move(o)};

        EXPECT_EQ(it.drain(), (std::vector<int>{7, 8, 9, 4, 5, 6, 1, 2, 3}));
        ASSERT_EQ(source.requests.size(), 3u);
        EXPECT_EQ(source.requests[1].after(), nullptr);
        ASSERT_NE(source.requests[1].before(), nullptr);
        EXPECT_EQ(source.requests[1].before()->token(), "p1");
    }

    TEST(PageCursorIterator, WorksInRangeBasedFor) {
        ScriptedSource source{{iota(1, 3), iota(4, 5)}};
        IntIterator it{source.fetcher(), identity, opts(3)};

        std::vector<int> seen;
        for (const int v : it) { seen.push_back(v); }
        EXPECT_EQ(seen, iota(1, 5));
    }

    TEST(PageCursorIterator, MaterializesIntoOtherTypes) {
        ScriptedSource source{{iota(1, 2)}};
        PageCursorIterator<std::string, int> it{
            source.fetcher(),
            [](const int& v) { return "#" + std::to_string(v); },
            PageCursorIterator<std::string, int>::Options{.index = "numbers", .page_size = 4}
        };

        EXPECT_EQ(it.drain(), (std::vector<std::string>{"#1", "#2"}));
    }

    TEST(PageCursorIterator, ReportsPagesToTheSuppliedLogger) {
        std::ostringstream out;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        auto logger = std::make_shared<spdlog::logger>("test", sink);
        logger->set_level(spdlog::level::debug);

        ScriptedSource source{{iota(1, 2), iota(3, 3)}};
        auto o = opts(2);
        o.logger = logger;
        IntIterator it{source.fetcher(), identity, std::move(o)};
        (void)it.drain();
        logger->flush();

        const auto text = out.str();
        EXPECT_NE(text.find("fetch #1 on index 'numbers'"), std::string::npos);
        EXPECT_NE(text.find("fetch #2 on index 'numbers'"), std::string::npos);
    }
} // namespace test
