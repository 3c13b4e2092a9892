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

/*
 * Customer lesson - walks through the query patterns of the customer
 * tutorial against the in-process document store.
 *
 * Run:
 *   ./pagecursor_lesson --scenario all
 *   ./pagecursor_lesson --scenario lookup
 *   ./pagecursor_lesson --scenario less
 *   ./pagecursor_lesson --scenario between
 *   ./pagecursor_lesson --scenario paginate --page-size 8
 *   ./pagecursor_lesson --config iterator.json --log-level debug
 */

#include "Customer.hpp"

#include <pagecursor/PageCursor.hpp>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace pagecursor;
using namespace pagecursor::lesson;
using json = nlohmann::json;

namespace {
    using CustomerIterator = PageCursorIterator<Customer, store::IndexEntry>;

    struct LessonSettings {
        std::string scenario = "all";
        IteratorConfig iterator;
    };

    void log_customers(spdlog::logger& log, const char* label, const std::vector<Customer>& customers) {
        log.info("{} customers size: {}", label, customers.size());
        for (const auto& c : customers) { log.info("{} next customer: {}", label, json(c).dump()); }
    }

    std::vector<Customer> load_all(const store::DocumentStore& db, const std::vector<store::DocRef>& refs) {
        std::vector<Customer> out;
        out.reserve(refs.size());
        for (const auto& ref : refs) { out.push_back(db.get(ref).data.get<Customer>()); }
        return out;
    }

    /**
     * Wraps the store's fetch function so every page is reported the way
     * the tutorial prints it.
     */
    CustomerIterator::Fetch logging_fetcher(const store::DocumentStore& db, std::shared_ptr<spdlog::logger> log) {
        return [fetch = db.fetcher(), log = std::move(log)](const PageRequest<int64_t>& request) {
            auto page = fetch(request);
            log->info("page of {} entries from '{}'", page.items.size(), request.index);
            if (page.after) { log->info("After: {}", page.after->token()); }
            return page;
        };
    }

    CustomerIterator make_iterator(
        const store::DocumentStore& db,
        const IteratorConfig& config,
        const KeyRange<int64_t>& range,
        std::shared_ptr<spdlog::logger> log
    ) {
        auto split = split_range<store::IndexEntry>(range, config.direction, &store::IndexEntry::key);
        return CustomerIterator{
            logging_fetcher(db, log),
            [&db](const store::IndexEntry& e) { return load_customer(db, e); },
            CustomerIterator::Options{
                .index = config.index.empty() ? CUSTOMER_ID_FILTER : config.index,
                .page_size = config.page_size,
                .max_page_size = config.max_page_size,
                .direction = config.direction,
                .bound = split.store_bound,
                .filter = std::move(split.filter),
                .logger = log
            }
        };
    }

    // ==================== Scenarios ====================

    void save_all_customers(store::DocumentStore& db, spdlog::logger& log) {
        const std::vector<Customer> customers{{101, 200}, {102, 300}, {103, 400}, {104, 500}};

        std::vector<json> batch;
        for (const auto& c : customers) { batch.emplace_back(c); }

        const auto refs = db.create_batch(CUSTOMERS, batch);
        log.info("Created list of customers from customers: \n{}", json(refs).dump(2));
        log_customers(log, "saveAllCustomers", load_all(db, refs));
    }

    void create_customers(store::DocumentStore& db, spdlog::logger& log) {
        std::vector<json> batch;
        for (int64_t id = 1; id <= 20; ++id) { batch.push_back(json(Customer{id, id * 10})); }

        const auto refs = db.create_batch(CUSTOMERS, batch);
        log_customers(log, "createCustomers", load_all(db, refs));
    }

    void run_lookups(const store::DocumentStore& db, spdlog::logger& log) {
        const auto one = db.match(CUSTOMER_BY_ID, 1);
        if (one.empty()) { throw store::NotFound("customer 1 not found"); }
        const auto doc = db.get(one.front());
        log.info("Read 'customer' 1: \n{}", json(doc).dump(2));

        log_customers(log, "readThreeCustomers", load_all(db, db.match_any(CUSTOMER_BY_ID, {1, 3, 7})));
        log_customers(log, "readListOfCustomers", load_all(db, db.match_any(CUSTOMER_BY_ID, {1, 3, 6, 7})));
    }

    void run_range(
        const char* label,
        const store::DocumentStore& db,
        const IteratorConfig& config,
        const KeyRange<int64_t>& range,
        const std::shared_ptr<spdlog::logger>& log
    ) {
        auto it = make_iterator(db, config, range, log);
        const auto customers = it.drain();
        log_customers(*log, label, customers);
        log->info("{}: {} fetches, {} filtered", label, it.fetch_count(), it.filtered_count());
    }

    void print_usage() {
        std::cerr << "Usage: pagecursor_lesson [--scenario all|lookup|less|between|paginate]"
            << " [--page-size N] [--config FILE] [--log-level LEVEL]" << std::endl;
    }

    LessonSettings parse_args(int argc, char** argv) {
        LessonSettings settings;
        std::optional<size_t> page_size;
        std::optional<std::string> log_level;
        bool from_file = false;

        for (int i = 1; i < argc; ++i) {
            const bool has_value = i + 1 < argc;
            if (std::strcmp(argv[i], "--scenario") == 0 && has_value) { settings.scenario = argv[++i]; }
            else if (std::strcmp(argv[i], "--config") == 0 && has_value) {
                settings.iterator = load_iterator_config(argv[++i]);
                from_file = true;
            }
            else if (std::strcmp(argv[i], "--page-size") == 0 && has_value) { page_size = parse_page_size(argv[++i]); }
            else if (std::strcmp(argv[i], "--log-level") == 0 && has_value) { log_level = argv[++i]; }
            else { throw ConfigError(std::string{"unknown argument "} + argv[i]); }
        }

        // The tutorial pages through 20 customers 8 at a time
        if (page_size) { settings.iterator.page_size = *page_size; }
        else if (!from_file) { settings.iterator.page_size = 8; }
        if (log_level) { settings.iterator.log_level = *log_level; }
        return settings;
    }
} // anonymous namespace

int main(int argc, char** argv) {
    LessonSettings settings;
    try {
        settings = parse_args(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        print_usage();
        return 1;
    }

    const auto& s = settings.scenario;
    if (s != "all" && s != "lookup" && s != "less" && s != "between" && s != "paginate") {
        std::cerr << "Unknown scenario: " << s << std::endl;
        print_usage();
        return 1;
    }

    try {
        auto log = logging::make_console_logger("lesson", logging::parse_level(settings.iterator.log_level));
        log->info("effective iterator config: {}", json(settings.iterator).dump());

        store::DocumentStore db{store::DocumentStore::Options{.logger = log}};
        create_customer_schema(db);
        save_all_customers(db, *log);
        create_customers(db, *log);

        const auto& config = settings.iterator;
        if (s == "all" || s == "lookup") { run_lookups(db, *log); }
        if (s == "all" || s == "less") { run_range("readCustomersLessThan", db, config, at_most<int64_t>(5), log); }
        if (s == "all" || s == "between") { run_range("readCustomersBetween", db, config, between<int64_t>(5, 11), log); }
        if (s == "all" || s == "paginate") { run_range("readAllCustomers", db, config, config.range(), log); }

        log->info("lesson '{}' finished", s);
    }
    catch (const FetchFailure& e) {
        std::cerr << "Lesson failed: " << e.what() << std::endl;
        if (e.is_transient()) { std::cerr << "The store may accept the request if retried." << std::endl; }
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Lesson failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
