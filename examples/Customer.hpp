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

// examples/Customer.hpp
#pragma once

#include "pagecursor/Errors.hpp"
#include "store/DocumentStore.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>

namespace pagecursor::lesson {
    inline constexpr const char* CUSTOMERS = "customers";
    inline constexpr const char* CUSTOMER_BY_ID = "customer_by_id";
    inline constexpr const char* CUSTOMER_ID_FILTER = "customer_id_filter";

    struct Customer {
        int64_t id = 0;
        int64_t balance = 0;

        [[nodiscard]] friend bool operator==(const Customer&, const Customer&) = default;
    };

    inline void to_json(nlohmann::json& j, const Customer& c) { j = nlohmann::json{{"id", c.id}, {"balance", c.balance}}; }

    /**
     * Strict: both fields must be present and integral. Extra fields are
     * ignored.
     *
     * @throws nlohmann::json::out_of_range if a field is missing
     * @throws std::invalid_argument if a field is not an integer
     */
    inline void from_json(const nlohmann::json& j, Customer& c) {
        const auto read = [&j](const char* field) {
            const auto& v = j.at(field);
            if (!v.is_number_integer()) {
                throw std::invalid_argument(std::string{"customer field '"} + field + "' must be an integer, got " + v.dump());
            }
            return v.get<int64_t>();
        };
        c.id = read("id");
        c.balance = read("balance");
    }

    inline std::ostream& operator<<(std::ostream& os, const Customer& c) {
        return os << "Customer{id=" << c.id << ", balance=" << c.balance << "}";
    }

    /**
     * Parses a --page-size argument: a positive decimal integer with no
     * trailing characters.
     *
     * @throws ConfigError otherwise
     */
    [[nodiscard]] inline size_t parse_page_size(const char* text) {
        errno = 0;
        char* end = nullptr;
        const long long n = std::strtoll(text, &end, 10);
        if (end == text || *end != '\0' || errno == ERANGE || n <= 0) {
            throw ConfigError(std::string{"--page-size must be a positive integer, got '"} + text + "'");
        }
        return static_cast<size_t>(n);
    }

    /**
     * Creates the customers collection, its unique id lookup index and its
     * ordered id index.
     */
    inline void create_customer_schema(store::DocumentStore& db) {
        db.create_collection(CUSTOMERS);
        db.create_index(store::IndexDefinition{
            .name = CUSTOMER_BY_ID,
            .source = CUSTOMERS,
            .term = "id",
            .value = std::nullopt,
            .unique = true
        });
        db.create_index(store::IndexDefinition{
            .name = CUSTOMER_ID_FILTER,
            .source = CUSTOMERS,
            .term = std::nullopt,
            .value = "id",
            .unique = true
        });
    }

    /**
     * Loads the document an index entry points at and converts it.
     *
     * @throws store::NotFound if the document vanished
     * @throws nlohmann::json::exception if a customer field is missing
     * @throws std::invalid_argument if a customer field is not an integer
     */
    [[nodiscard]] inline Customer load_customer(const store::DocumentStore& db, const store::IndexEntry& entry) {
        return db.get(entry.ref).data.get<Customer>();
    }
} // namespace pagecursor::lesson
