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

// pagecursor/pagecursor/include/pagecursor/Config.hpp
#pragma once

#include "pagecursor/Export.hpp"
#include "pagecursor/Page.hpp"
#include "pagecursor/RangeFilter.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pagecursor {
    /**
     * IteratorConfig - Traversal settings loadable from JSON.
     *
     * Example:
     *   {
     *     "index": "customer_id_filter",
     *     "page_size": 8,
     *     "max_page_size": 100000,
     *     "direction": "forward",
     *     "lower_bound": 5,
     *     "upper_bound": 11,
     *     "log_level": "debug"
     *   }
     *
     * Every key is optional; unknown keys are ignored.
     */
    struct IteratorConfig {
        std::string index;
        size_t page_size = 64;
        size_t max_page_size = 100'000;
        Direction direction = Direction::Forward;
        std::optional<int64_t> lower_bound;
        std::optional<int64_t> upper_bound;
        std::string log_level = "info";

        [[nodiscard]] KeyRange<int64_t> range() const { return KeyRange<int64_t>{lower_bound, upper_bound}; }
    };

    /**
     * Reads a configuration object (nlohmann ADL hook, `j.get<IteratorConfig>()`).
     *
     * @throws ConfigError on a wrong type or out-of-range value, naming the key
     */
    PAGECURSOR_API void from_json(const nlohmann::json& j, IteratorConfig& config);

    /**
     * @throws ConfigError if the text is not a JSON object or is invalid
     */
    [[nodiscard]] PAGECURSOR_API IteratorConfig parse_iterator_config(std::string_view text);

    /**
     * @throws ConfigError if the file cannot be read or is invalid
     */
    [[nodiscard]] PAGECURSOR_API IteratorConfig load_iterator_config(const std::filesystem::path& path);

    /**
     * Serializes the effective configuration (nlohmann ADL hook).
     */
    PAGECURSOR_API void to_json(nlohmann::json& j, const IteratorConfig& config);
} // namespace pagecursor
