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

// pagecursor/pagecursor/src/Config.cpp
#include "pagecursor/Config.hpp"

#include "pagecursor/Errors.hpp"
#include "pagecursor/Logging.hpp"
#include <fstream>
#include <sstream>

namespace pagecursor {
    using json = nlohmann::json;

    namespace {
        size_t read_size(const json& j, const char* key, size_t fallback) {
            if (!j.contains(key)) { return fallback; }
            const auto& v = j.at(key);
            if (!v.is_number_integer()) { throw ConfigError(std::string{key} + " must be an integer"); }
            if (v.is_number_unsigned()) {
                const auto n = v.get<uint64_t>();
                if (n == 0) { throw ConfigError(std::string{key} + " must be positive"); }
                return static_cast<size_t>(n);
            }
            const auto n = v.get<int64_t>();
            if (n <= 0) { throw ConfigError(std::string{key} + " must be positive, got " + std::to_string(n)); }
            return static_cast<size_t>(n);
        }

        std::optional<int64_t> read_bound(const json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) { return std::nullopt; }
            const auto& v = j.at(key);
            if (!v.is_number_integer()) { throw ConfigError(std::string{key} + " must be an integer or null"); }
            if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
                throw ConfigError(std::string{key} + " is out of range");
            }
            return v.get<int64_t>();
        }

        std::string read_string(const json& j, const char* key, std::string fallback) {
            if (!j.contains(key)) { return fallback; }
            const auto& v = j.at(key);
            if (!v.is_string()) { throw ConfigError(std::string{key} + " must be a string"); }
            return v.get<std::string>();
        }

        Direction parse_direction(const std::string& text) {
            if (text == "forward") { return Direction::Forward; }
            if (text == "backward") { return Direction::Backward; }
            throw ConfigError("direction must be \"forward\" or \"backward\", got \"" + text + "\"");
        }
    } // anonymous namespace

    void from_json(const json& j, IteratorConfig& config) {
        if (!j.is_object()) { throw ConfigError("iterator config must be a JSON object"); }

        config = IteratorConfig{};
        config.index = read_string(j, "index", config.index);
        config.page_size = read_size(j, "page_size", config.page_size);
        config.max_page_size = read_size(j, "max_page_size", config.max_page_size);
        config.direction = parse_direction(read_string(j, "direction", std::string{to_string(config.direction)}));
        config.lower_bound = read_bound(j, "lower_bound");
        config.upper_bound = read_bound(j, "upper_bound");
        config.log_level = read_string(j, "log_level", config.log_level);

        if (config.lower_bound && config.upper_bound && *config.lower_bound > *config.upper_bound) {
            throw ConfigError(
                "lower_bound " + std::to_string(*config.lower_bound) +
                " is greater than upper_bound " + std::to_string(*config.upper_bound)
            );
        }

        (void)logging::parse_level(config.log_level);
    }

    IteratorConfig parse_iterator_config(std::string_view text) {
        json j;
        try {
            j = json::parse(text);
        }
        catch (const json::parse_error& e) {
            throw ConfigError(std::string{"invalid JSON: "} + e.what());
        }
        return j.get<IteratorConfig>();
    }

    IteratorConfig load_iterator_config(const std::filesystem::path& path) {
        std::ifstream in{path};
        if (!in) { throw ConfigError("cannot open " + path.string()); }

        std::ostringstream buf;
        buf << in.rdbuf();
        return parse_iterator_config(std::string_view{buf.str()});
    }

    void to_json(json& j, const IteratorConfig& config) {
        j = json{
            {"index", config.index},
            {"page_size", config.page_size},
            {"max_page_size", config.max_page_size},
            {"direction", std::string{to_string(config.direction)}},
            {"lower_bound", config.lower_bound ? json(*config.lower_bound) : json(nullptr)},
            {"upper_bound", config.upper_bound ? json(*config.upper_bound) : json(nullptr)},
            {"log_level", config.log_level}
        };
    }
} // namespace pagecursor
