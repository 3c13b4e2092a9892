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

// pagecursor/pagecursor/src/Logging.cpp
#include "pagecursor/Logging.hpp"

#include "pagecursor/Errors.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <utility>

namespace pagecursor::logging {
    namespace {
        constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LEVELS{{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off},
        }};
    } // anonymous namespace

    std::shared_ptr<spdlog::logger> null_logger() {
        static const auto logger = [] {
            auto l = std::make_shared<spdlog::logger>("pagecursor.null", std::make_shared<spdlog::sinks::null_sink_mt>());
            l->set_level(spdlog::level::off);
            return l;
        }();
        return logger;
    }

    std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name, spdlog::level::level_enum level) {
        auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger->set_level(level);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return logger;
    }

    spdlog::level::level_enum parse_level(std::string_view name) {
        for (const auto& [text, level] : LEVELS) {
            if (text == name) { return level; }
        }
        throw ConfigError("unknown log level '" + std::string{name} + "'");
    }
} // namespace pagecursor::logging
