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

// pagecursor/pagecursor/include/pagecursor/Logging.hpp
#pragma once

#include "pagecursor/Export.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

/**
 * Logger construction helpers.
 *
 * Loggers are handed to components explicitly; nothing in the library
 * registers or reads spdlog's global default logger.
 */
namespace pagecursor::logging {
    /**
     * Returns a shared logger that discards everything.
     */
    [[nodiscard]] PAGECURSOR_API std::shared_ptr<spdlog::logger> null_logger();

    /**
     * Creates an unregistered stderr colour logger.
     *
     * @param name  Logger name shown in each line
     * @param level Minimum level emitted
     */
    [[nodiscard]] PAGECURSOR_API std::shared_ptr<spdlog::logger> make_console_logger(
        const std::string& name,
        spdlog::level::level_enum level = spdlog::level::info
    );

    /**
     * Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
     *
     * @throws ConfigError for any other value
     */
    [[nodiscard]] PAGECURSOR_API spdlog::level::level_enum parse_level(std::string_view name);
} // namespace pagecursor::logging
