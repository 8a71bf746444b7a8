/*
 * bkstream
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This file is part of bkstream.
 *
 * bkstream is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * bkstream is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with bkstream.  If not, see <https://www.gnu.org/licenses/>.
 */

// internal/include/core/Log.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bkstream::core {
    enum class LogLevel : uint8_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        OFF = 4,
    };

    /**
     * Sets the process-wide threshold. Messages below it are dropped.
     * Default: WARN
     */
    void set_log_level(LogLevel level) noexcept;

    [[nodiscard]] LogLevel log_level() noexcept;

    /**
     * Writes "bkstream: [level] message" to stderr.
     * Thread-safe; one line per call.
     */
    void log(LogLevel level, std::string_view message);

    [[nodiscard]] std::string_view log_level_name(LogLevel level) noexcept;

    /**
     * Parses "debug", "info", "warn", "error" or "off" (case-sensitive).
     */
    [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;
} // namespace bkstream::core
