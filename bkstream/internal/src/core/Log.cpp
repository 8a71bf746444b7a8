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

// internal/src/core/Log.cpp
#include "core/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace bkstream::core {
    namespace {
        std::atomic<LogLevel> g_level{LogLevel::WARN};
        std::mutex g_write_mutex;
    } // anonymous namespace

    void set_log_level(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

    LogLevel log_level() noexcept { return g_level.load(std::memory_order_relaxed); }

    void log(LogLevel level, std::string_view message) {
        if (level == LogLevel::OFF || level < log_level()) { return; }

        std::string line = "bkstream: [";
        line += log_level_name(level);
        line += "] ";
        line += message;
        line += '\n';

        std::lock_guard lock{g_write_mutex};
        std::cerr << line;
    }

    std::string_view log_level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::OFF: return "off";
        }
        return "unknown";
    }

    std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
        if (name == "debug") { return LogLevel::DEBUG; }
        if (name == "info") { return LogLevel::INFO; }
        if (name == "warn") { return LogLevel::WARN; }
        if (name == "error") { return LogLevel::ERROR; }
        if (name == "off") { return LogLevel::OFF; }
        return std::nullopt;
    }
} // namespace bkstream::core
