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

// internal/include/config/CodecOptions.hpp
#pragma once

#include "core/Log.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace bkstream::config {
    /**
     * CodecOptions - Tunables shared by the pipelines, the file streams and
     * the command line tool.
     *
     * JSON form (every key optional, unknown keys ignored):
     *   {
     *     "maxWriteStalls": 64,
     *     "copyBufferSize": 65536,
     *     "scanBufferSize": 65536,
     *     "syncOnClose": true,
     *     "overwrite": false,
     *     "logLevel": "warn"
     *   }
     */
    struct CodecOptions {
        // ── Reverse pipeline ─────────────────────────────────────────────────

        /**
         * Consecutive zero-byte sink writes tolerated before the write loop
         * gives up with WRITE_STALLED. 0 fails on the first stall.
         * Default: 64
         */
        uint32_t max_write_stalls = 64;

        // ── Buffers ──────────────────────────────────────────────────────────

        /**
         * Buffer between the reader and the writer in copy_stream().
         * Default: 64 KiB
         */
        size_t copy_buffer_size = 64 * 1024;

        /**
         * Scratch buffer used by RecordScanner to skip payload on sources
         * that cannot seek.
         * Default: 64 KiB
         */
        size_t scan_buffer_size = 64 * 1024;

        // ── File sinks ───────────────────────────────────────────────────────

        /**
         * fdatasync() file sinks before closing them.
         * Default: true
         */
        bool sync_on_close = true;

        /**
         * Replace an existing output file instead of failing.
         * Default: false
         */
        bool overwrite = false;

        // ── Diagnostics ──────────────────────────────────────────────────────

        core::LogLevel log_level = core::LogLevel::WARN;

        /**
         * Parses options from JSON text. Missing keys keep their defaults.
         *
         * @throws core::CodecError INVALID_CONFIG on malformed JSON, a wrong
         *         value type, a zero buffer size or an unknown log level
         */
        [[nodiscard]] static CodecOptions parse(std::string_view json_text);

        /**
         * @throws core::IoError if the file cannot be read
         * @throws core::CodecError INVALID_CONFIG (see parse())
         */
        [[nodiscard]] static CodecOptions load(const std::filesystem::path& path);

        /**
         * Serializes every field; parse(dump()) yields an equal value.
         */
        [[nodiscard]] std::string dump(int indent = 2) const;

        [[nodiscard]] bool operator==(const CodecOptions&) const = default;
    };
} // namespace bkstream::config
