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

// internal/include/io/ByteStream.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include <cstdint>
#include <string>
#include <system_error>

namespace bkstream::io {
    enum class IoStatus : uint8_t {
        OK = 0,
        ///< More data may follow
        END_OF_INPUT = 1,
        ///< Source exhausted (or sink full)
        ERROR = 2,
        ///< Transfer failed, see IoResult::error
    };

    /**
     * IoResult - Outcome of one read or write attempt.
     *
     * bytes may be non-zero together with any status: a transfer can move
     * some bytes and then report the end of input or a failure.
     */
    struct IoResult {
        size_t bytes = 0;
        IoStatus status = IoStatus::OK;
        std::error_code error{};

        [[nodiscard]] bool ok() const noexcept { return status == IoStatus::OK; }
        [[nodiscard]] bool end_of_input() const noexcept { return status == IoStatus::END_OF_INPUT; }
        [[nodiscard]] bool failed() const noexcept { return status == IoStatus::ERROR; }
    };

    enum class SeekStatus : uint8_t {
        OK = 0,
        ///< Moved within the current record
        BOUNDARY = 1,
        ///< Landed on the next record header
        CANNOT_SEEK = 2,
        ///< Positioned on a header, which cannot be skipped
        END_OF_INPUT = 3,
        ///< Clamped at the end of the stream
        ERROR = 4,
    };

    struct SeekResult {
        uint64_t moved = 0;
        SeekStatus status = SeekStatus::OK;
        std::error_code error{};
    };

    /**
     * ByteSource - Injected source of raw backup stream bytes.
     *
     * Implementations move bytes only; they know nothing about records,
     * except for record-aware sources (the platform backup primitive) that
     * report SeekStatus::BOUNDARY / CANNOT_SEEK.
     *
     * Only relative, forward seeks are ever requested.
     *
     * close() releases the underlying resource exactly once; further calls
     * are no-ops. Failures are reported as core::CloseError.
     */
    class ByteSource {
        public:
            virtual ~ByteSource() = default;

            [[nodiscard]] virtual IoResult read(core::BufferView dst) = 0;
            [[nodiscard]] virtual SeekResult seek(int64_t relative) = 0;
            virtual void close() = 0;

            /**
             * Logical path used in diagnostics.
             */
            [[nodiscard]] virtual const std::string& path() const noexcept = 0;
    };

    /**
     * ByteSink - Injected destination for raw backup stream bytes.
     * Same contract as ByteSource, for writes.
     */
    class ByteSink {
        public:
            virtual ~ByteSink() = default;

            [[nodiscard]] virtual IoResult write(core::BufferView src) = 0;
            [[nodiscard]] virtual SeekResult seek(int64_t relative) = 0;
            virtual void close() = 0;

            [[nodiscard]] virtual const std::string& path() const noexcept = 0;
    };

    /**
     * Reads until dst is full or the source reports the end of input.
     *
     * @return Bytes read; less than dst.size() only at the end of input
     * @throws core::IoError if the source fails
     */
    [[nodiscard]] size_t read_fully(ByteSource& source, core::BufferView dst);
} // namespace bkstream::io
