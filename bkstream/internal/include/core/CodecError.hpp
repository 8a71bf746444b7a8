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

// internal/include/core/CodecError.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bkstream::core {
    /**
     * ErrorCode - Failure classes reported by the codec.
     *
     * Malformed input (ODD_NAME_LENGTH .. NEGATIVE_SIZE, SKIP_HEADER,
     * UNSUPPORTED_SEEK) is detected locally and never retried. IO_ERROR wraps
     * a source/sink failure. TRUNCATED means the byte stream ended inside a
     * header or a payload.
     */
    enum class ErrorCode : uint8_t {
        NONE = 0,
        ODD_NAME_LENGTH = 1,
        ///< Alternate stream name size is not a multiple of 2
        EMPTY_STREAM_NAME = 2,
        ///< Alternate stream has no usable ":<name>:$DATA" name
        NAME_TOO_LONG = 3,
        ///< Stream name size exceeds MAX_STREAM_NAME_BYTES
        INVALID_NAME_ENCODING = 4,
        ///< Name is not valid UTF-8
        NEGATIVE_SIZE = 5,
        ///< Record size below zero (or sparse size below the offset width)
        TRUNCATED = 6,
        ///< Byte stream ended mid-header or mid-payload
        SKIP_HEADER = 7,
        ///< Seek attempted while a header is pending
        UNSUPPORTED_SEEK = 8,
        ///< Backward seek
        IO_ERROR = 9,
        ///< Underlying source/sink failure
        WRITE_ABORTED = 10,
        ///< Write-error hook aborted the retry loop
        WRITE_STALLED = 11,
        ///< Sink made no progress for too many attempts
        CLOSED = 12,
        ///< Operation on a closed pipeline or stream
        CLOSE_FAILED = 13,
        ///< One or more failures while releasing resources
        INVALID_CONFIG = 14,
        ///< Configuration value rejected
    };

    [[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

    /**
     * CodecError - Base exception of the codec.
     *
     * what() reads "<CODE>: <message>".
     */
    class CodecError : public std::runtime_error {
        public:
            CodecError(ErrorCode code, const std::string& message);

            [[nodiscard]] ErrorCode code() const noexcept { return code_; }

        private:
            ErrorCode code_;
    };

    /**
     * IoError - A source or sink failure, wrapped with the operation and the
     * logical path it happened on.
     *
     * The original std::error_code is kept untouched for callers that need
     * to inspect it (errno values for the POSIX streams).
     */
    class IoError : public CodecError {
        public:
            IoError(std::string op, std::string path, std::error_code error);

            [[nodiscard]] const std::string& op() const noexcept { return op_; }
            [[nodiscard]] const std::string& path() const noexcept { return path_; }
            [[nodiscard]] std::error_code error() const noexcept { return error_; }

        private:
            std::string op_;
            std::string path_;
            std::error_code error_;
    };

    /**
     * CloseError - Every failure met while releasing a stream or pipeline.
     *
     * Release keeps going after the first failure; all messages are kept in
     * the order they were met.
     */
    class CloseError : public CodecError {
        public:
            explicit CloseError(std::vector<std::string> failures);

            [[nodiscard]] const std::vector<std::string>& failures() const noexcept { return failures_; }

        private:
            std::vector<std::string> failures_;
    };
} // namespace bkstream::core
