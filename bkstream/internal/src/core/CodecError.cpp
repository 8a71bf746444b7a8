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

// internal/src/core/CodecError.cpp
#include "core/CodecError.hpp"

#include <utility>

namespace bkstream::core {
    namespace {
        std::string join_failures(const std::vector<std::string>& failures) {
            std::string joined;
            for (const auto& failure : failures) {
                if (!joined.empty()) { joined += "; "; }
                joined += failure;
            }
            return joined;
        }
    } // anonymous namespace

    std::string_view error_code_name(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::NONE: return "NONE";
            case ErrorCode::ODD_NAME_LENGTH: return "ODD_NAME_LENGTH";
            case ErrorCode::EMPTY_STREAM_NAME: return "EMPTY_STREAM_NAME";
            case ErrorCode::NAME_TOO_LONG: return "NAME_TOO_LONG";
            case ErrorCode::INVALID_NAME_ENCODING: return "INVALID_NAME_ENCODING";
            case ErrorCode::NEGATIVE_SIZE: return "NEGATIVE_SIZE";
            case ErrorCode::TRUNCATED: return "TRUNCATED";
            case ErrorCode::SKIP_HEADER: return "SKIP_HEADER";
            case ErrorCode::UNSUPPORTED_SEEK: return "UNSUPPORTED_SEEK";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::WRITE_ABORTED: return "WRITE_ABORTED";
            case ErrorCode::WRITE_STALLED: return "WRITE_STALLED";
            case ErrorCode::CLOSED: return "CLOSED";
            case ErrorCode::CLOSE_FAILED: return "CLOSE_FAILED";
            case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        }
        return "UNKNOWN";
    }

    CodecError::CodecError(ErrorCode code, const std::string& message)
        : std::runtime_error{std::string{error_code_name(code)} + ": " + message}, code_{code} {}

    // Mirrors the "<op> <path>: <reason>" shape of a path error
    IoError::IoError(std::string op, std::string path, std::error_code error)
        : CodecError{ErrorCode::IO_ERROR, op + " " + path + ": " + error.message()},
          op_{std::move(op)},
          path_{std::move(path)},
          error_{error} {}

    CloseError::CloseError(std::vector<std::string> failures)
        : CodecError{ErrorCode::CLOSE_FAILED, join_failures(failures)}, failures_{std::move(failures)} {}
} // namespace bkstream::core
