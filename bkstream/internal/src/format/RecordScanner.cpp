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

// internal/src/format/RecordScanner.cpp
#include "format/RecordScanner.hpp"
#include "format/RecordCodec.hpp"
#include "core/CodecError.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bkstream::format {
    using core::CodecError;
    using core::ErrorCode;

    namespace {
        [[noreturn]] void truncated(StreamType id, int64_t left) {
            throw CodecError(ErrorCode::TRUNCATED, "input ended with " + std::to_string(left) + " payload bytes left in a " + std::string{stream_type_name(id)} + " stream");
        }
    } // anonymous namespace

    RecordScanner::RecordScanner(io::ByteSource& source, size_t scratch_size)
        : source_{source}, scratch_{core::OwnedBuffer::allocate(scratch_size)} {
        if (scratch_size == 0) { throw std::invalid_argument("RecordScanner: scratch size must be greater than zero"); }
    }

    std::optional<RecordHeader> RecordScanner::next() {
        skip_payload();

        RecordHeader header;
        const uint64_t at = consumed_;
        if (!RecordCodec::read_header(source_, header)) { return std::nullopt; }

        header_position_ = at;
        consumed_ += header.encoded_size;
        payload_left_ = header.size;
        current_ = header.id;
        return header;
    }

    size_t RecordScanner::read_payload(core::BufferView dst) {
        if (payload_left_ == 0 || dst.empty()) { return 0; }

        const auto want = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(dst.size()), payload_left_));
        const size_t got = io::read_fully(source_, dst.slice(0, want));
        if (got == 0) { truncated(current_, payload_left_); }

        consumed_ += got;
        payload_left_ -= static_cast<int64_t>(got);
        return got;
    }

    void RecordScanner::skip_payload() {
        while (payload_left_ > 0) {
            const io::SeekResult result = source_.seek(payload_left_);
            switch (result.status) {
                case io::SeekStatus::OK:
                    if (result.moved == 0) {
                        discard(payload_left_);
                        break;
                    }
                    consumed_ += result.moved;
                    payload_left_ -= static_cast<int64_t>(std::min<uint64_t>(result.moved, static_cast<uint64_t>(payload_left_)));
                    break;

                case io::SeekStatus::BOUNDARY:
                    consumed_ += static_cast<uint64_t>(payload_left_);
                    payload_left_ = 0;
                    break;

                case io::SeekStatus::CANNOT_SEEK:
                    discard(payload_left_);
                    break;

                case io::SeekStatus::END_OF_INPUT:
                    consumed_ += result.moved;
                    truncated(current_, payload_left_ - static_cast<int64_t>(result.moved));

                case io::SeekStatus::ERROR:
                    throw core::IoError("seek", source_.path(), result.error);
            }
        }
    }

    void RecordScanner::discard(int64_t count) {
        const core::BufferView scratch = scratch_.view();
        while (count > 0) {
            const auto want = static_cast<size_t>(std::min<int64_t>(count, static_cast<int64_t>(scratch.size())));
            const size_t got = io::read_fully(source_, scratch.slice(0, want));
            consumed_ += got;
            payload_left_ -= static_cast<int64_t>(got);
            count -= static_cast<int64_t>(got);
            if (got < want) { truncated(current_, payload_left_); }
        }
    }
} // namespace bkstream::format
