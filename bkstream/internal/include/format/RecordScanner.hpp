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

// internal/include/format/RecordScanner.hpp
#pragma once

#include "format/RecordHeader.hpp"
#include "io/ByteStream.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include <cstdint>
#include <optional>

namespace bkstream::format {
    /**
     * RecordScanner - Header-by-header walk over a raw backup stream.
     *
     * Usage:
     *   RecordScanner scanner{source};
     *   while (auto header = scanner.next()) {
     *       // optionally scanner.read_payload(...)
     *   }
     *
     * next() skips whatever payload of the previous record was not read:
     * by relative seek where the source allows it, otherwise by reading
     * into a scratch buffer.
     *
     * The source is borrowed and must outlive the scanner.
     * Thread-safety: NOT thread-safe.
     */
    class RecordScanner {
        public:
            explicit RecordScanner(io::ByteSource& source, size_t scratch_size = 64 * 1024);

            /**
             * @return The next header, or std::nullopt at a clean end of input
             * @throws core::CodecError malformed header or TRUNCATED
             * @throws core::IoError on a source failure
             */
            [[nodiscard]] std::optional<RecordHeader> next();

            /**
             * Reads payload of the current record.
             *
             * @return Bytes read; 0 once the payload is exhausted
             * @throws core::CodecError TRUNCATED if the input ends early
             */
            [[nodiscard]] size_t read_payload(core::BufferView dst);

            /**
             * Stream offset of the current header.
             */
            [[nodiscard]] uint64_t position() const noexcept { return header_position_; }

            [[nodiscard]] int64_t payload_left() const noexcept { return payload_left_; }
            [[nodiscard]] uint64_t bytes_consumed() const noexcept { return consumed_; }

        private:
            void skip_payload();
            void discard(int64_t count);

            io::ByteSource& source_;
            core::OwnedBuffer scratch_;
            uint64_t consumed_ = 0;
            uint64_t header_position_ = 0;
            int64_t payload_left_ = 0;
            StreamType current_ = StreamType::INVALID;
    };
} // namespace bkstream::format
