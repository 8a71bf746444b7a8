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

// internal/include/format/RecordHeader.hpp
#pragma once

#include "format/StreamType.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace bkstream::format {
    /**
     * RecordHeader - One decoded stream header (WIN32_STREAM_ID).
     *
     * On-wire layout (LE):
     * [StreamId:u32][StreamAttributes:u32][Size:i64][StreamNameSize:u32]
     * followed by
     * - ALTERNATE_DATA: StreamNameSize bytes of UTF-16LE ":<name>:$DATA"
     * - SPARSE_BLOCK:   [SparseOffset:u64], counted in the wire Size
     *
     * Fields:
     * - size: logical payload length. For sparse blocks the wire Size minus 8.
     * - name: logical UTF-8 name, ALTERNATE_DATA only.
     * - sparse_offset: SPARSE_BLOCK only.
     * - encoded_size: header bytes on the wire, set by the codec.
     * - active: set on decode, cleared by the pipelines once the header has
     *   been handed on together with (or ahead of) its first payload bytes.
     *
     * encoded_size and active are bookkeeping; same_record() ignores them.
     */
    struct RecordHeader {
        StreamType id = StreamType::INVALID;
        uint32_t attributes = StreamAttribute::NORMAL;
        int64_t size = 0;
        std::string name;
        uint64_t sparse_offset = 0;

        size_t encoded_size = 0;
        bool active = false;

        /**
         * Clears the type-specific fields before a new decode.
         */
        void reset() noexcept {
            name.clear();
            sparse_offset = 0;
        }

        [[nodiscard]] bool same_record(const RecordHeader& other) const noexcept {
            return id == other.id && attributes == other.attributes && size == other.size && name == other.name && sparse_offset == other.sparse_offset;
        }
    };
} // namespace bkstream::format
