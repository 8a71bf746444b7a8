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

// internal/include/format/RecordCodec.hpp
#pragma once

#include "format/RecordHeader.hpp"
#include "io/ByteStream.hpp"
#include "core/buffer/BufferView.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace bkstream::format {
    /**
     * RecordCodec - Field-by-field encoder/decoder for stream headers.
     *
     * All functions are stateless. Decoding never looks past the header: the
     * payload that follows belongs to the caller.
     *
     * Failure model:
     * - Not enough bytes: try_decode()/required_size() return std::nullopt,
     *   decode() throws TRUNCATED.
     * - Malformed header: core::CodecError (ODD_NAME_LENGTH,
     *   EMPTY_STREAM_NAME, NAME_TOO_LONG, NEGATIVE_SIZE).
     */
    class RecordCodec {
        public:
            static constexpr size_t BASE_SIZE = 20;
            static constexpr size_t ID_OFFSET = 0;
            static constexpr size_t ATTRIBUTES_OFFSET = 4;
            static constexpr size_t SIZE_OFFSET = 8;
            static constexpr size_t NAME_SIZE_OFFSET = 16;
            static constexpr size_t SPARSE_OFFSET_SIZE = 8;

            /**
             * Upper bound for StreamNameSize. NTFS names are at most 255
             * UTF-16 units; the bound leaves ample room while refusing to
             * buffer absurd lengths from corrupt input.
             */
            static constexpr size_t MAX_STREAM_NAME_BYTES = 64 * 1024;

            // ==================== Encoding ====================

            /**
             * Header bytes encode() will produce.
             *
             * @throws core::CodecError EMPTY_STREAM_NAME / INVALID_NAME_ENCODING for named records
             */
            [[nodiscard]] static size_t encoded_size(const RecordHeader& header);

            /**
             * Encodes a header. For sparse blocks the wire Size is
             * header.size + 8.
             *
             * @throws core::CodecError NEGATIVE_SIZE, EMPTY_STREAM_NAME, INVALID_NAME_ENCODING
             */
            [[nodiscard]] static std::vector<std::byte> encode(const RecordHeader& header);

            /**
             * Encodes into dst.
             *
             * @return Number of bytes written
             * @throws std::out_of_range if dst is too small
             */
            static size_t encode_into(const RecordHeader& header, core::BufferView dst);

            // ==================== Decoding ====================

            /**
             * Full header size announced by the base header in src.
             *
             * @return std::nullopt if src holds fewer than BASE_SIZE bytes
             * @throws core::CodecError if the name length is invalid
             */
            [[nodiscard]] static std::optional<size_t> required_size(core::BufferView src);

            /**
             * Decodes a header from the start of src.
             *
             * @return std::nullopt if src does not yet hold the complete header
             */
            [[nodiscard]] static std::optional<RecordHeader> try_decode(core::BufferView src);

            /**
             * Decodes a header from the start of src.
             *
             * @throws core::CodecError TRUNCATED if src is too short
             */
            [[nodiscard]] static RecordHeader decode(core::BufferView src);

            /**
             * Reads and decodes one header from a byte source into out.
             * out is reset() first.
             *
             * @return false on a clean end of input before the first header byte
             * @throws core::CodecError TRUNCATED if the input ends inside the header
             * @throws core::IoError on a source failure
             */
            static bool read_header(io::ByteSource& source, RecordHeader& out);
    };
} // namespace bkstream::format
