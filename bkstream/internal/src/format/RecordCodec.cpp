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

// internal/src/format/RecordCodec.cpp
#include "format/RecordCodec.hpp"
#include "format/StreamName.hpp"
#include "core/CodecError.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace bkstream::format {
    namespace {
        using core::CodecError;
        using core::ErrorCode;

        // Validates StreamNameSize / Size and returns the bytes following the base header
        size_t extra_size(StreamType id, uint32_t name_size, int64_t wire_size) {
            if (wire_size < 0) { throw CodecError(ErrorCode::NEGATIVE_SIZE, "stream size is negative: " + std::to_string(wire_size)); }

            switch (header_variant(id)) {
                case HeaderVariant::NAMED:
                    if (name_size == 0) { throw CodecError(ErrorCode::EMPTY_STREAM_NAME, "alternate stream header has no name"); }
                    if ((name_size & 1u) != 0) {
                        throw CodecError(ErrorCode::ODD_NAME_LENGTH, "length of the stream name is an odd number: " + std::to_string(name_size));
                    }
                    if (name_size > RecordCodec::MAX_STREAM_NAME_BYTES) {
                        throw CodecError(ErrorCode::NAME_TOO_LONG, "stream name size " + std::to_string(name_size) + " exceeds limit");
                    }
                    return name_size;

                case HeaderVariant::SPARSE:
                    if (wire_size < static_cast<int64_t>(RecordCodec::SPARSE_OFFSET_SIZE)) {
                        throw CodecError(ErrorCode::NEGATIVE_SIZE, "sparse block size " + std::to_string(wire_size) + " is smaller than its offset field");
                    }
                    return RecordCodec::SPARSE_OFFSET_SIZE;

                case HeaderVariant::PLAIN:
                    break;
            }
            return 0;
        }
    } // anonymous namespace

    // ==================== Encoding ====================

    size_t RecordCodec::encoded_size(const RecordHeader& header) {
        switch (header_variant(header.id)) {
            case HeaderVariant::NAMED: return BASE_SIZE + StreamName::to_wire(header.name).size();
            case HeaderVariant::SPARSE: return BASE_SIZE + SPARSE_OFFSET_SIZE;
            case HeaderVariant::PLAIN: break;
        }
        return BASE_SIZE;
    }

    std::vector<std::byte> RecordCodec::encode(const RecordHeader& header) {
        std::vector<std::byte> out(encoded_size(header));
        encode_into(header, core::BufferView::of(out));
        return out;
    }

    size_t RecordCodec::encode_into(const RecordHeader& header, core::BufferView dst) {
        if (header.size < 0) { throw CodecError(ErrorCode::NEGATIVE_SIZE, "stream size is negative: " + std::to_string(header.size)); }

        std::vector<std::byte> extra;
        int64_t wire_size = header.size;

        switch (header_variant(header.id)) {
            case HeaderVariant::NAMED:
                extra = StreamName::to_wire(header.name);
                break;
            case HeaderVariant::SPARSE:
                extra.resize(SPARSE_OFFSET_SIZE);
                core::BufferView::of(extra).write_u64_le(0, header.sparse_offset);
                wire_size += static_cast<int64_t>(SPARSE_OFFSET_SIZE);
                break;
            case HeaderVariant::PLAIN:
                break;
        }

        const size_t total = BASE_SIZE + extra.size();
        if (dst.size() < total) { throw std::out_of_range("RecordCodec::encode_into: buffer too small"); }

        dst.write_u32_le(ID_OFFSET, static_cast<uint32_t>(header.id));
        dst.write_u32_le(ATTRIBUTES_OFFSET, header.attributes);
        dst.write_i64_le(SIZE_OFFSET, wire_size);
        dst.write_u32_le(NAME_SIZE_OFFSET, header_variant(header.id) == HeaderVariant::NAMED ? static_cast<uint32_t>(extra.size()) : 0u);
        dst.copy_from(BASE_SIZE, core::BufferView::of(extra), 0, extra.size());

        return total;
    }

    // ==================== Decoding ====================

    std::optional<size_t> RecordCodec::required_size(core::BufferView src) {
        if (src.size() < BASE_SIZE) { return std::nullopt; }

        const auto id = static_cast<StreamType>(src.read_u32_le(ID_OFFSET));
        const int64_t wire_size = src.read_i64_le(SIZE_OFFSET);
        const uint32_t name_size = src.read_u32_le(NAME_SIZE_OFFSET);

        return BASE_SIZE + extra_size(id, name_size, wire_size);
    }

    std::optional<RecordHeader> RecordCodec::try_decode(core::BufferView src) {
        const auto need = required_size(src);
        if (!need || src.size() < *need) { return std::nullopt; }
        return decode(src);
    }

    RecordHeader RecordCodec::decode(core::BufferView src) {
        const auto need = required_size(src);
        if (!need || src.size() < *need) {
            throw CodecError(ErrorCode::TRUNCATED, "stream header needs " + std::to_string(need.value_or(BASE_SIZE)) + " bytes, have " + std::to_string(src.size()));
        }

        RecordHeader header;
        header.id = static_cast<StreamType>(src.read_u32_le(ID_OFFSET));
        header.attributes = src.read_u32_le(ATTRIBUTES_OFFSET);
        header.size = src.read_i64_le(SIZE_OFFSET);
        header.encoded_size = *need;

        switch (header_variant(header.id)) {
            case HeaderVariant::NAMED: {
                const uint32_t name_size = src.read_u32_le(NAME_SIZE_OFFSET);
                header.name = StreamName::from_wire(src.slice(BASE_SIZE, name_size));
                if (header.name.empty()) {
                    throw CodecError(ErrorCode::EMPTY_STREAM_NAME, "alternate stream name is not of the form :<name>:$DATA");
                }
                break;
            }
            case HeaderVariant::SPARSE:
                header.sparse_offset = src.read_u64_le(BASE_SIZE);
                header.size -= static_cast<int64_t>(SPARSE_OFFSET_SIZE);
                break;
            case HeaderVariant::PLAIN:
                break;
        }

        header.active = true;
        return header;
    }

    bool RecordCodec::read_header(io::ByteSource& source, RecordHeader& out) {
        out.reset();

        std::array<std::byte, BASE_SIZE> base{};
        const core::BufferView base_view{base.data(), base.size()};

        const size_t got = io::read_fully(source, base_view);
        if (got == 0) { return false; }
        if (got < BASE_SIZE) {
            throw CodecError(ErrorCode::TRUNCATED, "input ended inside a stream header (" + std::to_string(got) + " of " + std::to_string(BASE_SIZE) + " bytes)");
        }

        const size_t need = *required_size(base_view);
        if (need == BASE_SIZE) {
            out = decode(base_view);
            return true;
        }

        std::vector<std::byte> full(need);
        const auto full_view = core::BufferView::of(full);
        full_view.copy_from(0, base_view, 0, BASE_SIZE);

        const size_t rest = io::read_fully(source, full_view.slice(BASE_SIZE));
        if (rest < need - BASE_SIZE) {
            throw CodecError(ErrorCode::TRUNCATED, "input ended inside a stream header (" + std::to_string(BASE_SIZE + rest) + " of " + std::to_string(need) + " bytes)");
        }

        out = decode(full_view);
        return true;
    }
} // namespace bkstream::format
