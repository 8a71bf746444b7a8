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

// internal/include/format/StreamType.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bkstream::format {
    /**
     * StreamType - Semantic kind of a backup stream record (StreamId field).
     *
     * Wire values are fixed by the NT backup format. Values outside this list
     * are carried through unchanged and decode with the plain header layout.
     */
    enum class StreamType : uint32_t {
        INVALID = 0,
        DATA = 1, ///< Primary (unnamed) data
        EA_DATA = 2, ///< Extended attributes
        SECURITY_DATA = 3, ///< Security descriptor
        ALTERNATE_DATA = 4, ///< Named alternate data stream
        LINK = 5, ///< Hard link information
        PROPERTY_DATA = 6,
        OBJECT_ID = 7,
        REPARSE_DATA = 8,
        SPARSE_BLOCK = 9, ///< Sparse extent, prefixed by its file offset
        TXFS_DATA = 10, ///< Transactional data
        GHOSTED_FILE_EXTENTS = 11,
    };

    /**
     * StreamAttribute - Bits of the StreamAttributes field.
     * Orthogonal to the stream type; the codec copies them through.
     */
    namespace StreamAttribute {
        inline constexpr uint32_t NORMAL = 0;
        inline constexpr uint32_t MODIFIED_WHEN_READ = 1u << 0;
        inline constexpr uint32_t CONTAINS_SECURITY = 1u << 1;
        inline constexpr uint32_t CONTAINS_PROPERTIES = 1u << 2;
        inline constexpr uint32_t SPARSE = 1u << 3;
        inline constexpr uint32_t CONTAINS_GHOSTED_FILE_EXTENTS = 1u << 4;
    } // namespace StreamAttribute

    /**
     * HeaderVariant - Type-specific fields following the 20-byte base header.
     */
    enum class HeaderVariant : uint8_t {
        PLAIN, ///< No extra field
        NAMED, ///< StreamNameSize bytes of UTF-16LE name
        SPARSE, ///< 8-byte sparse offset
    };

    [[nodiscard]] constexpr HeaderVariant header_variant(StreamType type) noexcept {
        switch (type) {
            case StreamType::ALTERNATE_DATA: return HeaderVariant::NAMED;
            case StreamType::SPARSE_BLOCK: return HeaderVariant::SPARSE;
            default: return HeaderVariant::PLAIN;
        }
    }

    [[nodiscard]] constexpr bool is_known_stream_type(StreamType type) noexcept {
        return static_cast<uint32_t>(type) <= static_cast<uint32_t>(StreamType::GHOSTED_FILE_EXTENTS);
    }

    /**
     * Returns the registry name ("DATA", "ALTERNATE_DATA", ...).
     * Unknown values yield "UNKNOWN".
     */
    [[nodiscard]] std::string_view stream_type_name(StreamType type) noexcept;

    /**
     * Parses a registry name, case-insensitive, or a decimal wire value.
     */
    [[nodiscard]] std::optional<StreamType> parse_stream_type(std::string_view name);

    /**
     * Renders attribute bits as "SPARSE|CONTAINS_SECURITY", "NORMAL" for 0.
     * Unknown bits are rendered in hex.
     */
    [[nodiscard]] std::string describe_attributes(uint32_t attributes);
} // namespace bkstream::format
