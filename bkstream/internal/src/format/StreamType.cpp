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

// internal/src/format/StreamType.cpp
#include "format/StreamType.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <utility>

namespace bkstream::format {
    namespace {
        constexpr std::array<std::pair<StreamType, std::string_view>, 12> STREAM_TYPE_NAMES{{
            {StreamType::INVALID, "INVALID"},
            {StreamType::DATA, "DATA"},
            {StreamType::EA_DATA, "EA_DATA"},
            {StreamType::SECURITY_DATA, "SECURITY_DATA"},
            {StreamType::ALTERNATE_DATA, "ALTERNATE_DATA"},
            {StreamType::LINK, "LINK"},
            {StreamType::PROPERTY_DATA, "PROPERTY_DATA"},
            {StreamType::OBJECT_ID, "OBJECT_ID"},
            {StreamType::REPARSE_DATA, "REPARSE_DATA"},
            {StreamType::SPARSE_BLOCK, "SPARSE_BLOCK"},
            {StreamType::TXFS_DATA, "TXFS_DATA"},
            {StreamType::GHOSTED_FILE_EXTENTS, "GHOSTED_FILE_EXTENTS"},
        }};

        constexpr std::array<std::pair<uint32_t, std::string_view>, 5> ATTRIBUTE_NAMES{{
            {StreamAttribute::MODIFIED_WHEN_READ, "MODIFIED_WHEN_READ"},
            {StreamAttribute::CONTAINS_SECURITY, "CONTAINS_SECURITY"},
            {StreamAttribute::CONTAINS_PROPERTIES, "CONTAINS_PROPERTIES"},
            {StreamAttribute::SPARSE, "SPARSE"},
            {StreamAttribute::CONTAINS_GHOSTED_FILE_EXTENTS, "CONTAINS_GHOSTED_FILE_EXTENTS"},
        }};

        bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) { return false; }
            for (size_t i = 0; i < a.size(); ++i) {
                char ca = a[i];
                char cb = b[i];
                if (ca >= 'a' && ca <= 'z') { ca = static_cast<char>(ca - 'a' + 'A'); }
                if (cb >= 'a' && cb <= 'z') { cb = static_cast<char>(cb - 'a' + 'A'); }
                if (ca != cb) { return false; }
            }
            return true;
        }
    } // anonymous namespace

    std::string_view stream_type_name(StreamType type) noexcept {
        for (const auto& [value, name] : STREAM_TYPE_NAMES) {
            if (value == type) { return name; }
        }
        return "UNKNOWN";
    }

    std::optional<StreamType> parse_stream_type(std::string_view name) {
        for (const auto& [value, known] : STREAM_TYPE_NAMES) {
            if (iequals(name, known)) { return value; }
        }

        uint32_t raw = 0;
        const auto* end = name.data() + name.size();
        const auto [ptr, ec] = std::from_chars(name.data(), end, raw);
        if (name.empty() || ec != std::errc{} || ptr != end) { return std::nullopt; }
        return static_cast<StreamType>(raw);
    }

    std::string describe_attributes(uint32_t attributes) {
        if (attributes == StreamAttribute::NORMAL) { return "NORMAL"; }

        std::string out;
        uint32_t remaining = attributes;
        for (const auto& [bit, name] : ATTRIBUTE_NAMES) {
            if ((attributes & bit) == 0) { continue; }
            if (!out.empty()) { out += '|'; }
            out += name;
            remaining &= ~bit;
        }

        if (remaining != 0) {
            char hex[16];
            std::snprintf(hex, sizeof(hex), "0x%X", remaining);
            if (!out.empty()) { out += '|'; }
            out += hex;
        }
        return out;
    }
} // namespace bkstream::format
