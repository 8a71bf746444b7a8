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

// internal/include/format/StreamName.hpp
#pragma once

#include "core/buffer/BufferView.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bkstream::format {
    /**
     * StreamName - Logical alternate stream name <-> on-wire name.
     *
     * On the wire an alternate stream is named ":<name>:$DATA" in UTF-16LE,
     * without a terminator. Logical names are UTF-8.
     *
     * Other stream kinds (":<name>:$INDEX_ALLOCATION", ":<name>:$BITMAP")
     * unwrap to an empty string; deciding what to do with them is left to the
     * caller.
     */
    class StreamName {
        public:
            static constexpr std::string_view PREFIX = ":";
            static constexpr std::string_view SUFFIX = ":$DATA";

            /**
             * ":" + name + ":$DATA"
             */
            [[nodiscard]] static std::string wrap(std::string_view name);

            /**
             * Returns the text between ":" and ":$DATA", or "" when the
             * string does not have that shape.
             */
            [[nodiscard]] static std::string unwrap(std::string_view wire);

            /**
             * Encodes the wrapped name as UTF-16LE bytes.
             *
             * @throws core::CodecError EMPTY_STREAM_NAME if name is empty
             * @throws core::CodecError INVALID_NAME_ENCODING if name is not valid UTF-8
             */
            [[nodiscard]] static std::vector<std::byte> to_wire(std::string_view name);

            /**
             * Decodes UTF-16LE bytes and unwraps them.
             * Decoding stops at the first NUL code unit; unpaired surrogates
             * become U+FFFD. A trailing odd byte is ignored.
             */
            [[nodiscard]] static std::string from_wire(core::BufferView bytes);

            /**
             * @throws core::CodecError INVALID_NAME_ENCODING on malformed UTF-8
             */
            [[nodiscard]] static std::u16string utf8_to_utf16(std::string_view utf8);

            [[nodiscard]] static std::string utf16_to_utf8(std::u16string_view utf16);
    };
} // namespace bkstream::format
