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

// internal/src/format/StreamName.cpp
#include "format/StreamName.hpp"
#include "core/CodecError.hpp"

namespace bkstream::format {
    namespace {
        constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

        [[noreturn]] void throw_bad_utf8(size_t at) {
            throw core::CodecError(core::ErrorCode::INVALID_NAME_ENCODING, "invalid UTF-8 in stream name at byte " + std::to_string(at));
        }

        void append_utf8(std::string& out, char32_t cp) {
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000) {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }
    } // anonymous namespace

    std::string StreamName::wrap(std::string_view name) {
        std::string wrapped;
        wrapped.reserve(PREFIX.size() + name.size() + SUFFIX.size());
        wrapped += PREFIX;
        wrapped += name;
        wrapped += SUFFIX;
        return wrapped;
    }

    std::string StreamName::unwrap(std::string_view wire) {
        // prefix and suffix must not overlap
        if (wire.size() < PREFIX.size() + SUFFIX.size()) { return {}; }
        if (!wire.starts_with(PREFIX) || !wire.ends_with(SUFFIX)) { return {}; }
        return std::string{wire.substr(PREFIX.size(), wire.size() - PREFIX.size() - SUFFIX.size())};
    }

    std::vector<std::byte> StreamName::to_wire(std::string_view name) {
        if (name.empty()) { throw core::CodecError(core::ErrorCode::EMPTY_STREAM_NAME, "alternate stream name is empty"); }

        const std::u16string units = utf8_to_utf16(wrap(name));
        std::vector<std::byte> bytes(units.size() * 2);
        const auto view = core::BufferView::of(bytes);
        for (size_t i = 0; i < units.size(); ++i) { view.write_u16_le(i * 2, static_cast<uint16_t>(units[i])); }
        return bytes;
    }

    std::string StreamName::from_wire(core::BufferView bytes) {
        std::u16string units;
        units.reserve(bytes.size() / 2);
        for (size_t off = 0; off + 1 < bytes.size(); off += 2) {
            const uint16_t unit = bytes.read_u16_le(off);
            if (unit == 0) { break; }
            units += static_cast<char16_t>(unit);
        }
        return unwrap(utf16_to_utf8(units));
    }

    std::u16string StreamName::utf8_to_utf16(std::string_view utf8) {
        std::u16string out;
        out.reserve(utf8.size());

        size_t i = 0;
        while (i < utf8.size()) {
            const auto lead = static_cast<unsigned char>(utf8[i]);
            char32_t cp = 0;
            size_t len = 0;
            char32_t min_cp = 0;

            if (lead < 0x80) {
                cp = lead;
                len = 1;
            }
            else if ((lead & 0xE0) == 0xC0) {
                cp = lead & 0x1F;
                len = 2;
                min_cp = 0x80;
            }
            else if ((lead & 0xF0) == 0xE0) {
                cp = lead & 0x0F;
                len = 3;
                min_cp = 0x800;
            }
            else if ((lead & 0xF8) == 0xF0) {
                cp = lead & 0x07;
                len = 4;
                min_cp = 0x10000;
            }
            else { throw_bad_utf8(i); }

            if (i + len > utf8.size()) { throw_bad_utf8(i); }
            for (size_t k = 1; k < len; ++k) {
                const auto cont = static_cast<unsigned char>(utf8[i + k]);
                if ((cont & 0xC0) != 0x80) { throw_bad_utf8(i + k); }
                cp = (cp << 6) | (cont & 0x3F);
            }

            // overlong forms, surrogate code points and out-of-range values
            if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) { throw_bad_utf8(i); }

            if (cp >= 0x10000) {
                const char32_t v = cp - 0x10000;
                out += static_cast<char16_t>(0xD800 + (v >> 10));
                out += static_cast<char16_t>(0xDC00 + (v & 0x3FF));
            }
            else { out += static_cast<char16_t>(cp); }

            i += len;
        }
        return out;
    }

    std::string StreamName::utf16_to_utf8(std::u16string_view utf16) {
        std::string out;
        out.reserve(utf16.size());

        for (size_t i = 0; i < utf16.size(); ++i) {
            const char16_t unit = utf16[i];

            if (unit >= 0xD800 && unit <= 0xDBFF) {
                if (i + 1 < utf16.size() && utf16[i + 1] >= 0xDC00 && utf16[i + 1] <= 0xDFFF) {
                    const char32_t cp = 0x10000 + ((static_cast<char32_t>(unit) - 0xD800) << 10) + (static_cast<char32_t>(utf16[i + 1]) - 0xDC00);
                    append_utf8(out, cp);
                    ++i;
                }
                else { append_utf8(out, REPLACEMENT_CHAR); }
            }
            else if (unit >= 0xDC00 && unit <= 0xDFFF) { append_utf8(out, REPLACEMENT_CHAR); }
            else { append_utf8(out, unit); }
        }
        return out;
    }
} // namespace bkstream::format
