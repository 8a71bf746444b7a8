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


// internal/src/core/buffer/BufferView.cpp
#include "core/buffer/BufferView.hpp"

#include <bit>
#include <cstring>
#include <stdexcept>
#include <string>

namespace bkstream::core {
    namespace {
        // Little-Endian, one byte at a time
        template <typename T>
        T load(const std::byte* at) noexcept {
            T value = 0;
            for (size_t i = 0; i < sizeof(T); ++i) { value |= static_cast<T>(std::to_integer<T>(at[i]) << (8 * i)); }
            return value;
        }

        template <typename T>
        void store(std::byte* at, T value) noexcept {
            for (size_t i = 0; i < sizeof(T); ++i) { at[i] = static_cast<std::byte>((value >> (8 * i)) & 0xFFu); }
        }
    } // anonymous namespace

    BufferView BufferView::slice(size_t offset, size_t length) const {
        check_bounds(offset, length);
        return BufferView{data_ + offset, length};
    }

    BufferView BufferView::slice(size_t offset) const {
        check_bounds(offset, 0);
        return BufferView{data_ + offset, size_ - offset};
    }

    // ==================== Header Fields (LE) ====================

    uint16_t BufferView::read_u16_le(size_t offset) const {
        check_bounds(offset, sizeof(uint16_t));
        return load<uint16_t>(data_ + offset);
    }

    uint32_t BufferView::read_u32_le(size_t offset) const {
        check_bounds(offset, sizeof(uint32_t));
        return load<uint32_t>(data_ + offset);
    }

    uint64_t BufferView::read_u64_le(size_t offset) const {
        check_bounds(offset, sizeof(uint64_t));
        return load<uint64_t>(data_ + offset);
    }

    int64_t BufferView::read_i64_le(size_t offset) const { return std::bit_cast<int64_t>(read_u64_le(offset)); }

    void BufferView::write_u16_le(size_t offset, uint16_t value) const {
        check_bounds(offset, sizeof(value));
        store(data_ + offset, value);
    }

    void BufferView::write_u32_le(size_t offset, uint32_t value) const {
        check_bounds(offset, sizeof(value));
        store(data_ + offset, value);
    }

    void BufferView::write_u64_le(size_t offset, uint64_t value) const {
        check_bounds(offset, sizeof(value));
        store(data_ + offset, value);
    }

    void BufferView::write_i64_le(size_t offset, int64_t value) const { write_u64_le(offset, std::bit_cast<uint64_t>(value)); }

    void BufferView::copy_from(size_t offset, BufferView src, size_t src_offset, size_t length) const {
        check_bounds(offset, length);
        src.check_bounds(src_offset, length);
        if (length > 0) { std::memmove(data_ + offset, src.data_ + src_offset, length); }
    }

    void BufferView::check_bounds(size_t offset, size_t length) const {
        if (offset > size_ || length > size_ - offset) {
            throw std::out_of_range("BufferView: " + std::to_string(length) + " bytes at offset " + std::to_string(offset) + " exceed a " + std::to_string(size_) + "-byte view");
        }
    }
} // namespace bkstream::core
