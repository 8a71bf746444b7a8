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


// internal/include/core/buffer/BufferView.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bkstream::core {
    /**
     * BufferView - Non-owning window over caller memory.
     *
     * Read destinations, write sources and header scratch space all travel
     * as a BufferView. Field accessors are Little-Endian, the byte order of
     * every fixed-width field in a backup stream header, and are checked
     * against the window (std::out_of_range).
     *
     * A view is two words and is passed by value. Writing through a const
     * view is allowed: constness covers the window, not the bytes.
     */
    class BufferView {
        public:
            constexpr BufferView() noexcept : data_{nullptr}, size_{0} {}

            constexpr BufferView(std::byte* data, size_t size) noexcept : data_{data}, size_{size} {}

            /**
             * Views the current contents of a byte vector.
             * Invalidated by any operation that reallocates the vector.
             */
            [[nodiscard]] static BufferView of(std::vector<std::byte>& bytes) noexcept { return BufferView{bytes.data(), bytes.size()}; }

            [[nodiscard]] constexpr std::byte* data() const noexcept { return data_; }
            [[nodiscard]] constexpr size_t size() const noexcept { return size_; }
            [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

            [[nodiscard]] constexpr std::span<const std::byte> as_const_span() const noexcept { return {data_, size_}; }

            [[nodiscard]] std::vector<std::byte> to_vector() const { return {data_, data_ + size_}; }

            // ==================== Windows ====================

            /**
             * @throws std::out_of_range if offset + length > size()
             */
            [[nodiscard]] BufferView slice(size_t offset, size_t length) const;

            /**
             * Window from offset to the end; slice(size()) is empty.
             *
             * @throws std::out_of_range if offset > size()
             */
            [[nodiscard]] BufferView slice(size_t offset) const;

            // ==================== Header Fields (LE) ====================

            [[nodiscard]] uint16_t read_u16_le(size_t offset) const;
            [[nodiscard]] uint32_t read_u32_le(size_t offset) const;
            [[nodiscard]] uint64_t read_u64_le(size_t offset) const;

            /**
             * Two's complement; the Size field of a header is signed.
             */
            [[nodiscard]] int64_t read_i64_le(size_t offset) const;

            void write_u16_le(size_t offset, uint16_t value) const;
            void write_u32_le(size_t offset, uint32_t value) const;
            void write_u64_le(size_t offset, uint64_t value) const;
            void write_i64_le(size_t offset, int64_t value) const;

            /**
             * Copies length bytes of src (from src_offset) to offset.
             * The two ranges may overlap.
             *
             * @throws std::out_of_range if either range leaves its view
             */
            void copy_from(size_t offset, BufferView src, size_t src_offset, size_t length) const;

        private:
            void check_bounds(size_t offset, size_t length) const;

            std::byte* data_;
            size_t size_;
    };
} // namespace bkstream::core
