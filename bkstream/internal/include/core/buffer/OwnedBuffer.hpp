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


// internal/include/core/buffer/OwnedBuffer.hpp
#pragma once

#include "BufferView.hpp"
#include <memory>

namespace bkstream::core {
    /**
     * OwnedBuffer - Fixed-size, zero-initialized scratch area.
     *
     * Backs the record scanner's skip buffer and the copy buffer between a
     * reader and a writer. Move-only; the memory goes with the last owner.
     *
     * ```cpp
     * auto scratch = OwnedBuffer::allocate(options.copy_buffer_size);
     * copy_stream(reader, writer, scratch.view());
     * ```
     */
    class OwnedBuffer {
        public:
            OwnedBuffer() noexcept = default;

            /**
             * @return A zeroed buffer of size bytes; size 0 yields an empty buffer
             * @throws std::bad_alloc if allocation fails
             */
            [[nodiscard]] static OwnedBuffer allocate(size_t size);

            OwnedBuffer(OwnedBuffer&& other) noexcept;
            OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;
            OwnedBuffer(const OwnedBuffer&) = delete;
            OwnedBuffer& operator=(const OwnedBuffer&) = delete;

            [[nodiscard]] BufferView view() const noexcept { return BufferView{data_.get(), size_}; }
            [[nodiscard]] size_t size() const noexcept { return size_; }
            [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

        private:
            std::unique_ptr<std::byte[]> data_;
            size_t size_ = 0;
    };
} // namespace bkstream::core
