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


// internal/src/core/buffer/OwnedBuffer.cpp
#include "core/buffer/OwnedBuffer.hpp"

#include <utility>

namespace bkstream::core {
    OwnedBuffer OwnedBuffer::allocate(size_t size) {
        OwnedBuffer buffer;
        if (size == 0) { return buffer; }

        buffer.data_ = std::make_unique<std::byte[]>(size);
        buffer.size_ = size;
        return buffer;
    }

    OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
        : data_{std::move(other.data_)}, size_{std::exchange(other.size_, 0)} {}

    OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }
} // namespace bkstream::core
