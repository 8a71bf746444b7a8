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

// internal/src/io/MemoryStream.cpp
#include "io/MemoryStream.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace bkstream::io {
    namespace {
        IoResult closed_result() noexcept { return IoResult{0, IoStatus::ERROR, std::make_error_code(std::errc::bad_file_descriptor)}; }
    } // anonymous namespace

    // ==================== MemoryByteSource ====================

    MemoryByteSource::MemoryByteSource(std::vector<std::byte> data, std::string path) : data_{std::move(data)}, path_{std::move(path)} {}

    IoResult MemoryByteSource::read(core::BufferView dst) {
        if (closed_) { return closed_result(); }
        if (position_ >= data_.size()) { return IoResult{0, IoStatus::END_OF_INPUT, {}}; }

        const size_t n = std::min(dst.size(), data_.size() - position_);
        if (n > 0) { std::memcpy(dst.data(), data_.data() + position_, n); }
        position_ += n;
        return IoResult{n, IoStatus::OK, {}};
    }

    SeekResult MemoryByteSource::seek(int64_t relative) {
        if (closed_) { return SeekResult{0, SeekStatus::ERROR, std::make_error_code(std::errc::bad_file_descriptor)}; }
        if (relative < 0) { return SeekResult{0, SeekStatus::ERROR, std::make_error_code(std::errc::invalid_argument)}; }

        const auto wanted = static_cast<uint64_t>(relative);
        const uint64_t moved = std::min<uint64_t>(wanted, data_.size() - position_);
        position_ += static_cast<size_t>(moved);
        return SeekResult{moved, moved < wanted ? SeekStatus::END_OF_INPUT : SeekStatus::OK, {}};
    }

    // ==================== MemoryByteSink ====================

    MemoryByteSink::MemoryByteSink(std::string path) : path_{std::move(path)} {}

    IoResult MemoryByteSink::write(core::BufferView src) {
        if (closed_) { return closed_result(); }
        const auto span = src.as_const_span();
        data_.insert(data_.end(), span.begin(), span.end());
        return IoResult{src.size(), IoStatus::OK, {}};
    }

    SeekResult MemoryByteSink::seek(int64_t relative) {
        if (closed_) { return SeekResult{0, SeekStatus::ERROR, std::make_error_code(std::errc::bad_file_descriptor)}; }
        if (relative < 0) { return SeekResult{0, SeekStatus::ERROR, std::make_error_code(std::errc::invalid_argument)}; }

        data_.resize(data_.size() + static_cast<size_t>(relative), std::byte{0});
        return SeekResult{static_cast<uint64_t>(relative), SeekStatus::OK, {}};
    }
} // namespace bkstream::io
