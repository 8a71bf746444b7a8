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

// internal/include/io/MemoryStream.hpp
#pragma once

#include "io/ByteStream.hpp"
#include <string>
#include <vector>

namespace bkstream::io {
    /**
     * MemoryByteSource - ByteSource over an owned byte vector.
     *
     * Seeks move forward and clamp at the end (END_OF_INPUT when clamped).
     * It does not know record boundaries, so it never reports BOUNDARY.
     */
    class MemoryByteSource final : public ByteSource {
        public:
            explicit MemoryByteSource(std::vector<std::byte> data, std::string path = "<memory>");

            [[nodiscard]] IoResult read(core::BufferView dst) override;
            [[nodiscard]] SeekResult seek(int64_t relative) override;
            void close() override { closed_ = true; }
            [[nodiscard]] const std::string& path() const noexcept override { return path_; }

            [[nodiscard]] size_t position() const noexcept { return position_; }
            [[nodiscard]] size_t remaining() const noexcept { return data_.size() - position_; }
            [[nodiscard]] bool closed() const noexcept { return closed_; }

        private:
            std::vector<std::byte> data_;
            std::string path_;
            size_t position_ = 0;
            bool closed_ = false;
    };

    /**
     * MemoryByteSink - ByteSink appending to an owned byte vector.
     * A forward seek zero-fills the skipped range.
     */
    class MemoryByteSink final : public ByteSink {
        public:
            explicit MemoryByteSink(std::string path = "<memory>");

            [[nodiscard]] IoResult write(core::BufferView src) override;
            [[nodiscard]] SeekResult seek(int64_t relative) override;
            void close() override { closed_ = true; }
            [[nodiscard]] const std::string& path() const noexcept override { return path_; }

            [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return data_; }
            [[nodiscard]] bool closed() const noexcept { return closed_; }

        private:
            std::vector<std::byte> data_;
            std::string path_;
            bool closed_ = false;
    };
} // namespace bkstream::io
