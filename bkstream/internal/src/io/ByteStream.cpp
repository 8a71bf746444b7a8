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

// internal/src/io/ByteStream.cpp
#include "io/ByteStream.hpp"
#include "core/CodecError.hpp"

namespace bkstream::io {
    size_t read_fully(ByteSource& source, core::BufferView dst) {
        size_t done = 0;
        while (done < dst.size()) {
            const IoResult result = source.read(dst.slice(done));
            done += result.bytes;
            if (result.failed()) { throw core::IoError("read", source.path(), result.error); }
            // a zero-byte OK read is treated as the end, never spun on
            if (result.end_of_input() || result.bytes == 0) { break; }
        }
        return done;
    }
} // namespace bkstream::io
