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

// internal/src/pipeline/StreamCopy.cpp
#include "pipeline/StreamCopy.hpp"

#include <stdexcept>

namespace bkstream::pipeline {
    uint64_t copy_stream(BackupReader& reader, RestoreWriter& writer, core::BufferView scratch) {
        if (scratch.empty()) { throw std::invalid_argument("copy_stream: scratch buffer is empty"); }

        uint64_t total = 0;
        while (const size_t n = reader.read(scratch)) {
            writer.write(scratch.slice(0, n));
            total += n;
        }
        return total;
    }
} // namespace bkstream::pipeline
