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

// internal/include/pipeline/StreamCopy.hpp
#pragma once

#include "pipeline/BackupReader.hpp"
#include "pipeline/RestoreWriter.hpp"
#include <cstdint>

namespace bkstream::pipeline {
    /**
     * Pumps reader into writer until the reader reports the end of the stream.
     * Neither pipeline is closed.
     *
     * @param scratch Transfer buffer, must not be empty
     * @return Bytes moved from the reader to the writer
     * @throws std::invalid_argument if scratch is empty
     */
    uint64_t copy_stream(BackupReader& reader, RestoreWriter& writer, core::BufferView scratch);
} // namespace bkstream::pipeline
