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

// internal/include/pipeline/TransformContext.hpp
#pragma once

#include "format/RecordHeader.hpp"
#include "io/ByteStream.hpp"
#include <cstdint>

namespace bkstream::pipeline {
    enum class Direction : uint8_t {
        BACKUP = 0,
        ///< Forward: raw stream -> caller (BackupReader)
        RESTORE = 1,
        ///< Reverse: caller -> raw stream (RestoreWriter)
    };

    enum class PipelineState : uint8_t {
        AWAITING_HEADER = 0,
        IN_PAYLOAD = 1,
    };

    /**
     * TransformContext - Read-only view of a pipeline handed to the hooks.
     *
     * Valid only for the duration of the hook call. header().active tells
     * whether the header has not been emitted yet; a hook that keeps the
     * record re-emits it ahead of the chunk.
     */
    class TransformContext {
        public:
            TransformContext(Direction direction, const format::RecordHeader& header, int64_t bytes_left) noexcept
                : direction_{direction}, header_{&header}, bytes_left_{bytes_left} {}

            [[nodiscard]] Direction direction() const noexcept { return direction_; }
            [[nodiscard]] const format::RecordHeader& header() const noexcept { return *header_; }

            /**
             * Payload bytes of the current record not yet passed to a hook
             * (the chunk being transformed is already deducted).
             */
            [[nodiscard]] int64_t bytes_left() const noexcept { return bytes_left_; }

            /**
             * Outcome of the last source read (BACKUP) or sink write attempt
             * (RESTORE). Default (OK, 0 bytes) until the pipeline's first I/O.
             */
            [[nodiscard]] const io::IoResult& last_result() const noexcept { return last_result_; }

            void set_last_result(const io::IoResult& result) noexcept { last_result_ = result; }

        private:
            Direction direction_;
            const format::RecordHeader* header_;
            int64_t bytes_left_;
            io::IoResult last_result_{};
    };
} // namespace bkstream::pipeline
