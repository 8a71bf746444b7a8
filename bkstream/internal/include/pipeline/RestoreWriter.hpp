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

// internal/include/pipeline/RestoreWriter.hpp
#pragma once

#include "pipeline/Transform.hpp"
#include "config/CodecOptions.hpp"
#include "io/ByteStream.hpp"
#include <cstdint>
#include <memory>

namespace bkstream::pipeline {
    /**
     * RestoreWriter - Reverse pipeline: flat writes -> framed records on a sink.
     *
     * Header bytes are assembled across write() calls until the header can
     * be decoded; a partial header is simply buffered. Payload slices are
     * bounded by the record size, pass through the transform hook and are
     * written with a retry loop.
     *
     * Retry loop:
     * - the write-error hook is consulted after every sink write attempt;
     *   ABORT ends the loop (IoError if the sink failed, WRITE_ABORTED otherwise)
     * - more than CodecOptions::max_write_stalls consecutive zero-byte
     *   writes end it with WRITE_STALLED
     *
     * bytes_left() and header().active only move once a chunk has been
     * written. After a failed write the caller resends the payload that
     * was not accepted; a header still active goes out again with it.
     *
     * Thread-safety: NOT thread-safe.
     */
    class RestoreWriter {
        public:
            explicit RestoreWriter(std::unique_ptr<io::ByteSink> sink, const config::CodecOptions& options = {}, TransformHook hook = passthrough());

            /**
             * Closes the sink if close() was never called and logs a warning.
             */
            ~RestoreWriter();

            RestoreWriter(const RestoreWriter&) = delete;
            RestoreWriter& operator=(const RestoreWriter&) = delete;
            RestoreWriter(RestoreWriter&&) = delete;
            RestoreWriter& operator=(RestoreWriter&&) = delete;

            /**
             * Consumes src, which may end anywhere inside a header or payload.
             *
             * @return src.size()
             * @throws core::CodecError malformed header, WRITE_ABORTED, WRITE_STALLED, CLOSED
             * @throws core::IoError on a sink failure the write-error hook aborts on
             */
            size_t write(core::BufferView src);

            /**
             * Skips payload bytes of the current record on the sink.
             * Same outcomes as BackupReader::seek().
             */
            [[nodiscard]] io::SeekResult seek(int64_t offset);

            /**
             * Releases the sink. Idempotent.
             *
             * A buffered partial header or an unfinished payload is reported
             * alongside the sink's own close failures.
             *
             * @throws core::CloseError with every failure met
             */
            void close();

            void set_transform(TransformHook hook);
            void set_write_error_hook(WriteErrorHook hook);

            [[nodiscard]] PipelineState state() const noexcept;
            [[nodiscard]] const format::RecordHeader& header() const noexcept;
            [[nodiscard]] int64_t bytes_left() const noexcept;

            /**
             * Bytes accepted by the sink so far.
             */
            [[nodiscard]] uint64_t bytes_written() const noexcept;

            [[nodiscard]] bool closed() const noexcept;

        private:
            class Impl;
            std::unique_ptr<Impl> impl_;
    };
} // namespace bkstream::pipeline
