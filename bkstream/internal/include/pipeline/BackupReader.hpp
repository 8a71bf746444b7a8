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

// internal/include/pipeline/BackupReader.hpp
#pragma once

#include "pipeline/Transform.hpp"
#include "io/ByteStream.hpp"
#include <cstdint>
#include <memory>

namespace bkstream::pipeline {
    /**
     * BackupReader - Forward pipeline: raw backup stream -> flat reads.
     *
     * Walks the source header by header. Every payload chunk goes through the
     * transform hook; the default hook (passthrough()) re-emits each header
     * right before its first payload bytes, so the caller sees the original
     * byte stream.
     *
     * Usage:
     *   BackupReader reader{FileByteSource::open(path)};
     *   reader.set_transform(redact_streams({StreamType::SECURITY_DATA}));
     *   while (size_t n = reader.read(buf)) { ... }
     *   reader.close();
     *
     * Output the caller's buffer cannot take is kept and handed out first on
     * the next read(), before the state machine moves. A source read that
     * fails after producing bytes has those bytes delivered; its failure is
     * thrown by the read() that follows them.
     *
     * Thread-safety: NOT thread-safe.
     */
    class BackupReader {
        public:
            explicit BackupReader(std::unique_ptr<io::ByteSource> source, TransformHook hook = passthrough());

            /**
             * Closes the source if close() was never called and logs a warning.
             */
            ~BackupReader();

            BackupReader(const BackupReader&) = delete;
            BackupReader& operator=(const BackupReader&) = delete;
            BackupReader(BackupReader&&) = delete;
            BackupReader& operator=(BackupReader&&) = delete;

            /**
             * Reads transformed stream bytes into dst.
             *
             * @return Bytes written to dst; 0 at the end of the stream (or if dst is empty)
             * @throws core::CodecError malformed header, TRUNCATED, CLOSED
             * @throws core::IoError on a source failure, including one reported
             *         together with data by an earlier read
             */
            [[nodiscard]] size_t read(core::BufferView dst);

            /**
             * Skips payload bytes of the current record.
             *
             * The request is clamped to bytes_left(). Result status:
             * - OK: still inside the record
             * - BOUNDARY: the record is exhausted; the next read decodes a header
             *
             * @throws core::CodecError SKIP_HEADER when a header is pending,
             *         UNSUPPORTED_SEEK for a negative offset, TRUNCATED, CLOSED
             * @throws core::IoError on a source failure
             */
            [[nodiscard]] io::SeekResult seek(int64_t offset);

            /**
             * Releases the source. Idempotent.
             *
             * @throws core::CloseError with every failure met
             */
            void close();

            void set_transform(TransformHook hook);

            [[nodiscard]] PipelineState state() const noexcept;
            [[nodiscard]] const format::RecordHeader& header() const noexcept;
            [[nodiscard]] int64_t bytes_left() const noexcept;
            [[nodiscard]] size_t pending() const noexcept;
            [[nodiscard]] bool closed() const noexcept;

        private:
            class Impl;
            std::unique_ptr<Impl> impl_;
    };
} // namespace bkstream::pipeline
