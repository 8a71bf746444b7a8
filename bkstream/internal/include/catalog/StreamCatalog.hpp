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

// internal/include/catalog/StreamCatalog.hpp
#pragma once

#include "format/RecordHeader.hpp"
#include "io/ByteStream.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bkstream::catalog {
    /**
     * StreamCatalog - Index of the records of one backup stream.
     *
     * Single writer: add() is called by the thread that walks the stream.
     * Readers on other threads only ever see alternate_streams() snapshots,
     * which are immutable once published.
     */
    class StreamCatalog {
        public:
            struct Entry {
                format::StreamType id = format::StreamType::INVALID;
                uint32_t attributes = 0;
                int64_t size = 0;
                std::string name;
                uint64_t sparse_offset = 0;
                uint64_t offset = 0; ///< Stream offset of the header

                [[nodiscard]] bool operator==(const Entry&) const = default;
            };

            struct SparseExtent {
                uint64_t offset;
                int64_t length;

                [[nodiscard]] bool operator==(const SparseExtent&) const = default;
            };

            using AlternateStreams = std::map<std::string, int64_t>;

            StreamCatalog();

            StreamCatalog(const StreamCatalog&) = delete;
            StreamCatalog& operator=(const StreamCatalog&) = delete;
            StreamCatalog(StreamCatalog&& other);
            StreamCatalog& operator=(StreamCatalog&& other);

            /**
             * Builds a catalog by scanning source to its end.
             *
             * @throws core::CodecError / core::IoError from the scan
             */
            [[nodiscard]] static StreamCatalog scan(io::ByteSource& source, size_t scratch_size = 64 * 1024);

            /**
             * Records one header found at the given stream offset.
             * Alternate streams without a usable name are kept as entries but
             * not listed in alternate_streams().
             */
            void add(const format::RecordHeader& header, uint64_t offset);

            [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

            /**
             * Read-only snapshot of alternate stream name -> size. Later add()
             * calls never modify a snapshot already handed out.
             */
            [[nodiscard]] std::shared_ptr<const AlternateStreams> alternate_streams() const;

            /**
             * Sparse blocks ordered by offset.
             */
            [[nodiscard]] std::vector<SparseExtent> sparse_extents() const;

            [[nodiscard]] int64_t payload_bytes(format::StreamType type) const noexcept;

            /**
             * JSON export:
             *   {"records":[{"offset":0,"type":"DATA","id":1,"attributes":"NORMAL",
             *                "size":5,...}], "alternateStreams":{...},
             *    "sparseExtents":[...], "totals":{"DATA":5,...}}
             */
            [[nodiscard]] std::string to_json(int indent = -1) const;

        private:
            std::vector<Entry> entries_;

            mutable std::mutex snapshot_mutex_;
            std::shared_ptr<const AlternateStreams> alternate_streams_;
    };
} // namespace bkstream::catalog
