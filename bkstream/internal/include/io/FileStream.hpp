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

// internal/include/io/FileStream.hpp
#pragma once

#include "io/ByteStream.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace bkstream::io {
    /**
     * FileByteSource - Sequential, read-only file source.
     *
     * The file descriptor is released by close() or, failing that, by the
     * destructor. Seeks are relative and clamped to the file size.
     */
    class FileByteSource final : public ByteSource {
        public:
            /**
             * @throws core::IoError ("open", path) if the file cannot be opened
             */
            [[nodiscard]] static std::unique_ptr<FileByteSource> open(const std::filesystem::path& path);

            ~FileByteSource() override;

            FileByteSource(const FileByteSource&) = delete;
            FileByteSource& operator=(const FileByteSource&) = delete;

            [[nodiscard]] IoResult read(core::BufferView dst) override;
            [[nodiscard]] SeekResult seek(int64_t relative) override;

            /**
             * @throws core::CloseError if close(2) fails
             */
            void close() override;

            [[nodiscard]] const std::string& path() const noexcept override { return path_; }
            [[nodiscard]] uint64_t file_size() const noexcept { return file_size_; }

        private:
            FileByteSource(int fd, std::string path, uint64_t file_size) noexcept;

            int fd_;
            std::string path_;
            uint64_t file_size_;
    };

    /**
     * FileByteSink - Sequential, write-only file sink.
     *
     * create() refuses to replace an existing file unless overwrite is set.
     * With sync_on_close, close() runs fdatasync() before close(); both
     * failures are reported together.
     */
    class FileByteSink final : public ByteSink {
        public:
            /**
             * @throws core::IoError ("create", path) if the file cannot be created
             */
            [[nodiscard]] static std::unique_ptr<FileByteSink> create(const std::filesystem::path& path, bool overwrite, bool sync_on_close);

            ~FileByteSink() override;

            FileByteSink(const FileByteSink&) = delete;
            FileByteSink& operator=(const FileByteSink&) = delete;

            [[nodiscard]] IoResult write(core::BufferView src) override;

            /**
             * Forward seek; the skipped range reads back as zeros.
             */
            [[nodiscard]] SeekResult seek(int64_t relative) override;

            /**
             * @throws core::CloseError if fdatasync(2) or close(2) fails
             */
            void close() override;

            [[nodiscard]] const std::string& path() const noexcept override { return path_; }

        private:
            FileByteSink(int fd, std::string path, bool sync_on_close) noexcept;

            int fd_;
            std::string path_;
            bool sync_on_close_;
    };
} // namespace bkstream::io
