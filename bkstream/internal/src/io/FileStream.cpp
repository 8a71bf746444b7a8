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

// internal/src/io/FileStream.cpp
#include "io/FileStream.hpp"
#include "core/CodecError.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bkstream::io {
    namespace {
        constexpr int INVALID_FD = -1;

        std::error_code last_error() noexcept { return {errno, std::generic_category()}; }

        IoResult closed_result() noexcept { return IoResult{0, IoStatus::ERROR, std::make_error_code(std::errc::bad_file_descriptor)}; }

        SeekResult seek_error(std::error_code ec) noexcept { return SeekResult{0, SeekStatus::ERROR, ec}; }

        // Closes fd and appends any failure to failures; fd is invalid afterwards
        void close_fd(int& fd, const std::string& path, std::vector<std::string>& failures) noexcept {
            if (fd == INVALID_FD) { return; }
            if (::close(fd) < 0) { failures.push_back("close " + path + ": " + last_error().message()); }
            fd = INVALID_FD;
        }

        void log_close_failure(const char* what, const core::CloseError& e) {
            core::log(core::LogLevel::ERROR, std::string{what} + ": " + e.what());
        }
    } // anonymous namespace

    // ============================================================================
    // FileByteSource
    // ============================================================================

    FileByteSource::FileByteSource(int fd, std::string path, uint64_t file_size) noexcept
        : fd_{fd}, path_{std::move(path)}, file_size_{file_size} {}

    std::unique_ptr<FileByteSource> FileByteSource::open(const std::filesystem::path& path) {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) { throw core::IoError("open", path.string(), last_error()); }

        struct stat st{};
        if (::fstat(fd, &st) < 0) {
            const auto ec = last_error();
            ::close(fd);
            throw core::IoError("stat", path.string(), ec);
        }
        #if defined(POSIX_FADV_SEQUENTIAL)
        ::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
        #endif

        return std::unique_ptr<FileByteSource>(new FileByteSource(fd, path.string(), static_cast<uint64_t>(st.st_size)));
    }

    FileByteSource::~FileByteSource() {
        try { close(); }
        catch (const core::CloseError& e) { log_close_failure("FileByteSource", e); }
    }

    IoResult FileByteSource::read(core::BufferView dst) {
        if (fd_ == INVALID_FD) { return closed_result(); }
        if (dst.empty()) { return IoResult{0, IoStatus::OK, {}}; }

        for (;;) {
            const ssize_t n = ::read(fd_, dst.data(), dst.size());
            if (n > 0) { return IoResult{static_cast<size_t>(n), IoStatus::OK, {}}; }
            if (n == 0) { return IoResult{0, IoStatus::END_OF_INPUT, {}}; }
            if (errno == EINTR) { continue; }
            return IoResult{0, IoStatus::ERROR, last_error()};
        }
    }

    SeekResult FileByteSource::seek(int64_t relative) {
        if (fd_ == INVALID_FD) { return seek_error(std::make_error_code(std::errc::bad_file_descriptor)); }
        if (relative < 0) { return seek_error(std::make_error_code(std::errc::invalid_argument)); }

        const off_t current = ::lseek(fd_, 0, SEEK_CUR);
        if (current < 0) { return seek_error(last_error()); }

        const auto position = static_cast<uint64_t>(current);
        const uint64_t available = position < file_size_ ? file_size_ - position : 0;
        const auto wanted = static_cast<uint64_t>(relative);
        const uint64_t moved = std::min(wanted, available);

        if (::lseek(fd_, static_cast<off_t>(moved), SEEK_CUR) < 0) { return seek_error(last_error()); }
        return SeekResult{moved, moved < wanted ? SeekStatus::END_OF_INPUT : SeekStatus::OK, {}};
    }

    void FileByteSource::close() {
        std::vector<std::string> failures;
        close_fd(fd_, path_, failures);
        if (!failures.empty()) { throw core::CloseError(std::move(failures)); }
    }

    // ============================================================================
    // FileByteSink
    // ============================================================================

    FileByteSink::FileByteSink(int fd, std::string path, bool sync_on_close) noexcept
        : fd_{fd}, path_{std::move(path)}, sync_on_close_{sync_on_close} {}

    std::unique_ptr<FileByteSink> FileByteSink::create(const std::filesystem::path& path, bool overwrite, bool sync_on_close) {
        const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);
        const int fd = ::open(path.c_str(), flags, 0644);
        if (fd < 0) { throw core::IoError("create", path.string(), last_error()); }

        return std::unique_ptr<FileByteSink>(new FileByteSink(fd, path.string(), sync_on_close));
    }

    FileByteSink::~FileByteSink() {
        try { close(); }
        catch (const core::CloseError& e) { log_close_failure("FileByteSink", e); }
    }

    IoResult FileByteSink::write(core::BufferView src) {
        if (fd_ == INVALID_FD) { return closed_result(); }

        size_t done = 0;
        while (done < src.size()) {
            const ssize_t n = ::write(fd_, src.data() + done, src.size() - done);
            if (n > 0) {
                done += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) { continue; }
            if (n < 0) { return IoResult{done, IoStatus::ERROR, last_error()}; }
            // zero-byte write: hand the short count back to the caller's retry loop
            break;
        }
        return IoResult{done, IoStatus::OK, {}};
    }

    SeekResult FileByteSink::seek(int64_t relative) {
        if (fd_ == INVALID_FD) { return seek_error(std::make_error_code(std::errc::bad_file_descriptor)); }
        if (relative < 0) { return seek_error(std::make_error_code(std::errc::invalid_argument)); }

        const off_t end = ::lseek(fd_, static_cast<off_t>(relative), SEEK_CUR);
        if (end < 0) { return seek_error(last_error()); }

        // A hole at the tail only exists once the file length covers it
        if (::ftruncate(fd_, end) < 0) { return seek_error(last_error()); }
        return SeekResult{static_cast<uint64_t>(relative), SeekStatus::OK, {}};
    }

    void FileByteSink::close() {
        if (fd_ == INVALID_FD) { return; }

        std::vector<std::string> failures;
        if (sync_on_close_) {
            #if defined(__APPLE__)
            if (::fcntl(fd_, F_FULLFSYNC) < 0) { failures.push_back("sync " + path_ + ": " + last_error().message()); }
            #else
            if (::fdatasync(fd_) < 0) { failures.push_back("sync " + path_ + ": " + last_error().message()); }
            #endif
        }
        close_fd(fd_, path_, failures);
        if (!failures.empty()) { throw core::CloseError(std::move(failures)); }
    }
} // namespace bkstream::io
