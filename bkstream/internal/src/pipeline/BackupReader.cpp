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

// internal/src/pipeline/BackupReader.cpp
#include "pipeline/BackupReader.hpp"
#include "format/RecordCodec.hpp"
#include "core/CodecError.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace bkstream::pipeline {
    using core::CodecError;
    using core::ErrorCode;
    using format::RecordCodec;

    // ============================================================================
    // BackupReader::Impl
    // ============================================================================

    class BackupReader::Impl {
        public:
            Impl(std::unique_ptr<io::ByteSource> source, TransformHook hook) : source_{std::move(source)}, hook_{std::move(hook)} {
                if (!source_) { throw std::invalid_argument("BackupReader: source is null"); }
                if (!hook_) { throw std::invalid_argument("BackupReader: transform hook is empty"); }
            }

            ~Impl() {
                if (closed_) { return; }
                core::log(core::LogLevel::WARN, "BackupReader for " + source_->path() + " was not closed");
                try { close(); }
                catch (const core::CloseError& e) { core::log(core::LogLevel::ERROR, std::string{"BackupReader: "} + e.what()); }
            }

            size_t read(core::BufferView dst) {
                ensure_open();
                if (dst.empty()) { return 0; }

                for (;;) {
                    if (has_leftover()) { return drain_leftover(dst); }
                    if (pending_error_) {
                        const std::error_code error = *pending_error_;
                        pending_error_.reset();
                        throw core::IoError("read", source_->path(), error);
                    }

                    switch (state_) {
                        case PipelineState::AWAITING_HEADER:
                            if (!RecordCodec::read_header(*source_, header_)) { return 0; }
                            bytes_left_ = header_.size;
                            state_ = PipelineState::IN_PAYLOAD;
                            break;

                        case PipelineState::IN_PAYLOAD: {
                            if (bytes_left_ == 0) {
                                state_ = PipelineState::AWAITING_HEADER;
                                // empty record: its header still goes through the hook once
                                if (header_.active) {
                                    const size_t n = deliver(transform({}), dst);
                                    header_.active = false;
                                    if (n > 0) { return n; }
                                }
                                break;
                            }

                            const size_t n = handle_read(dst);
                            header_.active = false;
                            // a hook may drop a chunk entirely; keep going until bytes flow or the stream ends
                            if (n > 0) { return n; }
                            break;
                        }
                    }
                }
            }

            io::SeekResult seek(int64_t offset) {
                ensure_open();
                if (offset < 0) { throw CodecError(ErrorCode::UNSUPPORTED_SEEK, "backward seek by " + std::to_string(offset) + " bytes"); }
                if (state_ == PipelineState::AWAITING_HEADER) {
                    throw CodecError(ErrorCode::SKIP_HEADER, "cannot seek while a stream header is pending");
                }

                const int64_t wanted = std::min(offset, bytes_left_);
                const io::SeekResult result = wanted > 0 ? source_->seek(wanted) : io::SeekResult{};

                switch (result.status) {
                    case io::SeekStatus::OK: {
                        const auto moved = static_cast<int64_t>(std::min<uint64_t>(result.moved, static_cast<uint64_t>(bytes_left_)));
                        bytes_left_ -= moved;
                        if (bytes_left_ > 0) { return io::SeekResult{static_cast<uint64_t>(moved), io::SeekStatus::OK, {}}; }
                        state_ = PipelineState::AWAITING_HEADER;
                        return io::SeekResult{static_cast<uint64_t>(moved), io::SeekStatus::BOUNDARY, {}};
                    }

                    case io::SeekStatus::BOUNDARY: {
                        const auto skipped = static_cast<uint64_t>(bytes_left_);
                        bytes_left_ = 0;
                        state_ = PipelineState::AWAITING_HEADER;
                        return io::SeekResult{skipped, io::SeekStatus::BOUNDARY, {}};
                    }

                    case io::SeekStatus::CANNOT_SEEK:
                        throw CodecError(ErrorCode::SKIP_HEADER, source_->path() + " cannot seek at this position");

                    case io::SeekStatus::END_OF_INPUT:
                        bytes_left_ -= static_cast<int64_t>(std::min<uint64_t>(result.moved, static_cast<uint64_t>(bytes_left_)));
                        throw CodecError(ErrorCode::TRUNCATED, "input ended inside the payload of a " + std::string{format::stream_type_name(header_.id)} + " stream");

                    case io::SeekStatus::ERROR:
                        break;
                }
                throw core::IoError("seek", source_->path(), result.error);
            }

            void close() {
                if (closed_) { return; }
                closed_ = true;
                leftover_.clear();
                leftover_pos_ = 0;
                pending_error_.reset();

                std::vector<std::string> failures;
                try { source_->close(); }
                catch (const core::CloseError& e) { failures.insert(failures.end(), e.failures().begin(), e.failures().end()); }
                catch (const std::exception& e) { failures.emplace_back(e.what()); }

                if (!failures.empty()) { throw core::CloseError(std::move(failures)); }
            }

            void set_transform(TransformHook hook) {
                if (!hook) { throw std::invalid_argument("BackupReader: transform hook is empty"); }
                hook_ = std::move(hook);
            }

            [[nodiscard]] PipelineState state() const noexcept { return state_; }
            [[nodiscard]] const format::RecordHeader& header() const noexcept { return header_; }
            [[nodiscard]] int64_t bytes_left() const noexcept { return bytes_left_; }
            [[nodiscard]] size_t pending() const noexcept { return leftover_.size() - leftover_pos_; }
            [[nodiscard]] bool closed() const noexcept { return closed_; }

        private:
            void ensure_open() const {
                if (closed_) { throw CodecError(ErrorCode::CLOSED, "BackupReader for " + source_->path() + " is closed"); }
            }

            [[nodiscard]] bool has_leftover() const noexcept { return leftover_pos_ < leftover_.size(); }

            size_t drain_leftover(core::BufferView dst) {
                const size_t n = std::min(dst.size(), leftover_.size() - leftover_pos_);
                std::memcpy(dst.data(), leftover_.data() + leftover_pos_, n);
                leftover_pos_ += n;
                if (leftover_pos_ == leftover_.size()) {
                    leftover_.clear();
                    leftover_pos_ = 0;
                }
                return n;
            }

            // Copies as much of out as fits and keeps the rest for the next read
            size_t deliver(std::vector<std::byte> out, core::BufferView dst) {
                const size_t n = std::min(dst.size(), out.size());
                if (n > 0) { std::memcpy(dst.data(), out.data(), n); }
                if (n < out.size()) {
                    leftover_ = std::move(out);
                    leftover_pos_ = n;
                }
                return n;
            }

            std::vector<std::byte> transform(core::BufferView chunk) {
                TransformContext ctx{Direction::BACKUP, header_, bytes_left_};
                ctx.set_last_result(last_result_);
                return hook_(ctx, chunk);
            }

            size_t handle_read(core::BufferView dst) {
                const auto capacity = static_cast<int64_t>(dst.size());
                int64_t read_size = std::min(capacity, bytes_left_);
                if (header_.active && bytes_left_ > capacity) {
                    // leave room for the header the hook emits ahead of the payload
                    read_size -= static_cast<int64_t>(header_.encoded_size);
                }

                // header alone fills dst: the hook still gets it with a chunk, the rest waits in leftover_
                if (read_size <= 0) { read_size = std::min(capacity, bytes_left_); }

                scratch_.resize(static_cast<size_t>(read_size));
                last_result_ = source_->read(core::BufferView::of(scratch_));

                if (last_result_.bytes == 0) {
                    if (last_result_.failed()) { throw core::IoError("read", source_->path(), last_result_.error); }
                    throw CodecError(ErrorCode::TRUNCATED,
                                     "input ended with " + std::to_string(bytes_left_) + " payload bytes left in a " + std::string{format::stream_type_name(header_.id)} + " stream");
                }

                // bytes that came with a failure are delivered; the failure is raised by the next read
                if (last_result_.failed()) { pending_error_ = last_result_.error; }

                bytes_left_ -= static_cast<int64_t>(last_result_.bytes);
                return deliver(transform(core::BufferView{scratch_.data(), last_result_.bytes}), dst);
            }

            std::unique_ptr<io::ByteSource> source_;
            TransformHook hook_;

            format::RecordHeader header_;
            PipelineState state_ = PipelineState::AWAITING_HEADER;
            int64_t bytes_left_ = 0;
            io::IoResult last_result_{};
            std::optional<std::error_code> pending_error_;

            std::vector<std::byte> scratch_;
            std::vector<std::byte> leftover_;
            size_t leftover_pos_ = 0;

            bool closed_ = false;
    };

    // ============================================================================
    // BackupReader
    // ============================================================================

    BackupReader::BackupReader(std::unique_ptr<io::ByteSource> source, TransformHook hook)
        : impl_{std::make_unique<Impl>(std::move(source), std::move(hook))} {}

    BackupReader::~BackupReader() = default;

    size_t BackupReader::read(core::BufferView dst) { return impl_->read(dst); }

    io::SeekResult BackupReader::seek(int64_t offset) { return impl_->seek(offset); }

    void BackupReader::close() { impl_->close(); }

    void BackupReader::set_transform(TransformHook hook) { impl_->set_transform(std::move(hook)); }

    PipelineState BackupReader::state() const noexcept { return impl_->state(); }

    const format::RecordHeader& BackupReader::header() const noexcept { return impl_->header(); }

    int64_t BackupReader::bytes_left() const noexcept { return impl_->bytes_left(); }

    size_t BackupReader::pending() const noexcept { return impl_->pending(); }

    bool BackupReader::closed() const noexcept { return impl_->closed(); }
} // namespace bkstream::pipeline
