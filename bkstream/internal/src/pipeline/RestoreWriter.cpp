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

// internal/src/pipeline/RestoreWriter.cpp
#include "pipeline/RestoreWriter.hpp"
#include "format/RecordCodec.hpp"
#include "core/CodecError.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bkstream::pipeline {
    using core::CodecError;
    using core::ErrorCode;
    using format::RecordCodec;

    // ============================================================================
    // RestoreWriter::Impl
    // ============================================================================

    class RestoreWriter::Impl {
        public:
            Impl(std::unique_ptr<io::ByteSink> sink, const config::CodecOptions& options, TransformHook hook)
                : sink_{std::move(sink)}, hook_{std::move(hook)}, write_error_hook_{default_write_error_hook}, max_write_stalls_{options.max_write_stalls} {
                if (!sink_) { throw std::invalid_argument("RestoreWriter: sink is null"); }
                if (!hook_) { throw std::invalid_argument("RestoreWriter: transform hook is empty"); }
            }

            ~Impl() {
                if (closed_) { return; }
                core::log(core::LogLevel::WARN, "RestoreWriter for " + sink_->path() + " was not closed");
                try { close(); }
                catch (const core::CloseError& e) { core::log(core::LogLevel::ERROR, std::string{"RestoreWriter: "} + e.what()); }
            }

            size_t write(core::BufferView src) {
                ensure_open();

                size_t pos = 0;
                while (pos < src.size()) {
                    switch (state_) {
                        case PipelineState::AWAITING_HEADER: {
                            const size_t want = header_bytes_wanted();
                            if (assembly_.size() < want) {
                                const size_t take = std::min(want - assembly_.size(), src.size() - pos);
                                const auto part = src.slice(pos, take).as_const_span();
                                assembly_.insert(assembly_.end(), part.begin(), part.end());
                                pos += take;
                                // the size is only known once the base header is complete
                                break;
                            }
                            begin_record();
                            break;
                        }

                        case PipelineState::IN_PAYLOAD: {
                            if (bytes_left_ == 0) {
                                // zero-size record whose header failed to go out
                                if (header_.active) { emit({}, 0); }
                                state_ = PipelineState::AWAITING_HEADER;
                                break;
                            }
                            const auto n = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(src.size() - pos), bytes_left_));
                            emit(src.slice(pos, n), bytes_left_ - static_cast<int64_t>(n));
                            bytes_left_ -= static_cast<int64_t>(n);
                            pos += n;
                            if (bytes_left_ == 0) { state_ = PipelineState::AWAITING_HEADER; }
                            break;
                        }
                    }
                }

                // the last bytes may complete a header
                if (state_ == PipelineState::AWAITING_HEADER && !assembly_.empty() && assembly_.size() == header_bytes_wanted()) { begin_record(); }

                return src.size();
            }

            io::SeekResult seek(int64_t offset) {
                ensure_open();
                if (offset < 0) { throw CodecError(ErrorCode::UNSUPPORTED_SEEK, "backward seek by " + std::to_string(offset) + " bytes"); }
                if (state_ == PipelineState::AWAITING_HEADER) {
                    throw CodecError(ErrorCode::SKIP_HEADER, "cannot seek while a stream header is pending");
                }

                const int64_t wanted = std::min(offset, bytes_left_);
                const io::SeekResult result = wanted > 0 ? sink_->seek(wanted) : io::SeekResult{};

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
                        throw CodecError(ErrorCode::SKIP_HEADER, sink_->path() + " cannot seek at this position");

                    case io::SeekStatus::END_OF_INPUT:
                        throw CodecError(ErrorCode::TRUNCATED, sink_->path() + " ended while seeking");

                    case io::SeekStatus::ERROR:
                        break;
                }
                throw core::IoError("seek", sink_->path(), result.error);
            }

            void close() {
                if (closed_) { return; }
                closed_ = true;

                std::vector<std::string> failures;
                if (state_ == PipelineState::AWAITING_HEADER && !assembly_.empty()) {
                    failures.push_back("incomplete stream header (" + std::to_string(assembly_.size()) + " bytes buffered)");
                }
                if (state_ == PipelineState::IN_PAYLOAD && bytes_left_ > 0) {
                    failures.push_back(std::string{format::stream_type_name(header_.id)} + " stream is missing " + std::to_string(bytes_left_) + " payload bytes");
                } else if (state_ == PipelineState::IN_PAYLOAD && header_.active) {
                    failures.push_back(std::string{format::stream_type_name(header_.id)} + " stream header was never written");
                }
                assembly_.clear();

                try { sink_->close(); }
                catch (const core::CloseError& e) { failures.insert(failures.end(), e.failures().begin(), e.failures().end()); }
                catch (const std::exception& e) { failures.emplace_back(e.what()); }

                if (!failures.empty()) { throw core::CloseError(std::move(failures)); }
            }

            void set_transform(TransformHook hook) {
                if (!hook) { throw std::invalid_argument("RestoreWriter: transform hook is empty"); }
                hook_ = std::move(hook);
            }

            void set_write_error_hook(WriteErrorHook hook) {
                if (!hook) { throw std::invalid_argument("RestoreWriter: write-error hook is empty"); }
                write_error_hook_ = std::move(hook);
            }

            [[nodiscard]] PipelineState state() const noexcept { return state_; }
            [[nodiscard]] const format::RecordHeader& header() const noexcept { return header_; }
            [[nodiscard]] int64_t bytes_left() const noexcept { return bytes_left_; }
            [[nodiscard]] uint64_t bytes_written() const noexcept { return bytes_written_; }
            [[nodiscard]] bool closed() const noexcept { return closed_; }

        private:
            void ensure_open() const {
                if (closed_) { throw CodecError(ErrorCode::CLOSED, "RestoreWriter for " + sink_->path() + " is closed"); }
            }

            // Header bytes needed before the assembly buffer can be decoded
            [[nodiscard]] size_t header_bytes_wanted() {
                if (assembly_.size() < RecordCodec::BASE_SIZE) { return RecordCodec::BASE_SIZE; }
                return *RecordCodec::required_size(core::BufferView::of(assembly_));
            }

            void begin_record() {
                header_ = RecordCodec::decode(core::BufferView::of(assembly_));
                assembly_.clear();
                bytes_left_ = header_.size;
                state_ = PipelineState::IN_PAYLOAD;

                if (bytes_left_ == 0) {
                    // no payload will arrive to carry the header out
                    emit({}, 0);
                    state_ = PipelineState::AWAITING_HEADER;
                }
            }

            /**
             * Runs one chunk through the hook and writes the result. Callers
             * advance their own state only after this returns, so a write that
             * throws leaves the chunk (and an active header) to be retried.
             */
            void emit(core::BufferView chunk, int64_t remaining) {
                TransformContext ctx{Direction::RESTORE, header_, remaining};
                ctx.set_last_result(last_result_);
                std::vector<std::byte> out = hook_(ctx, chunk);
                write_all(ctx, core::BufferView::of(out));
                header_.active = false;
            }

            void write_all(TransformContext& ctx, core::BufferView out) {
                size_t done = 0;
                uint32_t stalls = 0;

                while (done < out.size()) {
                    last_result_ = sink_->write(out.slice(done));
                    ctx.set_last_result(last_result_);
                    done += last_result_.bytes;
                    bytes_written_ += last_result_.bytes;

                    if (write_error_hook_(ctx, last_result_) == WriteAction::ABORT) {
                        if (last_result_.failed()) { throw core::IoError("write", sink_->path(), last_result_.error); }
                        throw CodecError(ErrorCode::WRITE_ABORTED,
                                         "write to " + sink_->path() + " aborted after " + std::to_string(done) + " of " + std::to_string(out.size()) + " bytes");
                    }

                    if (last_result_.bytes > 0) {
                        stalls = 0;
                        continue;
                    }
                    if (++stalls > max_write_stalls_) {
                        throw CodecError(ErrorCode::WRITE_STALLED,
                                         sink_->path() + " accepted no bytes in " + std::to_string(stalls) + " consecutive writes");
                    }
                    core::log(core::LogLevel::DEBUG, "zero-byte write to " + sink_->path() + ", retry " + std::to_string(stalls));
                }
            }

            std::unique_ptr<io::ByteSink> sink_;
            TransformHook hook_;
            WriteErrorHook write_error_hook_;
            uint32_t max_write_stalls_;

            format::RecordHeader header_;
            PipelineState state_ = PipelineState::AWAITING_HEADER;
            int64_t bytes_left_ = 0;
            io::IoResult last_result_{};
            uint64_t bytes_written_ = 0;

            std::vector<std::byte> assembly_;

            bool closed_ = false;
    };

    // ============================================================================
    // RestoreWriter
    // ============================================================================

    RestoreWriter::RestoreWriter(std::unique_ptr<io::ByteSink> sink, const config::CodecOptions& options, TransformHook hook)
        : impl_{std::make_unique<Impl>(std::move(sink), options, std::move(hook))} {}

    RestoreWriter::~RestoreWriter() = default;

    size_t RestoreWriter::write(core::BufferView src) { return impl_->write(src); }

    io::SeekResult RestoreWriter::seek(int64_t offset) { return impl_->seek(offset); }

    void RestoreWriter::close() { impl_->close(); }

    void RestoreWriter::set_transform(TransformHook hook) { impl_->set_transform(std::move(hook)); }

    void RestoreWriter::set_write_error_hook(WriteErrorHook hook) { impl_->set_write_error_hook(std::move(hook)); }

    PipelineState RestoreWriter::state() const noexcept { return impl_->state(); }

    const format::RecordHeader& RestoreWriter::header() const noexcept { return impl_->header(); }

    int64_t RestoreWriter::bytes_left() const noexcept { return impl_->bytes_left(); }

    uint64_t RestoreWriter::bytes_written() const noexcept { return impl_->bytes_written(); }

    bool RestoreWriter::closed() const noexcept { return impl_->closed(); }
} // namespace bkstream::pipeline
