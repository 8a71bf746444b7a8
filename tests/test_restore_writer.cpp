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

#include <gtest/gtest.h>
#include "TestStreams.hpp"
#include "pipeline/BackupReader.hpp"
#include "pipeline/RestoreWriter.hpp"
#include "pipeline/StreamCopy.hpp"

#include <algorithm>
#include <memory>

using namespace bkstream;
using namespace bkstream::test;
using format::StreamType;
using pipeline::PipelineState;
using pipeline::RestoreWriter;

namespace {
    std::vector<Record> mixed_records() {
        return {
            make_record(StreamType::SECURITY_DATA, pattern(24, 3), {}, 0, format::StreamAttribute::CONTAINS_SECURITY),
            make_record(StreamType::DATA, pattern(100, 11)),
            make_record(StreamType::EA_DATA, {}),
            make_record(StreamType::ALTERNATE_DATA, pattern(10, 17), "ads1"),
            make_record(StreamType::SPARSE_BLOCK, pattern(33, 29), {}, 1 << 20, format::StreamAttribute::SPARSE),
            make_record(StreamType::ALTERNATE_DATA, {}, "empty"),
        };
    }

    // Writer over a MemoryByteSink; the sink stays reachable through *out
    std::unique_ptr<RestoreWriter> writer_into(io::MemoryByteSink** out, const config::CodecOptions& options = {}) {
        auto sink = std::make_unique<io::MemoryByteSink>();
        *out = sink.get();
        return std::make_unique<RestoreWriter>(std::move(sink), options);
    }

    template <typename Fn>
    core::ErrorCode error_of(Fn&& fn) {
        try { fn(); }
        catch (const core::CodecError& e) { return e.code(); }
        return core::ErrorCode::NONE;
    }
} // anonymous namespace

TEST(RestoreWriterTest, ThreeByteWritesThenSevenByteReads) {
    const Bytes stream = encode_stream({
        make_record(StreamType::ALTERNATE_DATA, pattern(10, 1), "ads1"),
        make_record(StreamType::DATA, pattern(5, 2)),
    });

    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);
    write_chunked(*writer, stream, 3);
    EXPECT_EQ(writer->state(), PipelineState::AWAITING_HEADER);
    EXPECT_EQ(sink->data(), stream);
    EXPECT_EQ(writer->bytes_written(), stream.size());
    const Bytes restored = sink->data();
    writer->close();

    pipeline::BackupReader reader{std::make_unique<io::MemoryByteSource>(restored)};
    std::vector<size_t> sizes;
    EXPECT_EQ(read_all(reader, 7, &sizes), stream);
    EXPECT_EQ(sizes.size(), 12u);
    reader.close();
}

TEST(RestoreWriterTest, ChunkSizeDoesNotChangeOutput) {
    const auto records = mixed_records();
    const Bytes stream = encode_stream(records);

    for (const size_t chunk : {1u, 2u, 3u, 19u, 20u, 21u, 28u, 41u, 42u, 43u, 64u, 4096u}) {
        io::MemoryByteSink* sink = nullptr;
        auto writer = writer_into(&sink);
        write_chunked(*writer, stream, chunk);
        EXPECT_EQ(sink->data(), stream) << "chunk " << chunk;
        writer->close();
    }
}

TEST(RestoreWriterTest, ReaderAndWriterAgreeOnRecords) {
    const auto records = mixed_records();
    const Bytes stream = encode_stream(records);

    for (const size_t read_chunk : {5u, 42u, 512u}) {
        for (const size_t write_chunk : {1u, 7u, 300u}) {
            pipeline::BackupReader reader{std::make_unique<io::MemoryByteSource>(stream)};
            io::MemoryByteSink* sink = nullptr;
            auto writer = writer_into(&sink);

            write_chunked(*writer, read_all(reader, read_chunk), write_chunk);
            reader.close();
            writer->close();

            // walk the result record by record
            io::MemoryByteSource out{sink->data()};
            for (const auto& r : records) {
                format::RecordHeader h;
                ASSERT_TRUE(format::RecordCodec::read_header(out, h));
                EXPECT_TRUE(h.same_record(r.header));
                Bytes payload(static_cast<size_t>(h.size));
                EXPECT_EQ(io::read_fully(out, core::BufferView::of(payload)), payload.size());
                EXPECT_EQ(payload, r.payload);
            }
            EXPECT_EQ(out.remaining(), 0u);
        }
    }
}

TEST(RestoreWriterTest, PartialHeaderIsBuffered) {
    const Bytes stream = encode_stream({make_record(StreamType::ALTERNATE_DATA, pattern(4, 1), "stream-name")});

    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);

    Bytes head(stream.begin(), stream.begin() + 25);
    EXPECT_EQ(writer->write(core::BufferView::of(head)), 25u);
    EXPECT_EQ(writer->state(), PipelineState::AWAITING_HEADER);
    EXPECT_TRUE(sink->data().empty());

    Bytes tail(stream.begin() + 25, stream.end());
    EXPECT_EQ(writer->write(core::BufferView::of(tail)), tail.size());
    EXPECT_EQ(sink->data(), stream);
    EXPECT_EQ(writer->header().name, "stream-name");
    writer->close();
}

TEST(RestoreWriterTest, EmptyRecordIsEmittedImmediately) {
    const Bytes stream = encode_stream({make_record(StreamType::LINK, {})});

    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);
    write_chunked(*writer, stream, 6);

    EXPECT_EQ(sink->data(), stream);
    EXPECT_EQ(writer->state(), PipelineState::AWAITING_HEADER);
    EXPECT_NO_THROW(writer->close());
}

TEST(RestoreWriterTest, HookRunsInRestoreDirection) {
    auto records = mixed_records();
    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);

    std::vector<pipeline::Direction> directions;
    writer->set_transform([&directions, inner = pipeline::redact_streams({StreamType::DATA})](const pipeline::TransformContext& ctx, core::BufferView chunk) {
        directions.push_back(ctx.direction());
        return inner(ctx, chunk);
    });
    write_chunked(*writer, encode_stream(records), 50);
    writer->close();

    records[1].payload.assign(records[1].payload.size(), std::byte{0});
    EXPECT_EQ(sink->data(), encode_stream(records));
    ASSERT_FALSE(directions.empty());
    for (const auto d : directions) { EXPECT_EQ(d, pipeline::Direction::RESTORE); }
}

TEST(RestoreWriterTest, ShortWritesAreRetried) {
    const Bytes stream = encode_stream(mixed_records());

    auto sink = std::make_unique<ScriptedSink>(3, 2);
    auto* raw = sink.get();
    RestoreWriter writer{std::move(sink)};
    write_chunked(writer, stream, 64);

    EXPECT_EQ(raw->data(), stream);
    EXPECT_GT(raw->attempts(), stream.size() / 3);
    writer.close();
}

TEST(RestoreWriterTest, StalledSinkIsBounded) {
    config::CodecOptions options;
    options.max_write_stalls = 4;

    auto sink = std::make_unique<ScriptedSink>();
    sink->stall_forever();
    auto* raw = sink.get();
    RestoreWriter writer{std::move(sink), options};

    Bytes stream = encode_stream({make_record(StreamType::DATA, pattern(8, 1))});
    EXPECT_EQ(error_of([&] { writer.write(core::BufferView::of(stream)); }), core::ErrorCode::WRITE_STALLED);
    EXPECT_EQ(raw->attempts(), 5u);
    // nothing reached the sink, so the whole payload is still owed
    EXPECT_EQ(writer.bytes_left(), 8);
    EXPECT_THROW(writer.close(), core::CloseError);
}

TEST(RestoreWriterTest, SinkFailureAbortsByDefault) {
    auto sink = std::make_unique<ScriptedSink>();
    sink->fail_with(std::errc::no_space_on_device);
    RestoreWriter writer{std::move(sink)};

    Bytes stream = encode_stream({make_record(StreamType::DATA, pattern(8, 1))});
    try {
        writer.write(core::BufferView::of(stream));
        FAIL() << "sink failure swallowed";
    }
    catch (const core::IoError& e) {
        EXPECT_EQ(e.op(), "write");
        EXPECT_EQ(e.path(), "scripted-sink");
        EXPECT_EQ(e.error(), std::errc::no_space_on_device);
    }
    EXPECT_THROW(writer.close(), core::CloseError);
}

TEST(RestoreWriterTest, AbortedPayloadCanBeResent) {
    const Bytes payload = pattern(40, 8);
    Bytes stream = encode_stream({make_record(StreamType::DATA, payload), make_record(StreamType::EA_DATA, pattern(3, 2))});
    Bytes header(stream.begin(), stream.begin() + 20);
    Bytes rest(stream.begin() + 20, stream.end());

    auto sink = std::make_unique<ScriptedSink>();
    auto* raw = sink.get();
    RestoreWriter writer{std::move(sink)};

    writer.write(core::BufferView::of(header));
    ASSERT_EQ(writer.state(), PipelineState::IN_PAYLOAD);

    raw->fail_with(std::errc::io_error);
    EXPECT_THROW(writer.write(core::BufferView::of(rest)), core::IoError);
    EXPECT_EQ(writer.bytes_left(), 40);
    EXPECT_TRUE(writer.header().active);
    EXPECT_TRUE(raw->data().empty());

    raw->recover();
    EXPECT_EQ(writer.write(core::BufferView::of(rest)), rest.size());
    EXPECT_EQ(raw->data(), stream);
    EXPECT_EQ(writer.state(), PipelineState::AWAITING_HEADER);
    writer.close();
}

TEST(RestoreWriterTest, AbortedEmptyRecordIsResent) {
    Bytes stream = encode_stream({make_record(StreamType::EA_DATA, {}), make_record(StreamType::DATA, pattern(6, 3))});
    Bytes header(stream.begin(), stream.begin() + 20);
    Bytes rest(stream.begin() + 20, stream.end());

    auto sink = std::make_unique<ScriptedSink>();
    auto* raw = sink.get();
    RestoreWriter writer{std::move(sink)};

    raw->fail_with(std::errc::io_error);
    EXPECT_THROW(writer.write(core::BufferView::of(header)), core::IoError);
    EXPECT_TRUE(writer.header().active);
    EXPECT_EQ(writer.state(), PipelineState::IN_PAYLOAD);

    raw->recover();
    writer.write(core::BufferView::of(rest));
    EXPECT_EQ(raw->data(), stream);
    writer.close();
}

TEST(RestoreWriterTest, CloseReportsUnwrittenEmptyRecord) {
    Bytes stream = encode_stream({make_record(StreamType::EA_DATA, {})});

    auto sink = std::make_unique<ScriptedSink>();
    sink->fail_with(std::errc::io_error);
    RestoreWriter writer{std::move(sink)};
    EXPECT_THROW(writer.write(core::BufferView::of(stream)), core::IoError);

    try {
        writer.close();
        FAIL() << "unwritten header not reported";
    }
    catch (const core::CloseError& e) {
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_NE(e.failures()[0].find("never written"), std::string::npos);
    }
}

TEST(RestoreWriterTest, WriteErrorHookDecides) {
    Bytes stream = encode_stream({make_record(StreamType::DATA, pattern(8, 1))});

    {
        // ABORT on the first short write
        auto sink = std::make_unique<ScriptedSink>(SIZE_MAX, 1);
        RestoreWriter writer{std::move(sink)};
        int calls = 0;
        writer.set_write_error_hook([&calls](const pipeline::TransformContext& ctx, const io::IoResult& result) {
            ++calls;
            EXPECT_EQ(ctx.last_result().bytes, result.bytes);
            return result.bytes == 0 ? pipeline::WriteAction::ABORT : pipeline::WriteAction::CONTINUE;
        });

        // header and payload are emitted together; the sink takes them whole
        EXPECT_EQ(writer.write(core::BufferView::of(stream)), stream.size());
        EXPECT_EQ(calls, 1);

        Bytes next = encode_stream({make_record(StreamType::EA_DATA, pattern(2, 1))});
        EXPECT_EQ(error_of([&] { writer.write(core::BufferView::of(next)); }), core::ErrorCode::WRITE_ABORTED);
        EXPECT_THROW(writer.close(), core::CloseError);
    }
    {
        // CONTINUE on errors still ends at the stall bound
        config::CodecOptions options;
        options.max_write_stalls = 2;
        auto sink = std::make_unique<ScriptedSink>();
        sink->fail_with(std::errc::io_error);
        RestoreWriter writer{std::move(sink), options};
        writer.set_write_error_hook([](const pipeline::TransformContext&, const io::IoResult&) { return pipeline::WriteAction::CONTINUE; });

        EXPECT_EQ(error_of([&] { writer.write(core::BufferView::of(stream)); }), core::ErrorCode::WRITE_STALLED);
        EXPECT_THROW(writer.close(), core::CloseError);
    }
}

TEST(RestoreWriterTest, MalformedHeaderIsFatal) {
    Bytes stream = encode_stream({make_record(StreamType::ALTERNATE_DATA, pattern(2, 1), "x")});
    core::BufferView::of(stream).write_u32_le(16, 3);

    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);
    EXPECT_EQ(error_of([&] { write_chunked(*writer, stream, 4); }), core::ErrorCode::ODD_NAME_LENGTH);
    EXPECT_TRUE(sink->data().empty());
    EXPECT_THROW(writer->close(), core::CloseError);
}

TEST(RestoreWriterTest, SeekSkipsPayloadOnSink) {
    const Bytes payload = pattern(10, 4);
    const Bytes stream = encode_stream({make_record(StreamType::DATA, payload)});

    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);

    EXPECT_EQ(error_of([&] { (void)writer->seek(1); }), core::ErrorCode::SKIP_HEADER);

    Bytes first(stream.begin(), stream.begin() + 24);
    writer->write(core::BufferView::of(first));
    ASSERT_EQ(writer->bytes_left(), 6);

    const io::SeekResult r = writer->seek(3);
    EXPECT_EQ(r.status, io::SeekStatus::OK);
    EXPECT_EQ(writer->bytes_left(), 3);

    Bytes rest(stream.end() - 3, stream.end());
    writer->write(core::BufferView::of(rest));
    EXPECT_EQ(writer->state(), PipelineState::AWAITING_HEADER);

    Bytes expected = stream;
    std::fill(expected.begin() + 24, expected.begin() + 27, std::byte{0});
    EXPECT_EQ(sink->data(), expected);
    writer->close();
}

TEST(RestoreWriterTest, CloseReportsEveryFailure) {
    Bytes stream = encode_stream({make_record(StreamType::DATA, pattern(10, 4))});
    stream.resize(25);

    auto sink = std::make_unique<ScriptedSink>();
    sink->fail_on_close();
    auto* raw = sink.get();
    RestoreWriter writer{std::move(sink)};
    writer.write(core::BufferView::of(stream));

    try {
        writer.close();
        FAIL() << "close failures swallowed";
    }
    catch (const core::CloseError& e) {
        ASSERT_EQ(e.failures().size(), 2u);
        EXPECT_NE(e.failures()[0].find("missing 5 payload bytes"), std::string::npos);
        EXPECT_NE(e.failures()[1].find("device gone"), std::string::npos);
        EXPECT_EQ(e.code(), core::ErrorCode::CLOSE_FAILED);
    }
    EXPECT_TRUE(raw->closed());
    EXPECT_NO_THROW(writer.close());
    EXPECT_EQ(error_of([&] { writer.write(core::BufferView::of(stream)); }), core::ErrorCode::CLOSED);
}

TEST(RestoreWriterTest, CloseReportsPartialHeader) {
    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);
    Bytes head(7);
    writer->write(core::BufferView::of(head));

    try {
        writer->close();
        FAIL() << "partial header not reported";
    }
    catch (const core::CloseError& e) {
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_NE(e.failures()[0].find("7 bytes buffered"), std::string::npos);
    }
}

TEST(StreamCopyTest, CopiesThroughBothPipelines) {
    const auto records = mixed_records();
    pipeline::BackupReader reader{std::make_unique<io::MemoryByteSource>(encode_stream(records)), pipeline::drop_streams({StreamType::SPARSE_BLOCK})};
    io::MemoryByteSink* sink = nullptr;
    auto writer = writer_into(&sink);

    Bytes scratch(4096);
    const uint64_t copied = pipeline::copy_stream(reader, *writer, core::BufferView::of(scratch));

    std::vector<Record> kept;
    for (const auto& r : records) {
        if (r.header.id != StreamType::SPARSE_BLOCK) { kept.push_back(r); }
    }
    const Bytes expected = encode_stream(kept);
    EXPECT_EQ(copied, expected.size());
    EXPECT_EQ(sink->data(), expected);

    reader.close();
    writer->close();

    Bytes none;
    EXPECT_THROW((void)pipeline::copy_stream(reader, *writer, core::BufferView::of(none)), std::invalid_argument);
}
