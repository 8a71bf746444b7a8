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
#include "io/FileStream.hpp"
#include "io/MemoryStream.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

using namespace bkstream;
using namespace bkstream::test;

// ==================== MemoryByteSource / MemoryByteSink ====================

TEST(MemoryStreamTest, SourceReadsAndClampsSeeks) {
    io::MemoryByteSource source{pattern(10, 1)};
    Bytes buf(4);

    auto r = source.read(core::BufferView::of(buf));
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.bytes, 4u);

    auto s = source.seek(3);
    EXPECT_EQ(s.status, io::SeekStatus::OK);
    EXPECT_EQ(source.position(), 7u);

    s = source.seek(10);
    EXPECT_EQ(s.status, io::SeekStatus::END_OF_INPUT);
    EXPECT_EQ(s.moved, 3u);

    r = source.read(core::BufferView::of(buf));
    EXPECT_TRUE(r.end_of_input());

    EXPECT_EQ(source.seek(-1).status, io::SeekStatus::ERROR);

    source.close();
    EXPECT_TRUE(source.read(core::BufferView::of(buf)).failed());
}

TEST(MemoryStreamTest, SinkZeroFillsSeek) {
    io::MemoryByteSink sink{"sink"};
    Bytes head = bytes_of("ab");
    Bytes tail = bytes_of("z");

    EXPECT_EQ(sink.write(core::BufferView::of(head)).bytes, 2u);
    EXPECT_EQ(sink.seek(3).moved, 3u);
    EXPECT_EQ(sink.write(core::BufferView::of(tail)).bytes, 1u);

    EXPECT_EQ(sink.data(), concat({head, Bytes(3), tail}));
    EXPECT_EQ(sink.path(), "sink");

    sink.close();
    EXPECT_TRUE(sink.write(core::BufferView::of(tail)).failed());
}

TEST(MemoryStreamTest, ReadFullyCollectsShortReads) {
    const Bytes data = pattern(20, 5);
    ScriptedSource source{data};
    source.limit_reads_to(3);

    Bytes buf(16);
    EXPECT_EQ(io::read_fully(source, core::BufferView::of(buf)), 16u);
    EXPECT_EQ(buf, Bytes(data.begin(), data.begin() + 16));
    EXPECT_EQ(io::read_fully(source, core::BufferView::of(buf)), 4u);
    EXPECT_EQ(io::read_fully(source, core::BufferView::of(buf)), 0u);
}

TEST(MemoryStreamTest, ReadFullyThrowsOnFailure) {
    ScriptedSource source{pattern(20, 5)};
    source.fail_after(6);

    Bytes buf(16);
    EXPECT_THROW((void)io::read_fully(source, core::BufferView::of(buf)), core::IoError);
}

// ==================== FileByteSource / FileByteSink ====================

class FileStreamTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = std::filesystem::temp_directory_path() / ("bkstream_" + std::string{info->name()} + "_" + std::to_string(::getpid()));
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override { std::filesystem::remove_all(dir_); }

        static Bytes slurp(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
            return bytes_of(text);
        }

        std::filesystem::path dir_;
};

TEST_F(FileStreamTest, SinkThenSource) {
    const auto path = dir_ / "out.bin";
    Bytes data = pattern(300, 9);

    auto sink = io::FileByteSink::create(path, false, true);
    EXPECT_EQ(sink->write(core::BufferView::of(data)).bytes, 300u);
    sink->close();
    EXPECT_TRUE(sink->write(core::BufferView::of(data)).failed());

    auto source = io::FileByteSource::open(path);
    EXPECT_EQ(source->file_size(), 300u);
    EXPECT_EQ(source->path(), path.string());

    Bytes buf(100);
    EXPECT_EQ(io::read_fully(*source, core::BufferView::of(buf)), 100u);

    auto s = source->seek(150);
    EXPECT_EQ(s.status, io::SeekStatus::OK);
    EXPECT_EQ(s.moved, 150u);

    EXPECT_EQ(io::read_fully(*source, core::BufferView::of(buf)), 50u);
    EXPECT_EQ(Bytes(buf.begin(), buf.begin() + 50), Bytes(data.begin() + 250, data.end()));

    s = source->seek(1);
    EXPECT_EQ(s.status, io::SeekStatus::END_OF_INPUT);
    EXPECT_EQ(s.moved, 0u);
    EXPECT_TRUE(source->read(core::BufferView::of(buf)).end_of_input());
    source->close();
}

TEST_F(FileStreamTest, SinkSeekLeavesZeros) {
    const auto path = dir_ / "holes.bin";
    Bytes head = bytes_of("head");
    Bytes tail = bytes_of("tail");

    auto sink = io::FileByteSink::create(path, false, false);
    (void)sink->write(core::BufferView::of(head));
    EXPECT_EQ(sink->seek(8).status, io::SeekStatus::OK);
    sink->close();

    EXPECT_EQ(slurp(path), concat({head, Bytes(8)}));

    auto again = io::FileByteSink::create(path, true, false);
    (void)again->write(core::BufferView::of(tail));
    again->close();
    EXPECT_EQ(slurp(path), tail);
}

TEST_F(FileStreamTest, CreateRefusesExistingFile) {
    const auto path = dir_ / "exists.bin";
    std::ofstream(path) << "x";

    try {
        (void)io::FileByteSink::create(path, false, false);
        FAIL() << "existing file replaced";
    }
    catch (const core::IoError& e) {
        EXPECT_EQ(e.op(), "create");
        EXPECT_EQ(e.error(), std::errc::file_exists);
    }
    EXPECT_EQ(slurp(path), bytes_of("x"));
}

TEST_F(FileStreamTest, OpenMissingFile) {
    const auto path = dir_ / "missing.bin";
    try {
        (void)io::FileByteSource::open(path);
        FAIL() << "missing file opened";
    }
    catch (const core::IoError& e) {
        EXPECT_EQ(e.op(), "open");
        EXPECT_EQ(e.path(), path.string());
        EXPECT_EQ(e.error(), std::errc::no_such_file_or_directory);
        EXPECT_NE(std::string{e.what()}.find(path.string()), std::string::npos);
    }
}

TEST_F(FileStreamTest, CloseIsIdempotent) {
    const auto path = dir_ / "twice.bin";
    auto sink = io::FileByteSink::create(path, false, true);
    sink->close();
    EXPECT_NO_THROW(sink->close());

    auto source = io::FileByteSource::open(path);
    source->close();
    EXPECT_NO_THROW(source->close());
    Bytes buf(4);
    EXPECT_TRUE(source->read(core::BufferView::of(buf)).failed());
}
