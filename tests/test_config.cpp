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
#include "config/CodecOptions.hpp"
#include "core/CodecError.hpp"
#include "core/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace bkstream;
using config::CodecOptions;
using core::LogLevel;

namespace {
    core::ErrorCode parse_error(const std::string& text) {
        try { (void)CodecOptions::parse(text); }
        catch (const core::CodecError& e) { return e.code(); }
        return core::ErrorCode::NONE;
    }
} // anonymous namespace

// ==================== CodecOptions ====================

TEST(CodecOptionsTest, EmptyObjectKeepsDefaults) {
    const auto opts = CodecOptions::parse("{}");
    EXPECT_EQ(opts, CodecOptions{});
    EXPECT_EQ(opts.max_write_stalls, 64u);
    EXPECT_EQ(opts.copy_buffer_size, 64u * 1024);
    EXPECT_TRUE(opts.sync_on_close);
    EXPECT_FALSE(opts.overwrite);
    EXPECT_EQ(opts.log_level, LogLevel::WARN);
}

TEST(CodecOptionsTest, ParsesEveryKey) {
    const auto opts = CodecOptions::parse(R"({
        "maxWriteStalls": 3,
        "copyBufferSize": 4096,
        "scanBufferSize": 512,
        "syncOnClose": false,
        "overwrite": true,
        "logLevel": "debug",
        "comment": "ignored"
    })");

    EXPECT_EQ(opts.max_write_stalls, 3u);
    EXPECT_EQ(opts.copy_buffer_size, 4096u);
    EXPECT_EQ(opts.scan_buffer_size, 512u);
    EXPECT_FALSE(opts.sync_on_close);
    EXPECT_TRUE(opts.overwrite);
    EXPECT_EQ(opts.log_level, LogLevel::DEBUG);
}

TEST(CodecOptionsTest, DumpParsesBack) {
    CodecOptions opts;
    opts.max_write_stalls = 0;
    opts.scan_buffer_size = 100;
    opts.overwrite = true;
    opts.log_level = LogLevel::OFF;

    EXPECT_EQ(CodecOptions::parse(opts.dump()), opts);
    EXPECT_NE(opts.dump(-1).find("\"logLevel\":\"off\""), std::string::npos);
}

TEST(CodecOptionsTest, RejectsInvalidInput) {
    EXPECT_EQ(parse_error("{"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error("[1, 2]"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"maxWriteStalls": -1})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"maxWriteStalls": "many"})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"copyBufferSize": 0})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"scanBufferSize": 1.5})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"syncOnClose": "yes"})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"logLevel": "verbose"})"), core::ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(parse_error(R"({"logLevel": 2})"), core::ErrorCode::INVALID_CONFIG);
}

TEST(CodecOptionsTest, LoadReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / ("bkstream_options_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"copyBufferSize": 1024, "logLevel": "error"})";
    }

    const auto opts = CodecOptions::load(path);
    std::filesystem::remove(path);

    EXPECT_EQ(opts.copy_buffer_size, 1024u);
    EXPECT_EQ(opts.log_level, LogLevel::ERROR);
}

TEST(CodecOptionsTest, LoadMissingFile) {
    const auto path = std::filesystem::temp_directory_path() / "bkstream_options_missing" / "options.json";
    try {
        (void)CodecOptions::load(path);
        FAIL() << "missing file accepted";
    }
    catch (const core::IoError& e) {
        EXPECT_EQ(e.op(), "open");
        EXPECT_EQ(e.path(), path.string());
        EXPECT_EQ(e.code(), core::ErrorCode::IO_ERROR);
    }
}

// ==================== Log ====================

TEST(LogTest, LevelNamesParseBack) {
    for (const auto level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::OFF}) {
        EXPECT_EQ(core::parse_log_level(core::log_level_name(level)), level);
    }
    EXPECT_FALSE(core::parse_log_level("WARN").has_value());
    EXPECT_FALSE(core::parse_log_level("").has_value());
}

TEST(LogTest, ThresholdFiltersMessages) {
    const LogLevel saved = core::log_level();

    core::set_log_level(LogLevel::ERROR);
    testing::internal::CaptureStderr();
    core::log(LogLevel::WARN, "dropped");
    core::log(LogLevel::ERROR, "kept");
    core::log(LogLevel::OFF, "never");
    const std::string out = testing::internal::GetCapturedStderr();
    core::set_log_level(saved);

    EXPECT_EQ(out, "bkstream: [error] kept\n");
}
