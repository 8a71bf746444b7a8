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

// internal/src/config/CodecOptions.cpp
#include "config/CodecOptions.hpp"
#include "core/CodecError.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace bkstream::config {
    namespace {
        using json = nlohmann::json;
        using core::CodecError;
        using core::ErrorCode;

        [[noreturn]] void invalid(const std::string& message) { throw CodecError(ErrorCode::INVALID_CONFIG, message); }

        template <typename T>
        void read_field(const json& j, const char* key, T& out) {
            const auto it = j.find(key);
            if (it == j.end()) { return; }
            try { out = it->get<T>(); }
            catch (const json::exception& e) { invalid(std::string{"\""} + key + "\": " + e.what()); }
        }

        // get<uint32_t>/get<size_t> silently wrap negative numbers
        void require_unsigned(const json& j, const char* key) {
            const auto it = j.find(key);
            if (it != j.end() && !it->is_number_unsigned()) { invalid(std::string{"\""} + key + "\" must be a non-negative integer"); }
        }
    } // anonymous namespace

    CodecOptions CodecOptions::parse(std::string_view json_text) {
        json j;
        try { j = json::parse(json_text.begin(), json_text.end()); }
        catch (const json::parse_error& e) { invalid(std::string{"malformed options: "} + e.what()); }

        if (!j.is_object()) { invalid("options must be a JSON object"); }

        for (const char* key : {"maxWriteStalls", "copyBufferSize", "scanBufferSize"}) { require_unsigned(j, key); }

        CodecOptions opts;
        read_field(j, "maxWriteStalls", opts.max_write_stalls);
        read_field(j, "copyBufferSize", opts.copy_buffer_size);
        read_field(j, "scanBufferSize", opts.scan_buffer_size);
        read_field(j, "syncOnClose", opts.sync_on_close);
        read_field(j, "overwrite", opts.overwrite);

        std::string level{core::log_level_name(opts.log_level)};
        read_field(j, "logLevel", level);
        const auto parsed = core::parse_log_level(level);
        if (!parsed) { invalid("unknown log level \"" + level + "\""); }
        opts.log_level = *parsed;

        if (opts.copy_buffer_size == 0) { invalid("\"copyBufferSize\" must be greater than zero"); }
        if (opts.scan_buffer_size == 0) { invalid("\"scanBufferSize\" must be greater than zero"); }

        return opts;
    }

    CodecOptions CodecOptions::load(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) { throw core::IoError("open", path.string(), std::make_error_code(std::errc::no_such_file_or_directory)); }

        std::ostringstream text;
        text << in.rdbuf();
        if (in.bad()) { throw core::IoError("read", path.string(), std::make_error_code(std::errc::io_error)); }

        return parse(text.str());
    }

    std::string CodecOptions::dump(int indent) const {
        const json j = {
            {"maxWriteStalls", max_write_stalls},
            {"copyBufferSize", copy_buffer_size},
            {"scanBufferSize", scan_buffer_size},
            {"syncOnClose", sync_on_close},
            {"overwrite", overwrite},
            {"logLevel", std::string{core::log_level_name(log_level)}},
        };
        return j.dump(indent);
    }
} // namespace bkstream::config
