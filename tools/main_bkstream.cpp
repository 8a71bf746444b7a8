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

/*
 * bkstream - command line front end
 *
 * Run:
 *   bkstream list <file> [--json]
 *   bkstream copy <in> <out> [--drop TYPE]... [--redact TYPE]... [--overwrite]
 *
 * Common flags:
 *   --config <options.json>   load CodecOptions (flags given later override it)
 *   --log-level <level>       debug | info | warn | error | off
 */

#include "catalog/StreamCatalog.hpp"
#include "config/CodecOptions.hpp"
#include "core/CodecError.hpp"
#include "core/Log.hpp"
#include "core/buffer/OwnedBuffer.hpp"
#include "format/StreamType.hpp"
#include "io/FileStream.hpp"
#include "pipeline/BackupReader.hpp"
#include "pipeline/RestoreWriter.hpp"
#include "pipeline/StreamCopy.hpp"

#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bkstream;

namespace {
    struct CommandLine {
        std::string command;
        std::vector<std::string> operands;
        bool json = false;
        std::set<format::StreamType> drop;
        std::set<format::StreamType> redact;
        config::CodecOptions options;
    };

    void print_usage() {
        std::cerr << "usage: bkstream list <file> [--json]\n"
                  << "       bkstream copy <in> <out> [--drop TYPE]... [--redact TYPE]... [--overwrite]\n"
                  << "common flags: --config <options.json> --log-level <debug|info|warn|error|off>\n";
    }

    format::StreamType stream_type_arg(const char* flag, const char* value) {
        const auto type = format::parse_stream_type(value);
        if (!type) { throw std::invalid_argument(std::string{flag} + ": unknown stream type \"" + value + "\""); }
        return *type;
    }

    CommandLine parse_args(int argc, char** argv) {
        if (argc < 2) { throw std::invalid_argument("missing command"); }

        CommandLine cl;
        cl.command = argv[1];

        // --config first, so that the remaining flags override the file
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--config") == 0) {
                if (i + 1 >= argc) { throw std::invalid_argument("--config needs a path"); }
                cl.options = config::CodecOptions::load(argv[++i]);
            }
        }

        for (int i = 2; i < argc; ++i) {
            const char* arg = argv[i];
            const bool has_value = i + 1 < argc;

            if (std::strcmp(arg, "--config") == 0) {
                ++i;
            } else if (std::strcmp(arg, "--json") == 0) {
                cl.json = true;
            } else if (std::strcmp(arg, "--overwrite") == 0) {
                cl.options.overwrite = true;
            } else if (std::strcmp(arg, "--log-level") == 0 && has_value) {
                const auto level = core::parse_log_level(argv[++i]);
                if (!level) { throw std::invalid_argument(std::string{"--log-level: unknown level \""} + argv[i] + "\""); }
                cl.options.log_level = *level;
            } else if (std::strcmp(arg, "--drop") == 0 && has_value) {
                cl.drop.insert(stream_type_arg(arg, argv[++i]));
            } else if (std::strcmp(arg, "--redact") == 0 && has_value) {
                cl.redact.insert(stream_type_arg(arg, argv[++i]));
            } else if (std::strncmp(arg, "--", 2) == 0) {
                throw std::invalid_argument(std::string{"unknown or incomplete flag "} + arg);
            } else {
                cl.operands.emplace_back(arg);
            }
        }
        return cl;
    }

    // Release on the error path; the original exception is what gets reported
    template <typename Pipeline>
    void close_after_failure(Pipeline& pipeline) {
        try { pipeline.close(); }
        catch (const core::CloseError& e) { core::log(core::LogLevel::WARN, std::string{"while cleaning up: "} + e.what()); }
    }

    int run_list(const CommandLine& cl) {
        if (cl.operands.size() != 1) { throw std::invalid_argument("list takes exactly one file"); }

        auto source = io::FileByteSource::open(cl.operands[0]);
        const auto index = catalog::StreamCatalog::scan(*source, cl.options.scan_buffer_size);
        source->close();

        if (cl.json) {
            std::cout << index.to_json(2) << '\n';
            return 0;
        }

        std::cout << std::left << std::setw(12) << "OFFSET" << std::setw(22) << "TYPE" << std::setw(28) << "ATTRIBUTES" << std::setw(14) << "SIZE" << "DETAIL\n";
        for (const auto& e : index.entries()) {
            std::cout << std::left << std::setw(12) << e.offset << std::setw(22) << format::stream_type_name(e.id) << std::setw(28)
                      << format::describe_attributes(e.attributes) << std::setw(14) << e.size;
            if (e.id == format::StreamType::ALTERNATE_DATA) { std::cout << e.name; }
            if (e.id == format::StreamType::SPARSE_BLOCK) { std::cout << "at " << e.sparse_offset; }
            std::cout << '\n';
        }
        std::cout << index.entries().size() << " record(s), " << index.alternate_streams()->size() << " alternate stream(s)\n";
        return 0;
    }

    int run_copy(const CommandLine& cl) {
        if (cl.operands.size() != 2) { throw std::invalid_argument("copy takes an input and an output file"); }

        pipeline::TransformHook hook = cl.redact.empty() ? pipeline::passthrough() : pipeline::redact_streams(cl.redact);
        if (!cl.drop.empty()) {
            hook = [drop = cl.drop, inner = std::move(hook)](const pipeline::TransformContext& ctx, core::BufferView chunk) -> std::vector<std::byte> {
                if (drop.contains(ctx.header().id)) { return {}; }
                return inner(ctx, chunk);
            };
        }

        pipeline::BackupReader reader{io::FileByteSource::open(cl.operands[0]), std::move(hook)};
        pipeline::RestoreWriter writer{io::FileByteSink::create(cl.operands[1], cl.options.overwrite, cl.options.sync_on_close), cl.options};

        auto scratch = core::OwnedBuffer::allocate(cl.options.copy_buffer_size);
        uint64_t copied = 0;
        try { copied = pipeline::copy_stream(reader, writer, scratch.view()); }
        catch (const std::exception&) {
            close_after_failure(reader);
            close_after_failure(writer);
            throw;
        }

        reader.close();
        writer.close();
        core::log(core::LogLevel::INFO, "copied " + std::to_string(copied) + " bytes to " + cl.operands[1]);
        return 0;
    }
} // anonymous namespace

int main(int argc, char** argv) {
    try {
        const CommandLine cl = parse_args(argc, argv);
        core::set_log_level(cl.options.log_level);

        if (cl.command == "list") { return run_list(cl); }
        if (cl.command == "copy") { return run_copy(cl); }

        print_usage();
        core::log(core::LogLevel::ERROR, "unknown command \"" + cl.command + "\"");
        return 1;
    }
    catch (const std::invalid_argument& e) {
        print_usage();
        core::log(core::LogLevel::ERROR, e.what());
        return 1;
    }
    catch (const std::exception& e) {
        core::log(core::LogLevel::ERROR, e.what());
        return 1;
    }
}
