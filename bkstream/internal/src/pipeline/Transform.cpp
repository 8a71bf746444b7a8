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

// internal/src/pipeline/Transform.cpp
#include "pipeline/Transform.hpp"
#include "format/RecordCodec.hpp"

#include <utility>

namespace bkstream::pipeline {
    namespace {
        // [header if active][payload]
        std::vector<std::byte> frame(const TransformContext& ctx, core::BufferView payload) {
            std::vector<std::byte> out;
            if (ctx.header().active) { out = format::RecordCodec::encode(ctx.header()); }
            const auto span = payload.as_const_span();
            out.insert(out.end(), span.begin(), span.end());
            return out;
        }
    } // anonymous namespace

    TransformHook passthrough() { return [](const TransformContext& ctx, core::BufferView chunk) { return frame(ctx, chunk); }; }

    TransformHook drop_streams(std::set<format::StreamType> types) {
        return [types = std::move(types)](const TransformContext& ctx, core::BufferView chunk) -> std::vector<std::byte> {
            if (types.contains(ctx.header().id)) { return {}; }
            return frame(ctx, chunk);
        };
    }

    TransformHook redact_streams(std::set<format::StreamType> types, std::byte fill) {
        return [types = std::move(types), fill](const TransformContext& ctx, core::BufferView chunk) -> std::vector<std::byte> {
            if (!types.contains(ctx.header().id)) { return frame(ctx, chunk); }

            std::vector<std::byte> blank(chunk.size(), fill);
            return frame(ctx, core::BufferView::of(blank));
        };
    }

    WriteAction default_write_error_hook(const TransformContext&, const io::IoResult& result) noexcept {
        return result.ok() ? WriteAction::CONTINUE : WriteAction::ABORT;
    }
} // namespace bkstream::pipeline
