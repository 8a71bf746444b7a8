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

// internal/include/pipeline/Transform.hpp
#pragma once

#include "pipeline/TransformContext.hpp"
#include "core/buffer/BufferView.hpp"
#include <cstddef>
#include <functional>
#include <set>
#include <vector>

namespace bkstream::pipeline {
    /**
     * Transforms one payload chunk. The returned bytes replace the chunk in
     * the output; they include the encoded header when the hook keeps an
     * active record. Failures are reported by throwing.
     */
    using TransformHook = std::function<std::vector<std::byte>(const TransformContext&, core::BufferView)>;

    enum class WriteAction : uint8_t {
        CONTINUE = 0,
        ABORT = 1,
    };

    /**
     * Consulted after every sink write attempt of the reverse pipeline.
     * ctx.last_result() equals result.
     */
    using WriteErrorHook = std::function<WriteAction(const TransformContext&, const io::IoResult&)>;

    /**
     * Emits the encoded header (while active) followed by the chunk.
     */
    [[nodiscard]] TransformHook passthrough();

    /**
     * Removes whole records of the given types, header included.
     */
    [[nodiscard]] TransformHook drop_streams(std::set<format::StreamType> types);

    /**
     * Keeps records of the given types but overwrites their payload with fill.
     */
    [[nodiscard]] TransformHook redact_streams(std::set<format::StreamType> types, std::byte fill = std::byte{0});

    /**
     * CONTINUE while the sink reports OK, ABORT on END_OF_INPUT or ERROR.
     */
    [[nodiscard]] WriteAction default_write_error_hook(const TransformContext& ctx, const io::IoResult& result) noexcept;
} // namespace bkstream::pipeline
