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

// internal/src/catalog/StreamCatalog.cpp
#include "catalog/StreamCatalog.hpp"
#include "format/RecordScanner.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>

namespace bkstream::catalog {
    using json = nlohmann::json;
    using format::StreamType;

    StreamCatalog::StreamCatalog() : alternate_streams_{std::make_shared<const AlternateStreams>()} {}

    StreamCatalog::StreamCatalog(StreamCatalog&& other) : entries_{std::move(other.entries_)} {
        std::lock_guard lock{other.snapshot_mutex_};
        alternate_streams_ = std::exchange(other.alternate_streams_, std::make_shared<const AlternateStreams>());
    }

    StreamCatalog& StreamCatalog::operator=(StreamCatalog&& other) {
        if (this != &other) {
            std::scoped_lock lock{snapshot_mutex_, other.snapshot_mutex_};
            entries_ = std::move(other.entries_);
            alternate_streams_ = std::exchange(other.alternate_streams_, std::make_shared<const AlternateStreams>());
        }
        return *this;
    }

    StreamCatalog StreamCatalog::scan(io::ByteSource& source, size_t scratch_size) {
        StreamCatalog catalog;
        format::RecordScanner scanner{source, scratch_size};
        while (const auto header = scanner.next()) { catalog.add(*header, scanner.position()); }
        return catalog;
    }

    void StreamCatalog::add(const format::RecordHeader& header, uint64_t offset) {
        entries_.push_back(Entry{header.id, header.attributes, header.size, header.name, header.sparse_offset, offset});

        if (header.id != StreamType::ALTERNATE_DATA || header.name.empty()) { return; }

        // copy on write: published snapshots stay untouched
        std::lock_guard lock{snapshot_mutex_};
        auto next = std::make_shared<AlternateStreams>(*alternate_streams_);
        (*next)[header.name] = header.size;
        alternate_streams_ = std::move(next);
    }

    std::shared_ptr<const StreamCatalog::AlternateStreams> StreamCatalog::alternate_streams() const {
        std::lock_guard lock{snapshot_mutex_};
        return alternate_streams_;
    }

    std::vector<StreamCatalog::SparseExtent> StreamCatalog::sparse_extents() const {
        std::vector<SparseExtent> extents;
        for (const auto& e : entries_) {
            if (e.id == StreamType::SPARSE_BLOCK) { extents.push_back(SparseExtent{e.sparse_offset, e.size}); }
        }
        std::stable_sort(extents.begin(), extents.end(), [](const SparseExtent& a, const SparseExtent& b) { return a.offset < b.offset; });
        return extents;
    }

    int64_t StreamCatalog::payload_bytes(StreamType type) const noexcept {
        int64_t total = 0;
        for (const auto& e : entries_) {
            if (e.id == type) { total += e.size; }
        }
        return total;
    }

    std::string StreamCatalog::to_json(int indent) const {
        json records = json::array();
        std::map<std::string, int64_t> totals;

        for (const auto& e : entries_) {
            const std::string type{format::stream_type_name(e.id)};
            json r = {
                {"offset", e.offset},
                {"type", type},
                {"id", static_cast<uint32_t>(e.id)},
                {"attributes", format::describe_attributes(e.attributes)},
                {"size", e.size}
            };
            if (e.id == StreamType::ALTERNATE_DATA) { r["name"] = e.name; }
            if (e.id == StreamType::SPARSE_BLOCK) { r["sparseOffset"] = e.sparse_offset; }
            records.push_back(std::move(r));
            totals[type] += e.size;
        }

        json extents = json::array();
        for (const auto& x : sparse_extents()) { extents.push_back({{"offset", x.offset}, {"length", x.length}}); }

        const json j = {
            {"records", std::move(records)},
            {"alternateStreams", *alternate_streams()},
            {"sparseExtents", std::move(extents)},
            {"totals", totals}
        };
        return j.dump(indent);
    }
} // namespace bkstream::catalog
