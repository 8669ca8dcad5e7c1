/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <xvadisk/disk_index.hpp>
#include <xvadisk/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace xvadisk {

constexpr uint64_t SECTOR_SIZE = 512;

struct table_geometry {
    uint64_t chunk_size = CHUNK_SIZE;
    uint64_t sector_size = SECTOR_SIZE;

    [[nodiscard]] constexpr uint64_t sectors_per_chunk() const noexcept {
        return chunk_size / sector_size;
    }
};

enum class segment_kind {
    linear,
    zero
};

// One line of a device-mapper table
struct segment {
    uint64_t start_sector = 0;
    uint64_t length_sectors = 0;
    segment_kind kind = segment_kind::zero;
    std::string backing_device;       // linear only
    uint64_t backing_offset_sectors = 0; // linear only

    [[nodiscard]] uint64_t end_sector() const noexcept { return start_sector + length_sectors; }
    [[nodiscard]] bool is_linear() const noexcept { return kind == segment_kind::linear; }
    [[nodiscard]] bool is_zero() const noexcept { return kind == segment_kind::zero; }

    [[nodiscard]] bool operator==(const segment&) const = default;
};

class segment_table {
private:
    std::vector<segment> segments_;

public:
    segment_table() = default;
    explicit segment_table(std::vector<segment> segments)
        : segments_(std::move(segments)) {}

    [[nodiscard]] const std::vector<segment>& segments() const noexcept { return segments_; }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] const segment& operator[](const size_t i) const { return segments_[i]; }

    auto begin() const { return segments_.begin(); }
    auto end() const { return segments_.end(); }

    [[nodiscard]] uint64_t total_sectors() const noexcept {
        return segments_.empty() ? 0 : segments_.back().end_sector();
    }

    // Device-mapper table text, one "<start> <length> linear <dev> <offset>" or
    // "<start> <length> zero" line per segment
    [[nodiscard]] std::string to_text() const;

    [[nodiscard]] bool operator==(const segment_table&) const = default;
};

// Build the table presenting one disk as a contiguous device. Every chunk with data
// becomes a linear segment into backing_device, every run of missing chunks a single
// zero segment.
//
// Fails with format_error when a chunk is not sector aligned or when the disk's
// chunk extent does not start at index 0.
[[nodiscard]] std::expected<segment_table, error> build_segment_table(
    const disk_chunks& chunks,
    std::string_view backing_device,
    const table_geometry& geometry = {});

} // namespace xvadisk
