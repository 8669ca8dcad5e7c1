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

#include <xvadisk/segment_table.hpp>
#include <cstdint>
#include <format>
#include <iterator>

namespace xvadisk {

std::string segment_table::to_text() const {
    std::string text;
    for (const auto& seg : segments_) {
        if (seg.is_linear()) {
            std::format_to(std::back_inserter(text), "{} {} linear {} {}\n",
                           seg.start_sector, seg.length_sectors,
                           seg.backing_device, seg.backing_offset_sectors);
        } else {
            std::format_to(std::back_inserter(text), "{} {} zero\n",
                           seg.start_sector, seg.length_sectors);
        }
    }
    return text;
}

auto build_segment_table(const disk_chunks &chunks,
                         std::string_view backing_device,
                         const table_geometry &geometry) -> std::expected<segment_table, error> {
    if (geometry.sector_size == 0 || geometry.chunk_size == 0 ||
        geometry.chunk_size % geometry.sector_size != 0) {
        return std::unexpected(error{error_code::invalid_operation,
            std::format("Chunk size {} is not a multiple of sector size {}",
                        geometry.chunk_size, geometry.sector_size)});
    }

    const auto lowest = chunks.lowest_index();
    if (!lowest) {
        return std::unexpected(error{error_code::format_error, "Disk has no chunks"});
    }
    // The archive writer always emits the first and last chunk of a disk
    if (*lowest != 0) {
        return std::unexpected(error{error_code::format_error,
            std::format("First chunk of disk is missing (lowest index is {})", *lowest)});
    }

    const uint64_t sectors_per_chunk = geometry.sectors_per_chunk();
    const uint64_t highest = *chunks.highest_index();
    if (highest == UINT64_MAX || highest + 1 > UINT64_MAX / sectors_per_chunk) {
        return std::unexpected(error{error_code::format_error,
            std::format("Chunk index {} puts the disk beyond the addressable sector range", highest)});
    }

    const uint64_t slot_count = highest + 1;
    const auto& present = chunks.chunks();

    std::vector<segment> segments;
    uint64_t sector = 0;
    uint64_t pending_zero = 0; // zero sectors not yet emitted, merged across slots

    auto flush_zero = [&] {
        if (pending_zero == 0) {
            return;
        }
        segment seg;
        seg.start_sector = sector;
        seg.length_sectors = pending_zero;
        seg.kind = segment_kind::zero;
        segments.push_back(std::move(seg));
        sector += pending_zero;
        pending_zero = 0;
    };

    uint64_t index = 0;
    auto next = present.begin();

    while (index < slot_count) {
        if (next != present.end() && next->first == index) {
            const auto& [offset, size] = next->second;
            if (size > geometry.chunk_size) {
                return std::unexpected(error{error_code::format_error,
                    std::format("Chunk {} is {} bytes, larger than the {}-byte chunk unit",
                                index, size, geometry.chunk_size)});
            }
            if (size % geometry.sector_size != 0 || offset % geometry.sector_size != 0) {
                return std::unexpected(error{error_code::format_error,
                    std::format("Chunk {} (offset {}, size {}) is not aligned to {}-byte sectors",
                                index, offset, size, geometry.sector_size)});
            }

            const uint64_t data_sectors = size / geometry.sector_size;
            if (data_sectors > 0) {
                flush_zero();

                segment seg;
                seg.start_sector = sector;
                seg.length_sectors = data_sectors;
                seg.kind = segment_kind::linear;
                seg.backing_device = std::string{backing_device};
                seg.backing_offset_sectors = offset / geometry.sector_size;
                segments.push_back(std::move(seg));

                sector += data_sectors;
            }

            // A short chunk reads as zeros up to the next chunk boundary
            pending_zero += sectors_per_chunk - data_sectors;
            ++index;
            ++next;
            continue;
        }

        // Run of empty slots up to the next chunk with data, or to the end of the disk.
        // Slots marked but left without data fall inside the run.
        const uint64_t run_end = next != present.end() ? next->first : slot_count;
        pending_zero += (run_end - index) * sectors_per_chunk;
        index = run_end;
    }

    flush_zero();

    return segment_table{std::move(segments)};
}

} // namespace xvadisk
