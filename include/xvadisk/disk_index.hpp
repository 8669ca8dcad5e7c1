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

#include <xvadisk/error.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace xvadisk {

// Chunk unit the archive writer splits disks into
constexpr uint64_t CHUNK_SIZE = 1048576;

// Where one chunk's payload lives inside the archive
struct chunk_location {
    uint64_t offset = 0; // Absolute offset of the payload
    uint64_t size = 0;   // Payload length, never zero once indexed

    [[nodiscard]] bool operator==(const chunk_location&) const = default;
};

// Sparse chunk map of a single disk. Indices with no location are all-zero chunks.
//
// The lowest and highest index the archive mentioned for this disk are kept even
// when their payload was empty, so the logical extent of the disk is always known
// and a walk over the slots is bounded.
class disk_chunks {
private:
    std::map<uint64_t, chunk_location> chunks_;
    std::optional<uint64_t> lowest_;
    std::optional<uint64_t> highest_;

public:
    // Record a chunk with data. Replaces an earlier location for the same index.
    void add_chunk(uint64_t index, chunk_location location);

    // Record that the archive mentions this index, whether or not it carries data
    void mark_index(uint64_t index) noexcept;

    [[nodiscard]] std::optional<chunk_location> find(uint64_t index) const;
    [[nodiscard]] bool contains(const uint64_t index) const { return chunks_.contains(index); }

    [[nodiscard]] const std::map<uint64_t, chunk_location>& chunks() const noexcept { return chunks_; }
    [[nodiscard]] std::optional<uint64_t> lowest_index() const noexcept { return lowest_; }
    [[nodiscard]] std::optional<uint64_t> highest_index() const noexcept { return highest_; }

    // Number of chunk slots from index 0 through the highest index, gaps included
    [[nodiscard]] uint64_t slot_count() const noexcept { return highest_ ? *highest_ + 1 : 0; }

    // Logical size of the disk in bytes
    [[nodiscard]] uint64_t logical_size(uint64_t chunk_size = CHUNK_SIZE) const noexcept {
        return slot_count() * chunk_size;
    }

    // Sum of the payload bytes actually stored in the archive
    [[nodiscard]] uint64_t stored_size() const noexcept {
        uint64_t total = 0;
        for (const auto& [index, location] : chunks_) {
            total += location.size;
        }
        return total;
    }

    [[nodiscard]] bool operator==(const disk_chunks&) const = default;
};

// Every disk found in one archive, keyed by disk reference (the number after "Ref:")
class disk_index {
private:
    std::map<std::string, disk_chunks> disks_;

public:
    [[nodiscard]] disk_chunks& disk(const std::string& ref) { return disks_[ref]; }
    [[nodiscard]] const disk_chunks* find(const std::string& ref) const;

    [[nodiscard]] const std::map<std::string, disk_chunks>& disks() const noexcept { return disks_; }
    [[nodiscard]] bool empty() const noexcept { return disks_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return disks_.size(); }

    auto begin() const { return disks_.begin(); }
    auto end() const { return disks_.end(); }

    [[nodiscard]] bool operator==(const disk_index&) const = default;
};

} // namespace xvadisk
