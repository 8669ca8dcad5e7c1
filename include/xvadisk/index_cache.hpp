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

#include <xvadisk/chunk_indexer.hpp>
#include <xvadisk/disk_index.hpp>
#include <xvadisk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace xvadisk {

// What a saved index was built from. A cache is only reused for the same identity.
struct archive_identity {
    std::string path;
    uint64_t size = 0;
    int64_t modified = 0; // last write time, ticks since the file clock epoch

    [[nodiscard]] static std::expected<archive_identity, error> of(const std::filesystem::path& archive);

    [[nodiscard]] bool operator==(const archive_identity&) const = default;
};

namespace detail {

constexpr uint32_t INDEX_FORMAT_VERSION = 1;

// Fixed header at the start of a saved index. Integers are little-endian.
struct index_file_header {
    char magic[8];          // "XVAIDX\0\0"
    uint32_t version;
    uint32_t disk_count;
    uint64_t archive_size;
    int64_t archive_modified;
    uint64_t payload_size;  // bytes following this header
    uint64_t checksum;      // byte sum of the payload
    char reserved[16];
};

static_assert(sizeof(index_file_header) == 64, "index file header must be exactly 64 bytes");

[[nodiscard]] std::vector<std::byte> encode_index(const disk_index& index, const archive_identity& identity);

struct decoded_index {
    archive_identity identity;
    disk_index index;
};

[[nodiscard]] std::expected<decoded_index, error> decode_index(std::span<const std::byte> data);

} // namespace detail

// Write index to path, replacing any previous file. The file is written next to
// its destination and renamed into place.
[[nodiscard]] std::expected<void, error> save_index(
    const disk_index& index, const archive_identity& identity, const std::filesystem::path& path);

// Read a saved index together with the identity it was saved for.
// Fails with io_error when unreadable and corrupt_index when it does not validate.
[[nodiscard]] std::expected<detail::decoded_index, error> load_index(const std::filesystem::path& path);

enum class cache_policy {
    reuse,   // load a matching cache, rescan and overwrite a stale one
    refresh, // always rescan and overwrite
    bypass   // rescan, leave the cache alone
};

enum class index_origin {
    cache,
    scan
};

struct index_result {
    disk_index index;
    index_origin origin = index_origin::scan;
};

// Default location of the saved index: next to the archive, "<archive>-map"
[[nodiscard]] std::filesystem::path default_cache_path(const std::filesystem::path& archive);

[[nodiscard]] std::expected<index_result, error> load_or_build_index(
    const std::filesystem::path& archive,
    const std::filesystem::path& cache,
    cache_policy policy = cache_policy::reuse,
    const progress_fn& progress = {});

} // namespace xvadisk
