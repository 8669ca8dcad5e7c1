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
#include <xvadisk/header_scanner.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xvadisk {

// Entry names of disk payload look like "Ref:<disk>/<chunk>", e.g. "Ref:12/00000042"
struct chunk_name {
    std::string disk_ref;
    uint64_t chunk_index = 0;
};

[[nodiscard]] std::optional<chunk_name> parse_chunk_name(std::string_view name);

// Called once per header record with the record offset and the archive size, if known
using progress_fn = std::function<void(uint64_t offset, std::optional<uint64_t> total)>;

// Feeds every remaining header of the scanner into index. On failure the disks
// indexed so far stay in index as they were.
[[nodiscard]] std::expected<void, error> index_entries(
    header_scanner& scanner, disk_index& index, const progress_fn& progress = {});

// Scan the whole archive. Fails with empty_result when no disk payload was found.
[[nodiscard]] std::expected<disk_index, error> build_disk_index(
    header_scanner& scanner, const progress_fn& progress = {});

[[nodiscard]] std::expected<disk_index, error> build_disk_index(
    const std::filesystem::path& archive, const progress_fn& progress = {});

} // namespace xvadisk
