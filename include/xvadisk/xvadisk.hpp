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
#include <xvadisk/source.hpp>
#include <xvadisk/header_scanner.hpp>
#include <xvadisk/disk_index.hpp>
#include <xvadisk/chunk_indexer.hpp>
#include <xvadisk/segment_table.hpp>
#include <xvadisk/index_cache.hpp>
#include <xvadisk/block_mapper.hpp>
#include <map>

namespace xvadisk {

// Main convenience API
[[nodiscard]] std::expected<header_scanner, error> open_archive(const std::filesystem::path& path);
[[nodiscard]] std::expected<header_scanner, error> open_archive(std::unique_ptr<byte_source> source);

// Segment tables for every disk of an archive, keyed by disk reference
[[nodiscard]] std::expected<std::map<std::string, segment_table>, error> build_segment_tables(
    const disk_index& index, std::string_view backing_device, const table_geometry& geometry = {});

} // namespace xvadisk
