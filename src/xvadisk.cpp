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

#include <xvadisk/xvadisk.hpp>
#include <format>

namespace xvadisk {

auto open_archive(const std::filesystem::path &path) -> std::expected<header_scanner, error> {
    return header_scanner::from_file(path);
}

auto open_archive(std::unique_ptr<byte_source> source) -> std::expected<header_scanner, error> {
    return header_scanner::from_source(std::move(source));
}

auto build_segment_tables(const disk_index &index, std::string_view backing_device,
                          const table_geometry &geometry) -> std::expected<std::map<std::string, segment_table>, error> {
    if (index.empty()) {
        return std::unexpected(error{error_code::empty_result, "No disks to build tables for"});
    }

    std::map<std::string, segment_table> tables;
    for (const auto& [ref, chunks] : index) {
        auto table = build_segment_table(chunks, backing_device, geometry);
        if (!table) {
            return std::unexpected(error{table.error().code(),
                std::format("Disk Ref:{}: {}", ref, table.error().message())});
        }
        tables.emplace(ref, std::move(*table));
    }
    return tables;
}

} // namespace xvadisk
