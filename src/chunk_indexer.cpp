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

#include <xvadisk/chunk_indexer.hpp>
#include <algorithm>
#include <charconv>
#include <format>

namespace xvadisk {

namespace {

constexpr std::string_view REF_PREFIX = "Ref:";

bool all_digits(std::string_view text) {
    return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
}

} // anonymous namespace

auto parse_chunk_name(std::string_view name) -> std::optional<chunk_name> {
    if (!name.starts_with(REF_PREFIX)) {
        return std::nullopt;
    }
    name.remove_prefix(REF_PREFIX.size());

    const auto slash = name.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view ref = name.substr(0, slash);
    const std::string_view index = name.substr(slash + 1);

    // Checksum companions ("Ref:1/00000000.checksum") fail here and are skipped
    if (!all_digits(ref) || !all_digits(index)) {
        return std::nullopt;
    }

    uint64_t chunk_index = 0;
    if (std::from_chars(index.data(), index.data() + index.size(), chunk_index).ec != std::errc{}) {
        return std::nullopt;
    }

    return chunk_name{std::string{ref}, chunk_index};
}

auto index_entries(header_scanner &scanner, disk_index &index,
                   const progress_fn &progress) -> std::expected<void, error> {
    const auto total = scanner.source_size();

    while (true) {
        if (progress) {
            progress(scanner.offset(), total);
        }

        auto entry = scanner.next_entry();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            break;
        }

        const auto name = parse_chunk_name((*entry)->name);
        if (!name) {
            continue;
        }

        auto& disk = index.disk(name->disk_ref);
        if ((*entry)->payload_size == 0) {
            // Empty chunks read back as zeros; only the extent they imply is kept
            disk.mark_index(name->chunk_index);
            continue;
        }

        disk.add_chunk(name->chunk_index, chunk_location{(*entry)->payload_offset(), (*entry)->payload_size});
    }

    return {};
}

auto build_disk_index(header_scanner &scanner,
                      const progress_fn &progress) -> std::expected<disk_index, error> {
    disk_index index;
    if (auto result = index_entries(scanner, index, progress); !result) {
        return std::unexpected(result.error());
    }

    if (index.empty()) {
        return std::unexpected(error{error_code::empty_result,
            std::format("No disks found in archive ({} bytes scanned)", scanner.offset())});
    }

    return index;
}

auto build_disk_index(const std::filesystem::path &archive,
                      const progress_fn &progress) -> std::expected<disk_index, error> {
    auto scanner = header_scanner::from_file(archive);
    if (!scanner) {
        return std::unexpected(scanner.error());
    }

    auto index = build_disk_index(*scanner, progress);
    if (!index && index.error().code() == error_code::empty_result) {
        return std::unexpected(error{error_code::empty_result,
            "No disks were found in " + archive.string()});
    }
    return index;
}

} // namespace xvadisk
