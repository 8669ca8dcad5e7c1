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

/**
 * xva_info - Lists the header records of an XVA archive and summarises the disks in it.
 *
 * Usage: ./xva_info [--entries] <archive.xva>
 *
 * Features demonstrated:
 * - Iterating header records without reading payloads
 * - Building the per-disk chunk index
 * - Disk size and sparseness from the index
 */

#include <xvadisk/xvadisk.hpp>
#include <print>
#include <string_view>

int main(int argc, char* argv[]) {
    const bool list_entries = argc == 3 && std::string_view{argv[1]} == "--entries";
    if (argc != 2 && !list_entries) {
        std::println(stderr, "Usage: {} [--entries] <archive.xva>", argv[0]);
        return 1;
    }
    const char* path = argv[argc - 1];

    if (list_entries) {
        auto scanner = xvadisk::open_archive(path);
        if (!scanner) {
            std::println(stderr, "Failed to open archive: {}", scanner.error().message());
            return 1;
        }

        auto it = scanner->begin();
        for (; it != scanner->end(); ++it) {
            std::println("{:>14} {:>10} {}", it->header_offset, it->payload_size, it->name);
        }
        if (it.has_error()) {
            std::println(stderr, "Scan stopped: {}", it.error()->message());
            return 1;
        }
        std::println("");
    }

    auto index = xvadisk::build_disk_index(path);
    if (!index) {
        std::println(stderr, "Failed to index archive: {}", index.error().message());
        return 1;
    }

    for (const auto& [ref, chunks] : *index) {
        const auto logical = chunks.logical_size();
        const auto stored = chunks.stored_size();
        std::println("Disk Ref:{}: {} chunks, {} with data, {} of {} bytes stored ({:.1f}%)",
                     ref, chunks.slot_count(), chunks.chunks().size(), stored, logical,
                     logical ? static_cast<double>(stored) * 100.0 / static_cast<double>(logical) : 0.0);
    }

    return 0;
}
