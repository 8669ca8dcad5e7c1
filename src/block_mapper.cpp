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

#include <xvadisk/block_mapper.hpp>
#include <xvadisk/xvadisk.hpp>

namespace xvadisk {

std::string mapping_name(const std::string &disk_ref) {
    return "xva-" + disk_ref;
}

mapping_session::~mapping_session() {
    if (loop_device_ || !disks_.empty()) {
        // Nothing left to report to at this point
        [[maybe_unused]] auto result = teardown();
    }
}

auto mapping_session::attach(const std::filesystem::path &archive) -> std::expected<std::string, error> {
    if (loop_device_) {
        return std::unexpected(error{error_code::invalid_operation,
            "Archive already attached to " + *loop_device_});
    }

    auto device = mapper_.attach_loop(archive);
    if (!device) {
        return std::unexpected(device.error());
    }

    loop_device_ = *device;
    return *device;
}

auto mapping_session::map_disks(const disk_index &index) -> std::expected<void, error> {
    if (!loop_device_) {
        return std::unexpected(error{error_code::invalid_operation, "No loop device attached"});
    }

    auto tables = build_segment_tables(index, *loop_device_, geometry_);
    if (!tables) {
        return std::unexpected(tables.error());
    }

    std::vector<mapped_disk> pending;
    for (auto& [ref, table] : *tables) {
        const uint64_t total = table.total_sectors();
        pending.push_back(mapped_disk{ref, mapping_name(ref), total, std::move(table)});
    }

    for (auto& disk : pending) {
        if (auto created = mapper_.create_mapping(disk.name, disk.table.to_text()); !created) {
            return std::unexpected(created.error());
        }
        disks_.push_back(std::move(disk));
    }

    return {};
}

auto mapping_session::teardown() -> std::expected<void, error> {
    std::optional<error> first_failure;

    while (!disks_.empty()) {
        if (auto removed = mapper_.remove_mapping(disks_.back().name); !removed && !first_failure) {
            first_failure = removed.error();
        }
        disks_.pop_back();
    }

    if (loop_device_) {
        if (auto detached = mapper_.detach_loop(*loop_device_); !detached && !first_failure) {
            first_failure = detached.error();
        }
        loop_device_.reset();
    }

    if (first_failure) {
        return std::unexpected(*first_failure);
    }
    return {};
}

} // namespace xvadisk
