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
#include <xvadisk/segment_table.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xvadisk {

// The operating system side of presenting disks: a read-only loop device over the
// archive and one device-mapper device per disk.
class block_mapper {
public:
    virtual ~block_mapper() = default;

    // Attach the archive read-only, returns the loop device path
    [[nodiscard]] virtual std::expected<std::string, error> attach_loop(const std::filesystem::path& archive) = 0;

    // Install a read-only mapping called name from table text
    [[nodiscard]] virtual std::expected<void, error> create_mapping(const std::string& name, const std::string& table) = 0;

    [[nodiscard]] virtual std::expected<void, error> remove_mapping(const std::string& name) = 0;

    [[nodiscard]] virtual std::expected<void, error> detach_loop(const std::string& device) = 0;
};

struct mapped_disk {
    std::string disk_ref;
    std::string name;          // device-mapper name, "xva-<ref>"
    uint64_t total_sectors = 0;
    segment_table table;
};

// Tracks everything created for one archive so it can be torn down in reverse
// order. Resources are registered as soon as they exist.
class mapping_session {
private:
    block_mapper& mapper_;
    std::optional<std::string> loop_device_;
    std::vector<mapped_disk> disks_;
    table_geometry geometry_;

public:
    explicit mapping_session(block_mapper& mapper, const table_geometry& geometry = {})
        : mapper_(mapper), geometry_(geometry) {}

    ~mapping_session();

    mapping_session(const mapping_session&) = delete;
    mapping_session& operator=(const mapping_session&) = delete;

    [[nodiscard]] std::expected<std::string, error> attach(const std::filesystem::path& archive);

    // Build and install one table per disk. Tables are all built before anything
    // is installed, so a malformed disk leaves the system untouched.
    [[nodiscard]] std::expected<void, error> map_disks(const disk_index& index);

    // Remove mappings newest first, then detach the loop device. Keeps going past
    // individual failures and returns the first one.
    [[nodiscard]] std::expected<void, error> teardown();

    [[nodiscard]] const std::optional<std::string>& loop_device() const noexcept { return loop_device_; }
    [[nodiscard]] const std::vector<mapped_disk>& disks() const noexcept { return disks_; }
};

// Device-mapper name for a disk
[[nodiscard]] std::string mapping_name(const std::string& disk_ref);

} // namespace xvadisk
