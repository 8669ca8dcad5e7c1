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
#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>

namespace xvadisk {

// Read-only, seekable view of an archive. Offsets are absolute byte positions.
class byte_source {
public:
    virtual ~byte_source() = default;

    // Read up to buffer.size() bytes at the current position, returns actual bytes read
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Seek to absolute position
    [[nodiscard]] virtual std::expected<void, error> seek(uint64_t position) = 0;

    [[nodiscard]] virtual uint64_t position() const = 0;

    // Total size, if known
    [[nodiscard]] virtual std::optional<uint64_t> size() const = 0;
};

// In-memory source, used for archives already held in a buffer
class memory_source : public byte_source {
private:
    std::span<const std::byte> data_;
    uint64_t position_ = 0;

public:
    explicit memory_source(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override;
    [[nodiscard]] uint64_t position() const override { return position_; }
    [[nodiscard]] std::optional<uint64_t> size() const override { return data_.size(); }
};

// File-backed source. Uses 64-bit offsets since exported disks are routinely larger than 2 GiB.
class file_source : public byte_source {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    std::optional<uint64_t> file_size_;

public:
    [[nodiscard]] static std::expected<file_source, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> seek(uint64_t position) override;
    [[nodiscard]] uint64_t position() const override;
    [[nodiscard]] std::optional<uint64_t> size() const override;

private:
    file_source(std::FILE* file, std::optional<uint64_t> size);
};

} // namespace xvadisk
