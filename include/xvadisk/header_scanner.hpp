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
#include <xvadisk/header_record.hpp>
#include <xvadisk/source.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace xvadisk {

// One decoded header record. The payload is never read, only located.
struct header_entry {
    std::string name;           // Name field with the NUL padding stripped
    uint64_t payload_size = 0;
    uint64_t padding_size = 0;
    uint64_t header_offset = 0; // Offset of the 512-byte record itself

    [[nodiscard]] uint64_t payload_offset() const noexcept {
        return header_offset + detail::BLOCK_SIZE;
    }

    [[nodiscard]] uint64_t next_offset() const noexcept {
        return payload_offset() + payload_size + padding_size;
    }
};

// Decode a single record. Callers check for the terminator first.
[[nodiscard]] std::expected<header_entry, error> decode_record(
    std::span<const std::byte, detail::BLOCK_SIZE> block, uint64_t offset);

// Walks the header records of an archive. The scanner owns the source and its
// cursor; nothing else may move it between calls to next_entry().
class header_scanner {
private:
    std::unique_ptr<byte_source> source_;
    uint64_t offset_ = 0;
    bool finished_ = false;

    [[nodiscard]] std::expected<std::optional<std::array<std::byte, detail::BLOCK_SIZE>>, error> read_record();

public:
    explicit header_scanner(std::unique_ptr<byte_source> source, const uint64_t start_offset = 0)
        : source_(std::move(source)), offset_(start_offset) {}

    [[nodiscard]] static std::expected<header_scanner, error> from_file(
        const std::filesystem::path& path, uint64_t start_offset = 0);
    [[nodiscard]] static std::expected<header_scanner, error> from_source(
        std::unique_ptr<byte_source> source, uint64_t start_offset = 0);

    // Next header, or nullopt once the terminator or the end of the source is reached
    [[nodiscard]] std::expected<std::optional<header_entry>, error> next_entry();

    // Offset the next record would be read from
    [[nodiscard]] uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::optional<uint64_t> source_size() const { return source_->size(); }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    // Input iterator over the remaining entries. Iteration stops on the first error,
    // which is kept in the iterator and can be retrieved with error().
    class iterator {
    private:
        header_scanner* scanner_ = nullptr;
        std::optional<header_entry> current_;
        std::optional<xvadisk::error> error_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = header_entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const header_entry*;
        using reference = const header_entry&;

        iterator() = default;
        explicit iterator(header_scanner* scanner) : scanner_(scanner) {
            ++(*this);
        }

        [[nodiscard]] const header_entry& operator*() const { return *current_; }
        [[nodiscard]] const header_entry* operator->() const { return &*current_; }

        iterator& operator++() {
            if (scanner_) {
                if (auto result = scanner_->next_entry(); result && *result) {
                    current_ = std::move(**result);
                } else {
                    if (!result) {
                        error_ = result.error();
                    }
                    scanner_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return scanner_ == other.scanner_;
        }

        [[nodiscard]] bool has_error() const noexcept { return error_.has_value(); }
        [[nodiscard]] const std::optional<xvadisk::error>& error() const noexcept { return error_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }
};

} // namespace xvadisk
