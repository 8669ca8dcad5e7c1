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
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace xvadisk::detail {

constexpr size_t BLOCK_SIZE = 512;

// Only name and size are consulted; the rest of the POSIX ustar layout is kept so
// offsets line up with the on-disk record.
struct tar_record {
    char name[100];     // 0-99
    char mode[8];       // 100-107
    char uid[8];        // 108-115
    char gid[8];        // 116-123
    char size[12];      // 124-135
    char mtime[12];     // 136-147
    char checksum[8];   // 148-155
    char typeflag;      // 156
    char linkname[100]; // 157-256
    char magic[6];      // 257-262
    char version[2];    // 263-264
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(tar_record) == BLOCK_SIZE, "tar header record must be exactly 512 bytes");

// Width of the name field the archive writer fills, one short of the full field
constexpr size_t NAME_FIELD_SIZE = 99;
constexpr size_t SIZE_FIELD_OFFSET = 124;
constexpr size_t SIZE_FIELD_DIGITS = 11;

// Parse a fixed-width ASCII octal field. Leading and trailing blanks/NULs are allowed,
// any other non-octal character is a format error.
template<size_t N>
constexpr std::expected<uint64_t, error> parse_octal(std::span<const char, N> field) {
    uint64_t result = 0;
    bool found_digit = false;
    bool finished = false;

    for (char c : field) {
        if (c == '\0' || c == ' ') {
            if (found_digit) finished = true;
            continue;
        }
        if (finished || c < '0' || c > '7') {
            return std::unexpected(error{error_code::format_error, "Invalid octal digit in size field"});
        }
        found_digit = true;

        if (result > (UINT64_MAX >> 3)) {
            return std::unexpected(error{error_code::format_error, "Octal value overflow"});
        }

        result = (result << 3) | static_cast<uint64_t>(c - '0');
    }

    return result;
}

// Bytes needed to pad a payload of the given size out to the next record boundary
[[nodiscard]] constexpr uint64_t record_padding(const uint64_t size) noexcept {
    return ((size + (BLOCK_SIZE - 1)) & ~static_cast<uint64_t>(BLOCK_SIZE - 1)) - size;
}

// A record whose first byte is NUL ends the archive
[[nodiscard]] bool is_terminator(std::span<const std::byte, BLOCK_SIZE> block) noexcept;

// Helper to safely extract a NUL-terminated string from a fixed-size field
[[nodiscard]] std::string_view extract_string(std::span<const char> field);

} // namespace xvadisk::detail
