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

#include <xvadisk/header_scanner.hpp>
#include <bit>
#include <format>

namespace xvadisk {

auto decode_record(std::span<const std::byte, detail::BLOCK_SIZE> block,
                   const uint64_t offset) -> std::expected<header_entry, error> {
    const auto* record = std::bit_cast<const detail::tar_record*>(block.data());

    auto size = detail::parse_octal(std::span<const char, detail::SIZE_FIELD_DIGITS>{
        record->size, detail::SIZE_FIELD_DIGITS});
    if (!size) {
        return std::unexpected(error{size.error().code(),
            std::format("{} in record at offset {}", size.error().message(), offset)});
    }

    header_entry entry;
    entry.name = std::string{detail::extract_string(std::span{record->name, detail::NAME_FIELD_SIZE})};
    entry.payload_size = *size;
    entry.padding_size = detail::record_padding(*size);
    entry.header_offset = offset;
    return entry;
}

auto header_scanner::from_file(const std::filesystem::path &path,
                               const uint64_t start_offset) -> std::expected<header_scanner, error> {
    auto source = file_source::open(path);
    if (!source) {
        return std::unexpected(source.error());
    }

    return header_scanner{std::make_unique<file_source>(std::move(*source)), start_offset};
}

auto header_scanner::from_source(std::unique_ptr<byte_source> source,
                                 const uint64_t start_offset) -> std::expected<header_scanner, error> {
    if (!source) {
        return std::unexpected(error{error_code::invalid_operation, "Null source provided"});
    }

    return header_scanner{std::move(source), start_offset};
}

auto header_scanner::read_record()
    -> std::expected<std::optional<std::array<std::byte, detail::BLOCK_SIZE>>, error> {
    if (const auto total = source_->size(); total) {
        if (offset_ == *total) {
            return std::nullopt;
        }
        if (offset_ > *total) {
            return std::unexpected(error{error_code::io_error,
                std::format("Archive truncated: next record at offset {} is past the end ({} bytes)",
                            offset_, *total)});
        }
    }

    if (auto seek_result = source_->seek(offset_); !seek_result) {
        return std::unexpected(seek_result.error());
    }

    std::array<std::byte, detail::BLOCK_SIZE> block{};
    size_t filled = 0;
    while (filled < block.size()) {
        auto result = source_->read(std::span{block}.subspan(filled));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        filled += *result;
    }

    if (filled == 0) {
        return std::nullopt;
    }
    if (filled != block.size()) {
        return std::unexpected(error{error_code::io_error,
            std::format("Incomplete header record at offset {}: read {} of {} bytes",
                        offset_, filled, detail::BLOCK_SIZE)});
    }

    return block;
}

auto header_scanner::next_entry() -> std::expected<std::optional<header_entry>, error> {
    if (finished_) {
        return std::nullopt;
    }

    auto block = read_record();
    if (!block) {
        return std::unexpected(block.error());
    }

    if (!*block || detail::is_terminator(**block)) {
        finished_ = true;
        return std::nullopt;
    }

    auto entry = decode_record(**block, offset_);
    if (!entry) {
        return std::unexpected(entry.error());
    }

    offset_ = entry->next_offset();
    return std::move(*entry);
}

} // namespace xvadisk
