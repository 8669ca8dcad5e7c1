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

#include <xvadisk/index_cache.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

namespace xvadisk {

namespace {

constexpr char INDEX_MAGIC[8] = {'X', 'V', 'A', 'I', 'D', 'X', '\0', '\0'};

template<typename T>
T to_little_endian(T value) {
    if constexpr (std::endian::native == std::endian::big) {
        return std::byteswap(value);
    }
    return value;
}

class byte_writer {
private:
    std::vector<std::byte>& out_;

public:
    explicit byte_writer(std::vector<std::byte>& out) : out_(out) {}

    template<typename T>
    void put(const T value) {
        const auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(to_little_endian(value));
        out_.insert(out_.end(), raw.begin(), raw.end());
    }

    void put_string(std::string_view text) {
        put(static_cast<uint32_t>(text.size()));
        const auto* bytes = reinterpret_cast<const std::byte*>(text.data());
        out_.insert(out_.end(), bytes, bytes + text.size());
    }
};

class byte_reader {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit byte_reader(std::span<const std::byte> data) : data_(data) {}

    template<typename T>
    std::expected<T, error> get() {
        if (data_.size() - position_ < sizeof(T)) {
            return std::unexpected(error{error_code::corrupt_index, "Saved index is truncated"});
        }
        std::array<std::byte, sizeof(T)> raw{};
        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), sizeof(T), raw.begin());
        position_ += sizeof(T);
        return to_little_endian(std::bit_cast<T>(raw));
    }

    std::expected<std::string, error> get_string() {
        auto length = get<uint32_t>();
        if (!length) {
            return std::unexpected(length.error());
        }
        if (data_.size() - position_ < *length) {
            return std::unexpected(error{error_code::corrupt_index, "Saved index string runs past the end"});
        }
        std::string text(reinterpret_cast<const char*>(data_.data() + position_), *length);
        position_ += *length;
        return text;
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - position_; }
};

uint64_t payload_checksum(std::span<const std::byte> payload) {
    uint64_t sum = 0;
    for (auto byte : payload) {
        sum += static_cast<uint8_t>(byte);
    }
    return sum;
}

} // anonymous namespace

auto archive_identity::of(const std::filesystem::path &archive) -> std::expected<archive_identity, error> {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(archive, ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Failed to resolve " + archive.string() + ": " + ec.message()});
    }

    const auto size = std::filesystem::file_size(absolute, ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Failed to stat " + archive.string() + ": " + ec.message()});
    }

    const auto modified = std::filesystem::last_write_time(absolute, ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error,
            "Failed to stat " + archive.string() + ": " + ec.message()});
    }

    return archive_identity{
        absolute.lexically_normal().string(),
        static_cast<uint64_t>(size),
        static_cast<int64_t>(modified.time_since_epoch().count())
    };
}

namespace detail {

std::vector<std::byte> encode_index(const disk_index &index, const archive_identity &identity) {
    std::vector<std::byte> payload;
    byte_writer writer{payload};

    writer.put_string(identity.path);
    for (const auto& [ref, chunks] : index) {
        writer.put_string(ref);
        writer.put(static_cast<uint8_t>(chunks.lowest_index().has_value()));
        writer.put(chunks.lowest_index().value_or(0));
        writer.put(chunks.highest_index().value_or(0));
        writer.put(static_cast<uint64_t>(chunks.chunks().size()));
        for (const auto& [chunk_index, location] : chunks.chunks()) {
            writer.put(chunk_index);
            writer.put(location.offset);
            writer.put(location.size);
        }
    }

    index_file_header header{};
    std::memcpy(header.magic, INDEX_MAGIC, sizeof(header.magic));
    header.version = to_little_endian(INDEX_FORMAT_VERSION);
    header.disk_count = to_little_endian(static_cast<uint32_t>(index.size()));
    header.archive_size = to_little_endian(identity.size);
    header.archive_modified = to_little_endian(identity.modified);
    header.payload_size = to_little_endian(static_cast<uint64_t>(payload.size()));
    header.checksum = to_little_endian(payload_checksum(payload));

    const auto raw = std::bit_cast<std::array<std::byte, sizeof(index_file_header)>>(header);

    std::vector<std::byte> out;
    out.reserve(raw.size() + payload.size());
    out.insert(out.end(), raw.begin(), raw.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

auto decode_index(std::span<const std::byte> data) -> std::expected<decoded_index, error> {
    if (data.size() < sizeof(index_file_header)) {
        return std::unexpected(error{error_code::corrupt_index, "Saved index is shorter than its header"});
    }

    std::array<std::byte, sizeof(index_file_header)> raw{};
    std::ranges::copy_n(data.begin(), raw.size(), raw.begin());
    const auto header = std::bit_cast<index_file_header>(raw);

    if (std::memcmp(header.magic, INDEX_MAGIC, sizeof(header.magic)) != 0) {
        return std::unexpected(error{error_code::corrupt_index, "Not a saved disk index"});
    }
    if (const auto version = to_little_endian(header.version); version != INDEX_FORMAT_VERSION) {
        return std::unexpected(error{error_code::corrupt_index,
            std::format("Unsupported index format version {}", version)});
    }

    const auto payload = data.subspan(sizeof(index_file_header));
    if (payload.size() != to_little_endian(header.payload_size)) {
        return std::unexpected(error{error_code::corrupt_index, "Saved index size mismatch"});
    }
    if (payload_checksum(payload) != to_little_endian(header.checksum)) {
        return std::unexpected(error{error_code::corrupt_index, "Saved index checksum mismatch"});
    }

    decoded_index result;
    result.identity.size = to_little_endian(header.archive_size);
    result.identity.modified = to_little_endian(header.archive_modified);

    byte_reader reader{payload};
    auto path = reader.get_string();
    if (!path) {
        return std::unexpected(path.error());
    }
    result.identity.path = std::move(*path);

    const uint32_t disk_count = to_little_endian(header.disk_count);
    if (disk_count == 0) {
        return std::unexpected(error{error_code::corrupt_index, "Saved index holds no disks"});
    }
    for (uint32_t d = 0; d < disk_count; ++d) {
        auto ref = reader.get_string();
        auto has_extent = reader.get<uint8_t>();
        auto lowest = reader.get<uint64_t>();
        auto highest = reader.get<uint64_t>();
        auto count = reader.get<uint64_t>();
        if (!ref || !has_extent || !lowest || !highest || !count) {
            return std::unexpected(error{error_code::corrupt_index, "Saved index disk record is truncated"});
        }
        if (result.index.find(*ref)) {
            return std::unexpected(error{error_code::corrupt_index, "Duplicate disk " + *ref + " in saved index"});
        }
        if (*count > reader.remaining() / (3 * sizeof(uint64_t))) {
            return std::unexpected(error{error_code::corrupt_index, "Saved index chunk count is out of range"});
        }

        auto& chunks = result.index.disk(*ref);
        if (*has_extent) {
            if (*lowest > *highest) {
                return std::unexpected(error{error_code::corrupt_index, "Saved index extent is inverted"});
            }
            chunks.mark_index(*lowest);
            chunks.mark_index(*highest);
        }

        for (uint64_t c = 0; c < *count; ++c) {
            auto chunk_index = reader.get<uint64_t>();
            auto offset = reader.get<uint64_t>();
            auto size = reader.get<uint64_t>();
            if (!chunk_index || !offset || !size) {
                return std::unexpected(error{error_code::corrupt_index, "Saved index chunk record is truncated"});
            }
            if (*size == 0 || !*has_extent || *chunk_index < *lowest || *chunk_index > *highest) {
                return std::unexpected(error{error_code::corrupt_index,
                    std::format("Saved index chunk {} of disk {} is invalid", *chunk_index, *ref)});
            }
            chunks.add_chunk(*chunk_index, chunk_location{*offset, *size});
        }
    }

    if (reader.remaining() != 0) {
        return std::unexpected(error{error_code::corrupt_index, "Trailing data after saved index"});
    }

    return result;
}

} // namespace detail

auto save_index(const disk_index &index, const archive_identity &identity,
                const std::filesystem::path &path) -> std::expected<void, error> {
    const auto data = detail::encode_index(index, identity);

    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file{temp_path, std::ios::binary | std::ios::trunc};
        if (!file) {
            return std::unexpected(error{error_code::io_error,
                "Failed to create index file: " + temp_path.string()});
        }

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return std::unexpected(error{error_code::io_error,
                "Failed to write index file: " + temp_path.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return std::unexpected(error{error_code::io_error,
            "Failed to replace index file " + path.string() + ": " + ec.message()});
    }

    return {};
}

auto load_index(const std::filesystem::path &path) -> std::expected<detail::decoded_index, error> {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open index file: " + path.string()});
    }

    std::vector<char> raw{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    if (file.bad()) {
        return std::unexpected(error{error_code::io_error,
            "Failed to read index file: " + path.string()});
    }

    auto decoded = detail::decode_index(std::as_bytes(std::span{raw}));
    if (!decoded) {
        return std::unexpected(error{decoded.error().code(),
            decoded.error().message() + " (" + path.string() + ")"});
    }
    return decoded;
}

std::filesystem::path default_cache_path(const std::filesystem::path &archive) {
    auto path = archive;
    path += "-map";
    return path;
}

auto load_or_build_index(const std::filesystem::path &archive,
                         const std::filesystem::path &cache,
                         const cache_policy policy,
                         const progress_fn &progress) -> std::expected<index_result, error> {
    auto identity = archive_identity::of(archive);
    if (!identity) {
        return std::unexpected(identity.error());
    }

    if (policy == cache_policy::reuse) {
        std::error_code ec;
        if (std::filesystem::exists(cache, ec)) {
            auto cached = load_index(cache);
            if (!cached) {
                return std::unexpected(cached.error());
            }
            if (cached->identity == *identity) {
                return index_result{std::move(cached->index), index_origin::cache};
            }
            // Stale: the archive changed or the cache belongs to another archive
        }
    }

    auto index = build_disk_index(archive, progress);
    if (!index) {
        return std::unexpected(index.error());
    }

    if (policy != cache_policy::bypass) {
        if (auto saved = save_index(*index, *identity, cache); !saved) {
            return std::unexpected(saved.error());
        }
    }

    return index_result{std::move(*index), index_origin::scan};
}

} // namespace xvadisk
