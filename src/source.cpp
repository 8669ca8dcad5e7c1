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

#include <xvadisk/source.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <sys/types.h>

namespace xvadisk {

auto memory_source::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const uint64_t available = data_.size() - std::min<uint64_t>(position_, data_.size());
    const size_t to_read = static_cast<size_t>(std::min<uint64_t>(buffer.size(), available));

    std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                        static_cast<std::ptrdiff_t>(to_read), buffer.begin());
    position_ += to_read;

    return to_read;
}

auto memory_source::seek(const uint64_t position) -> std::expected<void, error> {
    if (position > data_.size()) {
        return std::unexpected(error{error_code::io_error, "Seek past end of source"});
    }
    position_ = position;
    return {};
}

file_source::file_source(std::FILE* file, const std::optional<uint64_t> size)
    : file_(file), file_size_(size) {}

auto file_source::open(const std::filesystem::path &path) -> std::expected<file_source, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open " + path.string() + ": " + std::string{std::strerror(errno)}});
    }

    std::optional<uint64_t> file_size;
    if (::fseeko(file, 0, SEEK_END) == 0) {
        if (const off_t pos = ::ftello(file); pos >= 0) {
            file_size = static_cast<uint64_t>(pos);
        }
    }
    if (::fseeko(file, 0, SEEK_SET) != 0) {
        std::fclose(file);
        return std::unexpected(error{error_code::io_error,
            "Failed to rewind " + path.string() + ": " + std::string{std::strerror(errno)}});
    }

    return file_source{file, file_size};
}

auto file_source::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read < buffer.size() && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_source::seek(const uint64_t position) -> std::expected<void, error> {
    if (::fseeko(file_.get(), static_cast<off_t>(position), SEEK_SET) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

uint64_t file_source::position() const {
    const off_t pos = ::ftello(file_.get());
    return pos >= 0 ? static_cast<uint64_t>(pos) : 0;
}

auto file_source::size() const -> std::optional<uint64_t> {
    return file_size_;
}

} // namespace xvadisk
