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

#include <expected>
#include <string>
#include <system_error>

namespace xvadisk {

enum class error_code {
    io_error,
    format_error,
    empty_result,
    corrupt_index,
    invalid_operation
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    // A damaged cache artifact is reported to callers the same way as a failed read
    [[nodiscard]] bool is_io_failure() const noexcept {
        return code_ == error_code::io_error || code_ == error_code::corrupt_index;
    }

private:
    error_code code_;
    std::string message_;
};

[[nodiscard]] inline std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::io_error: return "I/O error";
        case error_code::format_error: return "format error";
        case error_code::empty_result: return "no disks found";
        case error_code::corrupt_index: return "corrupt index";
        case error_code::invalid_operation: return "invalid operation";
    }
    return "unknown error";
}

} // namespace xvadisk
