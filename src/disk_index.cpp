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

#include <xvadisk/disk_index.hpp>
#include <algorithm>

namespace xvadisk {

void disk_chunks::add_chunk(const uint64_t index, const chunk_location location) {
    chunks_.insert_or_assign(index, location);
    mark_index(index);
}

void disk_chunks::mark_index(const uint64_t index) noexcept {
    lowest_ = lowest_ ? std::min(*lowest_, index) : index;
    highest_ = highest_ ? std::max(*highest_, index) : index;
}

auto disk_chunks::find(const uint64_t index) const -> std::optional<chunk_location> {
    if (const auto it = chunks_.find(index); it != chunks_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto disk_index::find(const std::string &ref) const -> const disk_chunks* {
    const auto it = disks_.find(ref);
    return it != disks_.end() ? &it->second : nullptr;
}

} // namespace xvadisk
