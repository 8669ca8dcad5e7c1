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

#include <catch2/catch_test_macros.hpp>
#include <xvadisk/index_cache.hpp>
#include <xvadisk/segment_table.hpp>
#include "archive_builder.hpp"
#include <fstream>

using namespace xvadisk;
using xvadisk::testing::archive_builder;
using xvadisk::testing::TempFile;

namespace {

archive_builder sample_archive() {
    archive_builder builder;
    builder.add("ova.xml", 1200)
           .add("Ref:10/00000000", 1048576)
           .add("Ref:10/00000000.checksum", 40)
           .add("Ref:10/00000001", 0)
           .add("Ref:10/00000004", 1048576)
           .add("Ref:10/00000005", 0)
           .add("Ref:3/00000000", 65536)
           .add("Ref:3/00000002", 1048576)
           .terminate();
    return builder;
}

disk_index sample_index(const archive_builder& builder) {
    header_scanner scanner{builder.source()};
    auto index = build_disk_index(scanner);
    REQUIRE(index.has_value());
    return std::move(*index);
}

std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};
    std::vector<char> raw{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    const auto bytes = std::as_bytes(std::span{raw});
    return {bytes.begin(), bytes.end()};
}

} // anonymous namespace

TEST_CASE("Saved index reloads with identical tables", "[index_cache]") {
    const auto builder = sample_archive();
    const auto index = sample_index(builder);
    const archive_identity identity{"/data/exports/vm.xva", builder.size(), 1700000000};

    TempFile cache{".map"};
    REQUIRE(save_index(index, identity, cache.path()).has_value());

    auto loaded = load_index(cache.path());
    REQUIRE(loaded.has_value());
    CHECK(loaded->identity == identity);
    CHECK(loaded->index == index);

    for (const auto& [ref, chunks] : index) {
        const auto* reloaded = loaded->index.find(ref);
        REQUIRE(reloaded != nullptr);

        auto original_table = build_segment_table(chunks, "/dev/loop3");
        auto reloaded_table = build_segment_table(*reloaded, "/dev/loop3");
        REQUIRE(original_table.has_value());
        REQUIRE(reloaded_table.has_value());
        CHECK(original_table->to_text() == reloaded_table->to_text());
    }

    // Empty chunks stay absent, and the empty last chunk still bounds the disk
    const auto* disk10 = loaded->index.find("10");
    REQUIRE(disk10 != nullptr);
    CHECK_FALSE(disk10->contains(1));
    CHECK(disk10->contains(4));
    CHECK(disk10->slot_count() == 6);
}

TEST_CASE("Damaged saved index is rejected", "[index_cache]") {
    const auto builder = sample_archive();
    const auto encoded = detail::encode_index(sample_index(builder), archive_identity{"/a.xva", 1, 2});

    SECTION("Intact") {
        CHECK(detail::decode_index(encoded).has_value());
    }

    SECTION("Wrong magic") {
        auto damaged = encoded;
        damaged[0] = std::byte{'Z'};
        auto result = detail::decode_index(damaged);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_index);
    }

    SECTION("Unknown version") {
        auto damaged = encoded;
        damaged[8] = std::byte{99};
        auto result = detail::decode_index(damaged);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_index);
    }

    SECTION("Flipped payload byte") {
        auto damaged = encoded;
        damaged[damaged.size() - 3] ^= std::byte{0x40};
        auto result = detail::decode_index(damaged);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_index);
    }

    SECTION("Truncated") {
        std::vector<std::byte> damaged{encoded.begin(), encoded.end() - 10};
        auto result = detail::decode_index(damaged);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_index);
        CHECK(result.error().is_io_failure());
    }

    SECTION("Shorter than header") {
        std::vector<std::byte> damaged{encoded.begin(), encoded.begin() + 20};
        auto result = detail::decode_index(damaged);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_index);
    }
}

TEST_CASE("Saved index without disks is rejected", "[index_cache]") {
    const auto encoded = detail::encode_index(disk_index{}, archive_identity{"/a.xva", 1, 2});
    auto decoded = detail::decode_index(encoded);
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error().code() == error_code::corrupt_index);

    const auto builder = sample_archive();
    TempFile archive;
    archive.write_bytes(builder.bytes());
    TempFile cache{".map"};
    auto identity = archive_identity::of(archive.path());
    REQUIRE(identity.has_value());
    REQUIRE(save_index(disk_index{}, *identity, cache.path()).has_value());

    auto loaded = load_index(cache.path());
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code() == error_code::corrupt_index);

    auto reused = load_or_build_index(archive.path(), cache.path(), cache_policy::reuse);
    REQUIRE_FALSE(reused.has_value());
    CHECK(reused.error().code() == error_code::corrupt_index);
}

TEST_CASE("Missing saved index is an I/O error", "[index_cache]") {
    auto result = load_index("/nonexistent/dir/vm.xva-map");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::io_error);
}

TEST_CASE("Default cache path sits next to the archive", "[index_cache]") {
    CHECK(default_cache_path("/data/vm.xva") == std::filesystem::path{"/data/vm.xva-map"});
}

TEST_CASE("Load or build index", "[index_cache]") {
    auto builder = sample_archive();
    TempFile archive;
    archive.write_bytes(builder.bytes());
    TempFile cache{".map"};

    auto first = load_or_build_index(archive.path(), cache.path());
    REQUIRE(first.has_value());
    CHECK(first->origin == index_origin::scan);
    CHECK(first->index.size() == 2);
    CHECK(std::filesystem::exists(cache.path()));

    SECTION("Second run reuses the saved index") {
        auto second = load_or_build_index(archive.path(), cache.path());
        REQUIRE(second.has_value());
        CHECK(second->origin == index_origin::cache);
        CHECK(second->index == first->index);
    }

    SECTION("Refresh rescans") {
        auto refreshed = load_or_build_index(archive.path(), cache.path(), cache_policy::refresh);
        REQUIRE(refreshed.has_value());
        CHECK(refreshed->origin == index_origin::scan);
        CHECK(refreshed->index == first->index);
    }

    SECTION("Changed archive invalidates the saved index") {
        builder.truncate(builder.size() - 1024)
               .add("Ref:3/00000003", 1048576)
               .terminate();
        archive.write_bytes(builder.bytes());

        auto rescanned = load_or_build_index(archive.path(), cache.path());
        REQUIRE(rescanned.has_value());
        CHECK(rescanned->origin == index_origin::scan);
        CHECK(rescanned->index.find("3")->slot_count() == 4);

        auto reused = load_or_build_index(archive.path(), cache.path());
        REQUIRE(reused.has_value());
        CHECK(reused->origin == index_origin::cache);
        CHECK(reused->index == rescanned->index);
    }

    SECTION("Corrupt saved index") {
        auto bytes = read_file(cache.path());
        bytes.resize(bytes.size() / 2);
        cache.write_bytes(bytes);

        auto reused = load_or_build_index(archive.path(), cache.path());
        REQUIRE_FALSE(reused.has_value());
        CHECK(reused.error().code() == error_code::corrupt_index);

        auto refreshed = load_or_build_index(archive.path(), cache.path(), cache_policy::refresh);
        REQUIRE(refreshed.has_value());
        CHECK(refreshed->origin == index_origin::scan);

        auto loaded = load_index(cache.path());
        REQUIRE(loaded.has_value());
        CHECK(loaded->index == first->index);
    }
}

TEST_CASE("Bypass leaves no saved index behind", "[index_cache]") {
    auto builder = sample_archive();
    TempFile archive;
    archive.write_bytes(builder.bytes());
    TempFile cache{".map"};

    auto result = load_or_build_index(archive.path(), cache.path(), cache_policy::bypass);
    REQUIRE(result.has_value());
    CHECK(result->origin == index_origin::scan);
    CHECK_FALSE(std::filesystem::exists(cache.path()));
}

TEST_CASE("Archive without disks saves nothing", "[index_cache]") {
    archive_builder builder;
    builder.add("ova.xml", 100).terminate();
    TempFile archive;
    archive.write_bytes(builder.bytes());
    TempFile cache{".map"};

    auto result = load_or_build_index(archive.path(), cache.path());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::empty_result);
    CHECK_FALSE(std::filesystem::exists(cache.path()));
}
