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
#include <xvadisk/block_mapper.hpp>
#include <set>
#include <string>
#include <vector>

using namespace xvadisk;

namespace {

// Records every call instead of touching the system
class recording_mapper : public block_mapper {
public:
    std::vector<std::string> calls;
    std::vector<std::string> tables;
    std::set<std::string> fail_create;
    std::set<std::string> fail_remove;
    bool fail_attach = false;
    bool fail_detach = false;

    std::expected<std::string, error> attach_loop(const std::filesystem::path& archive) override {
        calls.push_back("attach " + archive.string());
        if (fail_attach) {
            return std::unexpected(error{error_code::io_error, "losetup failed"});
        }
        return std::string{"/dev/loop7"};
    }

    std::expected<void, error> create_mapping(const std::string& name, const std::string& table) override {
        calls.push_back("create " + name);
        if (fail_create.contains(name)) {
            return std::unexpected(error{error_code::io_error, "dmsetup create failed"});
        }
        tables.push_back(table);
        return {};
    }

    std::expected<void, error> remove_mapping(const std::string& name) override {
        calls.push_back("remove " + name);
        if (fail_remove.contains(name)) {
            return std::unexpected(error{error_code::io_error, "dmsetup remove failed: " + name});
        }
        return {};
    }

    std::expected<void, error> detach_loop(const std::string& device) override {
        calls.push_back("detach " + device);
        if (fail_detach) {
            return std::unexpected(error{error_code::io_error, "losetup detach failed"});
        }
        return {};
    }
};

disk_index two_disks() {
    disk_index index;
    auto& first = index.disk("1");
    first.add_chunk(0, chunk_location{1024, 1048576});
    first.add_chunk(2, chunk_location{2099200, 1048576});

    auto& second = index.disk("2");
    second.add_chunk(0, chunk_location{3148800, 1048576});
    return index;
}

} // anonymous namespace

TEST_CASE("Map every disk of an archive", "[mapping]") {
    recording_mapper mapper;
    mapping_session session{mapper};

    auto loop = session.attach("/data/vm.xva");
    REQUIRE(loop.has_value());
    CHECK(*loop == "/dev/loop7");
    CHECK(session.loop_device() == "/dev/loop7");

    REQUIRE(session.map_disks(two_disks()).has_value());

    REQUIRE(session.disks().size() == 2);
    CHECK(session.disks()[0].name == "xva-1");
    CHECK(session.disks()[0].total_sectors == 3 * 2048);
    CHECK(session.disks()[1].name == "xva-2");
    CHECK(session.disks()[1].total_sectors == 2048);

    REQUIRE(mapper.tables.size() == 2);
    CHECK(mapper.tables[0] ==
          "0 2048 linear /dev/loop7 2\n"
          "2048 2048 zero\n"
          "4096 2048 linear /dev/loop7 4100\n");

    REQUIRE(session.teardown().has_value());
    CHECK(mapper.calls == std::vector<std::string>{
        "attach /data/vm.xva",
        "create xva-1",
        "create xva-2",
        "remove xva-2",
        "remove xva-1",
        "detach /dev/loop7"
    });
    CHECK_FALSE(session.loop_device().has_value());
    CHECK(session.disks().empty());

    // Nothing left to undo
    REQUIRE(session.teardown().has_value());
    CHECK(mapper.calls.size() == 6);
}

TEST_CASE("Mapping requires an attached archive", "[mapping]") {
    recording_mapper mapper;
    mapping_session session{mapper};

    auto result = session.map_disks(two_disks());
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::invalid_operation);
    CHECK(mapper.calls.empty());
}

TEST_CASE("Archive is attached only once", "[mapping]") {
    recording_mapper mapper;
    mapping_session session{mapper};

    REQUIRE(session.attach("/data/vm.xva").has_value());
    auto again = session.attach("/data/vm.xva");
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code() == error_code::invalid_operation);
}

TEST_CASE("Failed attach leaves nothing to tear down", "[mapping]") {
    recording_mapper mapper;
    mapper.fail_attach = true;
    mapping_session session{mapper};

    REQUIRE_FALSE(session.attach("/data/vm.xva").has_value());
    REQUIRE(session.teardown().has_value());
    CHECK(mapper.calls == std::vector<std::string>{"attach /data/vm.xva"});
}

TEST_CASE("Malformed disk installs nothing", "[mapping]") {
    recording_mapper mapper;
    mapping_session session{mapper};
    REQUIRE(session.attach("/data/vm.xva").has_value());

    auto index = two_disks();
    index.disk("3").add_chunk(0, chunk_location{700, 1048576});

    auto result = session.map_disks(index);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::format_error);
    CHECK(result.error().message().find("Ref:3") != std::string::npos);
    CHECK(mapper.tables.empty());
    CHECK(session.disks().empty());
}

TEST_CASE("Empty index is refused before anything is installed", "[mapping]") {
    recording_mapper mapper;
    mapping_session session{mapper};
    REQUIRE(session.attach("/data/vm.xva").has_value());

    auto result = session.map_disks(disk_index{});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::empty_result);
    CHECK(mapper.tables.empty());
}

TEST_CASE("Partial mapping is undone by teardown", "[mapping]") {
    recording_mapper mapper;
    mapper.fail_create.insert("xva-2");
    mapping_session session{mapper};
    REQUIRE(session.attach("/data/vm.xva").has_value());

    auto result = session.map_disks(two_disks());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(session.disks().size() == 1);

    REQUIRE(session.teardown().has_value());
    CHECK(mapper.calls.back() == "detach /dev/loop7");
    CHECK(mapper.calls[mapper.calls.size() - 2] == "remove xva-1");
}

TEST_CASE("Teardown keeps going past failures", "[mapping]") {
    recording_mapper mapper;
    mapper.fail_remove.insert("xva-2");
    mapper.fail_detach = true;
    mapping_session session{mapper};
    REQUIRE(session.attach("/data/vm.xva").has_value());
    REQUIRE(session.map_disks(two_disks()).has_value());

    auto result = session.teardown();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message() == "dmsetup remove failed: xva-2");

    CHECK(mapper.calls.back() == "detach /dev/loop7");
    CHECK(mapper.calls[mapper.calls.size() - 2] == "remove xva-1");
    CHECK(session.disks().empty());
    CHECK_FALSE(session.loop_device().has_value());
}

TEST_CASE("Session tears down when it goes out of scope", "[mapping]") {
    recording_mapper mapper;
    {
        mapping_session session{mapper};
        REQUIRE(session.attach("/data/vm.xva").has_value());
        REQUIRE(session.map_disks(two_disks()).has_value());
    }

    CHECK(mapper.calls.back() == "detach /dev/loop7");
    CHECK(mapper.calls.size() == 6);
}
