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

/**
 * xvatodisk - Makes the disks inside an XVA export available as read-only block devices.
 *
 * Usage: xvatodisk -x <archive.xva> [-m <saved.map>] [--refresh] [--dry-run]
 *
 * The archive is attached to one read-only loop device and every disk gets a
 * device-mapper device, /dev/mapper/xva-<ref>, stitched together from the chunks
 * stored in the archive. Mappings stay in place until SIGINT or SIGTERM.
 *
 * Indexing a large archive takes a while, so the index is saved next to it
 * ("<archive>-map" unless -m is given) and reused on the next run.
 */

#include <xvadisk/xvadisk.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <functional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

using xvadisk::error;
using xvadisk::error_code;

struct options {
    std::filesystem::path archive;
    std::filesystem::path cache;
    bool refresh = false;
    bool dry_run = false;
};

void print_usage(const char* program) {
    std::println(stderr, "Usage: {} -x <archive.xva> [-m <saved.map>] [--refresh] [--dry-run]", program);
    std::println(stderr, "");
    std::println(stderr, "  -h, --help     display this help");
    std::println(stderr, "  -x, --xva      path to xva to use");
    std::println(stderr, "  -m, --map      path to map of xva to use or save");
    std::println(stderr, "      --refresh  rescan the xva even if a saved map exists");
    std::println(stderr, "      --dry-run  print the device-mapper tables instead of installing them");
}

std::optional<options> parse_arguments(int argc, char* argv[]) {
    options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if ((arg == "-x" || arg == "--xva") && i + 1 < argc) {
            opts.archive = argv[++i];
        } else if ((arg == "-m" || arg == "--map") && i + 1 < argc) {
            opts.cache = argv[++i];
        } else if (arg == "--refresh") {
            opts.refresh = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else {
            return std::nullopt;
        }
    }

    if (opts.archive.empty()) {
        return std::nullopt;
    }
    if (opts.cache.empty()) {
        opts.cache = xvadisk::default_cache_path(opts.archive);
    }
    return opts;
}

struct file_descriptor {
    int fd = -1;

    file_descriptor() = default;
    explicit file_descriptor(int f) : fd(f) {}
    file_descriptor(const file_descriptor&) = delete;
    file_descriptor& operator=(const file_descriptor&) = delete;
    ~file_descriptor() { reset(); }

    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

// Run a command, feed it input on stdin and return what it wrote to stdout
std::expected<std::string, error> run_command(const std::vector<std::string>& args, std::string_view input = {}) {
    int in_pipe[2];
    int out_pipe[2];
    if (::pipe(in_pipe) != 0) {
        return std::unexpected(error{error_code::io_error, std::format("pipe: {}", std::strerror(errno))});
    }
    file_descriptor in_read{in_pipe[0]}, in_write{in_pipe[1]};
    if (::pipe(out_pipe) != 0) {
        return std::unexpected(error{error_code::io_error, std::format("pipe: {}", std::strerror(errno))});
    }
    file_descriptor out_read{out_pipe[0]}, out_write{out_pipe[1]};

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_read.fd, STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_write.fd, STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, in_write.fd);
    posix_spawn_file_actions_addclose(&actions, out_read.fd);

    // Children start with default signal handling, not the mask this process waits on
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t signals;
    sigemptyset(&signals);
    posix_spawnattr_setsigmask(&attr, &signals);
    sigaddset(&signals, SIGPIPE);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    posix_spawnattr_setsigdefault(&attr, &signals);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int spawned = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    if (spawned != 0) {
        return std::unexpected(error{error_code::io_error,
            std::format("Failed to run {}: {}", args.front(), std::strerror(spawned))});
    }

    in_read.reset();
    out_write.reset();

    while (!input.empty()) {
        const ssize_t written = ::write(in_write.fd, input.data(), input.size());
        if (written < 0) {
            if (errno == EINTR) continue;
            break;
        }
        input.remove_prefix(static_cast<size_t>(written));
    }
    in_write.reset();

    std::string output;
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t got = ::read(out_read.fd, buffer.data(), buffer.size());
        if (got < 0 && errno == EINTR) continue;
        if (got <= 0) break;
        output.append(buffer.data(), static_cast<size_t>(got));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(error{error_code::io_error,
                std::format("waitpid {}: {}", args.front(), std::strerror(errno))});
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::unexpected(error{error_code::io_error,
            std::format("{} exited with status {}", args.front(), WIFEXITED(status) ? WEXITSTATUS(status) : -1)});
    }

    while (!output.empty() && (output.back() == '\n' || output.back() == ' ')) {
        output.pop_back();
    }
    return output;
}

// losetup and dmsetup backed mapper
class dmsetup_mapper : public xvadisk::block_mapper {
public:
    std::expected<std::string, error> attach_loop(const std::filesystem::path& archive) override {
        return run_command({"losetup", "--find", "--show", "--read-only", archive.string()});
    }

    std::expected<void, error> create_mapping(const std::string& name, const std::string& table) override {
        if (auto created = run_command({"dmsetup", "--readonly", "create", name}, table); !created) {
            return std::unexpected(created.error());
        }
        // Partition devices are a convenience; the whole-disk mapping is what matters
        if (auto probed = run_command({"partprobe", "/dev/mapper/" + name}); !probed) {
            std::println(stderr, "warning: partprobe {}: {}", name, probed.error().message());
        }
        return {};
    }

    std::expected<void, error> remove_mapping(const std::string& name) override {
        // Partition mappings hold the disk open, remove them first
        std::vector<std::string> partitions;
        std::error_code ec;
        for (const auto& dev : std::filesystem::directory_iterator{"/dev/mapper", ec}) {
            const auto entry = dev.path().filename().string();
            if (entry.size() > name.size() + 1 && entry.starts_with(name + "p") &&
                std::ranges::all_of(std::string_view{entry}.substr(name.size() + 1),
                                    [](char c) { return c >= '0' && c <= '9'; })) {
                partitions.push_back(entry);
            }
        }
        std::ranges::sort(partitions, std::greater{});

        for (const auto& partition : partitions) {
            if (auto removed = run_command({"dmsetup", "remove", partition}); !removed) {
                return std::unexpected(removed.error());
            }
        }

        if (auto removed = run_command({"dmsetup", "remove", name}); !removed) {
            return std::unexpected(removed.error());
        }
        return {};
    }

    std::expected<void, error> detach_loop(const std::string& device) override {
        if (auto detached = run_command({"losetup", "--detach", device}); !detached) {
            return std::unexpected(detached.error());
        }
        return {};
    }
};

double gigabytes(uint64_t sectors) {
    return static_cast<double>(sectors * xvadisk::SECTOR_SIZE) / (1024.0 * 1024.0 * 1024.0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "-h" || std::string_view{argv[i]} == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    const auto opts = parse_arguments(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    // Block the signals before anything is created so they are only ever seen by sigwait
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    const auto policy = opts->refresh ? xvadisk::cache_policy::refresh : xvadisk::cache_policy::reuse;
    int last_percent = -1;
    auto indexed = xvadisk::load_or_build_index(opts->archive, opts->cache, policy,
        [&last_percent](uint64_t offset, std::optional<uint64_t> total) {
            if (!total || *total == 0) {
                return;
            }
            const int percent = static_cast<int>(offset * 100 / *total);
            if (percent != last_percent) {
                last_percent = percent;
                std::print(stderr, "  - indexing xva: {}%\r", percent);
            }
        });
    if (!indexed) {
        std::println(stderr, "Failed to index {}: {}", opts->archive.string(), indexed.error().message());
        return 1;
    }

    if (indexed->origin == xvadisk::index_origin::scan) {
        std::println(stderr, "  indexing xva complete");
        std::println(stderr, "  map saved to: {}", opts->cache.string());
    }

    if (opts->dry_run) {
        auto tables = xvadisk::build_segment_tables(indexed->index, "<loop>");
        if (!tables) {
            std::println(stderr, "Failed to build tables: {}", tables.error().message());
            return 1;
        }
        for (const auto& [ref, table] : *tables) {
            std::println("# Disk Ref:{} ({:.2f} GB) -> /dev/mapper/{}",
                         ref, gigabytes(table.total_sectors()), xvadisk::mapping_name(ref));
            std::print("{}", table.to_text());
        }
        return 0;
    }

    dmsetup_mapper mapper;
    xvadisk::mapping_session session{mapper};

    auto loop = session.attach(opts->archive);
    if (!loop) {
        std::println(stderr, "Failed to attach {}: {}", opts->archive.string(), loop.error().message());
        return 1;
    }

    if (auto mapped = session.map_disks(indexed->index); !mapped) {
        std::println(stderr, "Failed to map disks: {}", mapped.error().message());
        if (auto cleaned = session.teardown(); !cleaned) {
            std::println(stderr, "Cleanup failed: {}", cleaned.error().message());
        }
        return 1;
    }

    for (const auto& disk : session.disks()) {
        std::println("Disk Ref:{} ({:.2f} GB) -> /dev/mapper/{}",
                     disk.disk_ref, gigabytes(disk.total_sectors), disk.name);
    }

    int received = 0;
    if (const int waited = sigwait(&stop_signals, &received); waited != 0) {
        std::println(stderr, "sigwait: {}", std::strerror(waited));
    }

    std::println("\ncleaning up...");
    if (auto cleaned = session.teardown(); !cleaned) {
        std::println(stderr, "Cleanup failed: {}", cleaned.error().message());
        return 1;
    }

    return 0;
}
