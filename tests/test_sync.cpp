#include "enumerator.hpp"
#include "sync.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <csignal>
#include <sys/resource.h>

namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& tag) {
        auto base = fs::temp_directory_path();
        path = base / fs::path("scxsync_test_" + tag + "_" +
                               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

class FixtureEnumerator : public scxsync::TrackedFileEnumerator {
public:
    explicit FixtureEnumerator(std::map<std::string, std::vector<std::string>> files) : files_(std::move(files)) {}

    std::vector<std::string> list(const std::vector<std::string>& pathspecs) override {
        std::vector<std::string> out;
        for (const auto& spec : pathspecs) {
            auto it = files_.find(spec);
            if (it != files_.end()) {
                out.insert(out.end(), it->second.begin(), it->second.end());
            }
        }
        return out;
    }

private:
    std::map<std::string, std::vector<std::string>> files_;
};

void write_text(const fs::path& file, const std::string& content) {
    fs::create_directories(file.parent_path());
    std::ofstream output(file, std::ios::binary);
    output << content;
}

std::string read_text(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

const std::string kManifest =
    "[package]\n"
    "name = \"schedX\"\n"
    "\n"
    "[dependencies]\n"
    "anyhow = \"1.0\"\n"
    "scx_utils = { path = \"../../rust/scx_utils\", version = \"1.0.2\" }\n";

const std::string kSyncedManifest =
    "[package]\n"
    "name = \"schedX\"\n"
    "\n"
    "[dependencies]\n"
    "anyhow = \"1.0\"\n"
    "scx_utils = \"1.0.2\"\n";

// Source repository laid out like the end-to-end scenario.
struct Fixture {
    TempDir source{"src"};
    TempDir kernel{"kernel"};
    FixtureEnumerator enumerator{{
        {"include", {"include/a.h", "include/vmlinux/vmlinux.h"}},
        {"grpA", {"grpA/s1.c", "grpA/meson.build"}},
        {"rust-user", {"rust-user/schedX/Cargo.toml", "rust-user/schedY/Cargo.toml"}},
    }};
    scxsync::SyncOptions options;

    Fixture() {
        options.downstream_subdir = "kernel";
        options.mapper.broad_group = "grpA";
        options.mapper.narrow_allow_list = {"schedX"};

        write_text(source.path / "include/a.h", "#define A 1\n");
        write_text(source.path / "include/vmlinux/vmlinux.h", "/* generated */\n");
        write_text(source.path / "grpA/s1.c", "int s1;\n");
        write_text(source.path / "grpA/meson.build", "project('x')\n");
        write_text(source.path / "rust-user/schedX/Cargo.toml", kManifest);
        write_text(source.path / "rust-user/schedY/Cargo.toml", kManifest);
    }

    fs::path dest(const std::string& rel) const { return kernel.path / "kernel" / rel; }

    scxsync::SyncStats run() {
        scxsync::TreeSyncer syncer(options);
        return syncer.synchronize(enumerator, source.path, kernel.path);
    }
};

void test_missing_destination_blocks_all_writes() {
    Fixture fx;
    write_text(fx.dest("include/a.h"), "stale\n");
    write_text(fx.dest("schedX/Cargo.toml"), "stale\n");

    bool thrown = false;
    try {
        fx.run();
    } catch (const scxsync::MissingDestinationsError& ex) {
        thrown = true;
        assert(ex.missing().size() == 1);
        assert(ex.missing().front() == fx.dest("s1.c"));
    }
    assert(thrown);

    assert(read_text(fx.dest("include/a.h")) == "stale\n");
    assert(read_text(fx.dest("schedX/Cargo.toml")) == "stale\n");
    assert(!fs::exists(fx.dest("s1.c")));
    assert(!fs::exists(fx.dest("schedY/Cargo.toml")));
}

void test_every_missing_destination_reported() {
    Fixture fx;

    bool thrown = false;
    try {
        fx.run();
    } catch (const scxsync::MissingDestinationsError& ex) {
        thrown = true;
        const std::vector<fs::path> expected{
            fx.dest("include/a.h"),
            fx.dest("s1.c"),
            fx.dest("schedX/Cargo.toml"),
        };
        assert(ex.missing() == expected);
    }
    assert(thrown);
}

void test_sync_then_idempotent() {
    Fixture fx;
    write_text(fx.dest("include/a.h"), "#define A 0\n");
    write_text(fx.dest("s1.c"), "int s1;\n");
    write_text(fx.dest("schedX/Cargo.toml"), kManifest);

    const auto unchanged_mtime = fs::last_write_time(fx.dest("s1.c"));

    auto first = fx.run();
    scxsync::print_report(first);

    assert(first.total_mappings == 3);
    assert(first.files_copied == 2);
    assert(first.files_skipped == 1);
    assert(first.headers_copied == 1);
    assert(first.sources_copied == 1);
    assert(first.copied_entries.size() == 2);
    assert(first.copied_entries[0].source == fs::path("include/a.h"));
    assert(!first.copied_entries[0].rewritten);
    assert(first.copied_entries[1].source == fs::path("rust-user/schedX/Cargo.toml"));
    assert(first.copied_entries[1].rewritten);

    assert(read_text(fx.dest("include/a.h")) == "#define A 1\n");
    assert(read_text(fx.dest("schedX/Cargo.toml")) == kSyncedManifest);
    assert(fs::last_write_time(fx.dest("s1.c")) == unchanged_mtime);

    // The source manifest keeps its path dependency.
    assert(read_text(fx.source.path / "rust-user/schedX/Cargo.toml") == kManifest);

    const auto header_mtime = fs::last_write_time(fx.dest("include/a.h"));
    const auto manifest_mtime = fs::last_write_time(fx.dest("schedX/Cargo.toml"));

    auto second = fx.run();
    assert(second.files_copied == 0);
    assert(second.files_skipped == second.total_mappings);
    assert(second.copied_entries.empty());
    assert(fs::last_write_time(fx.dest("include/a.h")) == header_mtime);
    assert(fs::last_write_time(fx.dest("schedX/Cargo.toml")) == manifest_mtime);
}

void test_copy_failure_keeps_earlier_copies() {
    Fixture fx;
    write_text(fx.dest("include/a.h"), "old\n");
    write_text(fx.dest("s1.c"), "old\n");
    write_text(fx.dest("schedX/Cargo.toml"), "old\n");
    fs::remove(fx.source.path / "grpA/s1.c");

    bool thrown = false;
    try {
        fx.run();
    } catch (const scxsync::CopyError& ex) {
        thrown = true;
        std::cout << "    Expected failure: " << ex.what() << std::endl;
    }
    assert(thrown);

    assert(read_text(fx.dest("include/a.h")) == "#define A 1\n");
    assert(read_text(fx.dest("s1.c")) == "old\n");
    assert(read_text(fx.dest("schedX/Cargo.toml")) == "old\n");
}

// Caps the size of files this process may write, so a write fails with
// EFBIG even when the test runs as root.
struct FileSizeLimit {
    rlimit saved{};
    void (*saved_handler)(int){nullptr};

    explicit FileSizeLimit(rlim_t bytes) {
        saved_handler = std::signal(SIGXFSZ, SIG_IGN);
        if (::getrlimit(RLIMIT_FSIZE, &saved) != 0) {
            throw std::runtime_error("getrlimit failed");
        }
        rlimit capped = saved;
        capped.rlim_cur = bytes;
        if (::setrlimit(RLIMIT_FSIZE, &capped) != 0) {
            throw std::runtime_error("setrlimit failed");
        }
    }

    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &saved);
        std::signal(SIGXFSZ, saved_handler);
        std::cout.clear();
        std::cerr.clear();
    }
};

void test_unwritable_destination_stops_run() {
    Fixture fx;
    const std::string big_header(4096, 'h');
    write_text(fx.source.path / "include/a.h", big_header);
    write_text(fx.dest("include/a.h"), "old\n");
    write_text(fx.dest("s1.c"), "old\n");
    write_text(fx.dest("schedX/Cargo.toml"), "old\n");

    bool thrown = false;
    {
        FileSizeLimit limit(1024);
        try {
            fx.run();
        } catch (const scxsync::CopyError& ex) {
            thrown = true;
            std::cerr << "    Expected failure: " << ex.what() << std::endl;
        }
    }
    assert(thrown);

    assert(read_text(fx.dest("include/a.h")) != big_header);
    assert(read_text(fx.dest("s1.c")) == "old\n");
    assert(read_text(fx.dest("schedX/Cargo.toml")) == "old\n");
}

} // namespace

int main() {
    try {
        test_missing_destination_blocks_all_writes();
        test_every_missing_destination_reported();
        test_sync_then_idempotent();
        test_copy_failure_keeps_earlier_copies();
        test_unwritable_destination_stops_run();
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
