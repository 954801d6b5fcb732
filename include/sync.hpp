#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "manifest.hpp"
#include "path_mapper.hpp"

namespace scxsync {

class TrackedFileEnumerator;

struct SyncOptions {
    // Files land under <kernel tree>/<downstream_subdir>.
    std::filesystem::path downstream_subdir{"tools/sched_ext"};
    MapperConfig mapper{};
    ManifestRule manifest{};
};

struct CopyRecord {
    std::filesystem::path source;
    std::filesystem::path destination;
    Category category{Category::header};
    bool rewritten{false};
};

struct SyncStats {
    std::size_t total_mappings{0};
    std::size_t files_skipped{0};
    std::size_t files_copied{0};
    std::size_t headers_copied{0};
    std::size_t sources_copied{0};
    std::vector<CopyRecord> copied_entries{};
};

class MissingDestinationsError : public std::runtime_error {
public:
    explicit MissingDestinationsError(std::vector<std::filesystem::path> missing);

    const std::vector<std::filesystem::path>& missing() const { return missing_; }

private:
    std::vector<std::filesystem::path> missing_;
};

class CopyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TreeSyncer {
public:
    explicit TreeSyncer(SyncOptions options = {});

    // Enumerates the tracked files of source_root, maps them under
    // kernel_tree and mirrors them. Throws MissingDestinationsError before
    // any write if a destination is absent, CopyError on the first I/O
    // failure.
    SyncStats synchronize(TrackedFileEnumerator& enumerator,
                          const std::filesystem::path& source_root,
                          const std::filesystem::path& kernel_tree);

    // Same pipeline over an already computed mapping set.
    SyncStats synchronize(const std::vector<FileMapping>& mappings,
                          const std::filesystem::path& source_root);

    std::filesystem::path downstream_root(const std::filesystem::path& kernel_tree) const;

private:
    SyncOptions options_;

    std::vector<std::filesystem::path> find_missing(const std::vector<FileMapping>& mappings);
    void copy_changed(const std::vector<FileMapping>& mappings,
                      const std::filesystem::path& source_root,
                      SyncStats& stats);
};

// Reads the whole file as bytes. Throws CopyError if it cannot be read.
std::string read_file(const std::filesystem::path& file);

// Truncates and rewrites an existing file in place. Throws CopyError.
void write_file(const std::filesystem::path& file, const std::string& content);

void print_report(const SyncStats& stats);

} // namespace scxsync
