#include "sync.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include "enumerator.hpp"

namespace scxsync {

namespace fs = std::filesystem;

namespace {

std::string missing_message(std::size_t count) {
    std::ostringstream msg;
    msg << count << " destination file" << (count == 1 ? "" : "s")
        << " missing, downstream tree left untouched";
    return msg.str();
}

} // namespace

MissingDestinationsError::MissingDestinationsError(std::vector<fs::path> missing)
    : std::runtime_error(missing_message(missing.size())), missing_(std::move(missing)) {}

TreeSyncer::TreeSyncer(SyncOptions options) : options_(std::move(options)) {}

fs::path TreeSyncer::downstream_root(const fs::path& kernel_tree) const {
    return kernel_tree / options_.downstream_subdir;
}

SyncStats TreeSyncer::synchronize(TrackedFileEnumerator& enumerator,
                                  const fs::path& source_root,
                                  const fs::path& kernel_tree) {
    const MapperConfig& config = options_.mapper;

    TrackedSources sources;
    sources.headers = enumerator.list({config.header_dir});
    sources.broad = enumerator.list({config.broad_group});
    sources.narrow = enumerator.list({config.narrow_group});

    const fs::path root = downstream_root(kernel_tree);
    const std::vector<FileMapping> mappings = build_mappings(sources, root, config);

    std::size_t nr_headers = 0;
    for (const auto& mapping : mappings) {
        if (mapping.category == Category::header) {
            ++nr_headers;
        }
    }
    std::cout << "Syncing " << nr_headers << " headers and " << mappings.size() - nr_headers
              << " scheduler source files to " << root.string() << std::endl;

    return synchronize(mappings, source_root);
}

SyncStats TreeSyncer::synchronize(const std::vector<FileMapping>& mappings, const fs::path& source_root) {
    SyncStats stats{};
    stats.total_mappings = mappings.size();

    std::cout << "[1/2] Validating " << mappings.size() << " destination files..." << std::endl;
    std::vector<fs::path> missing = find_missing(mappings);
    if (!missing.empty()) {
        throw MissingDestinationsError(std::move(missing));
    }

    std::cout << "[2/2] Copying changed files..." << std::endl;
    copy_changed(mappings, source_root, stats);

    return stats;
}

std::vector<fs::path> TreeSyncer::find_missing(const std::vector<FileMapping>& mappings) {
    std::vector<fs::path> missing;
    for (const auto& mapping : mappings) {
        std::error_code ec;
        if (!fs::is_regular_file(mapping.destination, ec)) {
            std::cerr << "ERROR: " << mapping.destination.string() << " does not exist" << std::endl;
            missing.push_back(mapping.destination);
        }
    }
    return missing;
}

void TreeSyncer::copy_changed(const std::vector<FileMapping>& mappings,
                              const fs::path& source_root,
                              SyncStats& stats) {
    for (const auto& mapping : mappings) {
        const std::string raw = read_file(source_root / mapping.source);

        std::string effective = raw;
        bool rewritten = false;
        if (is_manifest(mapping.source, options_.manifest)) {
            effective = transform_manifest(raw, options_.manifest);
            rewritten = effective != raw;
        }

        if (read_file(mapping.destination) == effective) {
            ++stats.files_skipped;
            continue;
        }

        if (rewritten) {
            std::cout << "    Syncing " << mapping.source.string() << " (dropped path from "
                      << options_.manifest.dependency << " dependency)" << std::endl;
        } else {
            std::cout << "    Syncing " << mapping.source.string() << std::endl;
        }

        write_file(mapping.destination, effective);

        ++stats.files_copied;
        if (mapping.category == Category::header) {
            ++stats.headers_copied;
        } else {
            ++stats.sources_copied;
        }
        stats.copied_entries.push_back(CopyRecord{mapping.source, mapping.destination, mapping.category, rewritten});
    }
}

std::string read_file(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        throw CopyError("Failed to open " + file.string() + ": " + std::strerror(errno));
    }

    std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        throw CopyError("Failed to read " + file.string());
    }
    return content;
}

void write_file(const fs::path& file, const std::string& content) {
    std::ofstream output(file, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw CopyError("Failed to open " + file.string() + " for writing: " + std::strerror(errno));
    }

    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    output.close();
    if (!output) {
        throw CopyError("Failed to write " + file.string());
    }
}

void print_report(const SyncStats& stats) {
    std::cout << "\n=== Synchronization Summary ===" << std::endl;
    std::cout << "  Files considered:     " << stats.total_mappings << std::endl;
    std::cout << "  Headers synced:       " << stats.headers_copied << std::endl;
    std::cout << "  Sources synced:       " << stats.sources_copied << std::endl;
    std::cout << "Skipped " << stats.files_skipped << " unchanged files" << std::endl;
}

} // namespace scxsync
