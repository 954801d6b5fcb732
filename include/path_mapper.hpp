#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scxsync {

enum class Category {
    header,
    scheduler_broad,
    scheduler_narrow,
};

struct FileMapping {
    Category category{Category::header};
    std::filesystem::path source;
    std::filesystem::path destination;
};

struct MapperConfig {
    std::string header_dir{"include"};
    // Generated header, never tracked downstream.
    std::string header_exclude{"include/vmlinux"};
    std::string broad_group{"kernel-examples"};
    std::string narrow_group{"rust-user"};
    std::vector<std::string> narrow_allow_list{"scx_rusty", "scx_layered"};
    std::string excluded_build_file{"meson.build"};
};

struct TrackedSources {
    std::vector<std::string> headers;
    std::vector<std::string> broad;
    std::vector<std::string> narrow;
};

// Drops the leading directory component: "grp/a/b.c" -> "a/b.c".
// Returns nullopt for a path without one.
std::optional<std::filesystem::path> strip_group(const std::filesystem::path& source);

std::optional<FileMapping> map_header(const std::string& source,
                                      const std::filesystem::path& root,
                                      const MapperConfig& config);

std::optional<FileMapping> map_broad_source(const std::string& source,
                                            const std::filesystem::path& root,
                                            const MapperConfig& config);

// Only <group>/<component>/<rest> with <component> on the allow-list maps.
std::optional<FileMapping> map_narrow_source(const std::string& source,
                                             const std::filesystem::path& root,
                                             const MapperConfig& config);

// Headers first, then broad sources, then allowed narrow sources, each in
// enumeration order.
std::vector<FileMapping> build_mappings(const TrackedSources& sources,
                                        const std::filesystem::path& root,
                                        const MapperConfig& config);

} // namespace scxsync
