#pragma once

#include <filesystem>
#include <string>

namespace scxsync {

struct ManifestRule {
    std::string file_name{"Cargo.toml"};
    // Dependency that points into the development tree by path.
    std::string dependency{"scx_utils"};
};

bool is_manifest(const std::filesystem::path& file, const ManifestRule& rule);

// Rewrites every `<dependency> = { path = ..., version = "X" ... }` line to
// `<dependency> = "X"`. Other lines, line endings included, pass through.
// transform_manifest(transform_manifest(s)) == transform_manifest(s).
std::string transform_manifest(const std::string& content, const ManifestRule& rule);

} // namespace scxsync
