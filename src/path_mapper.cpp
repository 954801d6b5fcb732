#include "path_mapper.hpp"

#include <algorithm>
#include <iterator>

namespace scxsync {

namespace fs = std::filesystem;

namespace {

bool is_excluded_build_file(const fs::path& source, const MapperConfig& config) {
    return source.filename() == config.excluded_build_file;
}

} // namespace

std::optional<fs::path> strip_group(const fs::path& source) {
    const fs::path relative = source.relative_path();
    auto it = relative.begin();
    if (it == relative.end() || std::next(it) == relative.end()) {
        return std::nullopt;
    }

    fs::path stripped;
    for (++it; it != relative.end(); ++it) {
        stripped /= *it;
    }
    return stripped;
}

std::optional<FileMapping> map_header(const std::string& source,
                                      const fs::path& root,
                                      const MapperConfig& config) {
    if (!config.header_exclude.empty() && source.find(config.header_exclude) != std::string::npos) {
        return std::nullopt;
    }
    return FileMapping{Category::header, fs::path(source), root / source};
}

std::optional<FileMapping> map_broad_source(const std::string& source,
                                            const fs::path& root,
                                            const MapperConfig& config) {
    const fs::path path(source);
    if (is_excluded_build_file(path, config)) {
        return std::nullopt;
    }

    const auto stripped = strip_group(path);
    if (!stripped) {
        return std::nullopt;
    }
    return FileMapping{Category::scheduler_broad, path, root / *stripped};
}

std::optional<FileMapping> map_narrow_source(const std::string& source,
                                             const fs::path& root,
                                             const MapperConfig& config) {
    const fs::path path(source);
    if (is_excluded_build_file(path, config)) {
        return std::nullopt;
    }

    const fs::path relative = path.relative_path();
    if (std::distance(relative.begin(), relative.end()) < 3) {
        return std::nullopt;
    }

    const std::string component = std::next(relative.begin())->string();
    const auto& allowed = config.narrow_allow_list;
    if (std::find(allowed.begin(), allowed.end(), component) == allowed.end()) {
        return std::nullopt;
    }

    const auto stripped = strip_group(path);
    if (!stripped) {
        return std::nullopt;
    }
    return FileMapping{Category::scheduler_narrow, path, root / *stripped};
}

std::vector<FileMapping> build_mappings(const TrackedSources& sources,
                                        const fs::path& root,
                                        const MapperConfig& config) {
    std::vector<FileMapping> mappings;
    mappings.reserve(sources.headers.size() + sources.broad.size() + sources.narrow.size());

    for (const auto& file : sources.headers) {
        if (auto mapping = map_header(file, root, config)) {
            mappings.push_back(std::move(*mapping));
        }
    }
    for (const auto& file : sources.broad) {
        if (auto mapping = map_broad_source(file, root, config)) {
            mappings.push_back(std::move(*mapping));
        }
    }
    for (const auto& file : sources.narrow) {
        if (auto mapping = map_narrow_source(file, root, config)) {
            mappings.push_back(std::move(*mapping));
        }
    }

    return mappings;
}

} // namespace scxsync
