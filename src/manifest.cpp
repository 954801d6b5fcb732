#include "manifest.hpp"

#include <regex>

namespace scxsync {

namespace {

std::string regex_escape(const std::string& text) {
    static const std::regex special{R"([.^$|()\[\]{}*+?\\])"};
    return std::regex_replace(text, special, R"(\$&)");
}

std::string rewrite_line(const std::string& line,
                         const std::regex& declaration,
                         const ManifestRule& rule) {
    static const std::regex path_field{R"((^|[\s{,])path\s*=)"};
    static const std::regex version_field{R"re(version\s*=\s*"([^"]*)")re"};

    std::smatch head;
    if (!std::regex_search(line, head, declaration)) {
        return line;
    }

    const std::string fields = head.suffix().str();
    std::smatch version;
    if (!std::regex_search(fields, path_field) || !std::regex_search(fields, version, version_field)) {
        return line;
    }

    std::string rewritten = head[1].str() + rule.dependency + " = \"" + version[1].str() + "\"";
    if (!line.empty() && line.back() == '\r') {
        rewritten += '\r';
    }
    return rewritten;
}

} // namespace

bool is_manifest(const std::filesystem::path& file, const ManifestRule& rule) {
    return file.filename() == rule.file_name;
}

std::string transform_manifest(const std::string& content, const ManifestRule& rule) {
    const std::regex declaration{"^(\\s*)" + regex_escape(rule.dependency) + "\\s*="};

    std::string out;
    out.reserve(content.size());

    std::string::size_type start = 0;
    while (start < content.size()) {
        const auto end = content.find('\n', start);
        if (end == std::string::npos) {
            out += rewrite_line(content.substr(start), declaration, rule);
            break;
        }
        out += rewrite_line(content.substr(start, end - start), declaration, rule);
        out += '\n';
        start = end + 1;
    }

    return out;
}

} // namespace scxsync
