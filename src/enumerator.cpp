#include "enumerator.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <utility>

#include <sys/wait.h>

namespace scxsync {

GitFileEnumerator::GitFileEnumerator(std::filesystem::path repository)
    : repository_(std::move(repository)) {}

std::vector<std::string> GitFileEnumerator::list(const std::vector<std::string>& pathspecs) {
    std::ostringstream cmd;
    cmd << "git -C " << shell_quote(repository_.string()) << " ls-files -z --";
    for (const auto& spec : pathspecs) {
        cmd << ' ' << shell_quote(spec);
    }

    FILE* pipe = ::popen(cmd.str().c_str(), "r");
    if (pipe == nullptr) {
        throw EnumerationError("Failed to run '" + cmd.str() + "': " + std::strerror(errno));
    }

    std::string output;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }

    const int rc = ::pclose(pipe);
    if (rc == -1) {
        throw EnumerationError("Failed to wait for '" + cmd.str() + "': " + std::strerror(errno));
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        throw EnumerationError("'" + cmd.str() + "' failed with status " +
                               std::to_string(WIFEXITED(rc) ? WEXITSTATUS(rc) : rc));
    }

    std::vector<std::string> files;
    std::string::size_type start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            files.emplace_back(output, start, end - start);
        }
        start = end + 1;
    }
    return files;
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace scxsync
