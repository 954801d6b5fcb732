#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace scxsync {

class EnumerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TrackedFileEnumerator {
public:
    virtual ~TrackedFileEnumerator() = default;

    // Repository-relative paths tracked under the given pathspecs.
    virtual std::vector<std::string> list(const std::vector<std::string>& pathspecs) = 0;
};

class GitFileEnumerator : public TrackedFileEnumerator {
public:
    explicit GitFileEnumerator(std::filesystem::path repository);

    std::vector<std::string> list(const std::vector<std::string>& pathspecs) override;

private:
    std::filesystem::path repository_;
};

std::string shell_quote(const std::string& arg);

} // namespace scxsync
