#pragma once

#include <filesystem>
#include <string>

namespace ports {

// Confines client-supplied paths to a root directory.
// The root is canonicalized once (symlinks resolved); every resolved path is
// either the root itself or below it.
class PathSandbox {
public:
    // Throws std::filesystem::filesystem_error if the root cannot be canonicalized
    explicit PathSandbox(const std::filesystem::path& root);

    // Resolve a percent-decoded request path. Throws PathViolation when the
    // result would leave the root. The returned path may not exist.
    std::filesystem::path resolve(const std::string& request_path) const;

    bool contains(const std::filesystem::path& canonical) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::string root_prefix_;  // root_ + '/'
};

} // namespace ports
