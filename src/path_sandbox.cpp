#include "path_sandbox.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ports {

PathSandbox::PathSandbox(const fs::path& root)
    : root_(fs::canonical(root))
{
    root_prefix_ = root_.string();
    if (root_prefix_.empty() || root_prefix_.back() != '/') {
        root_prefix_ += '/';
    }
}

bool PathSandbox::contains(const fs::path& canonical) const {
    std::string s = canonical.string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    if (s == root_.string()) return true;
    return s.compare(0, root_prefix_.size(), root_prefix_) == 0;
}

fs::path PathSandbox::resolve(const std::string& request_path) const {
    if (request_path.find('\0') != std::string::npos) {
        throw PathViolation("NUL byte in path");
    }

    // Reject parent segments outright, before touching the filesystem
    size_t start = 0;
    while (start <= request_path.size()) {
        size_t slash = request_path.find('/', start);
        if (slash == std::string::npos) slash = request_path.size();
        if (request_path.compare(start, slash - start, "..") == 0 && slash - start == 2) {
            throw PathViolation("parent segment in " + request_path);
        }
        start = slash + 1;
    }

    fs::path joined = root_ / fs::path(request_path).relative_path();

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        throw fs::filesystem_error("cannot resolve request path", joined, ec);
    }

    if (!contains(canonical)) {
        spdlog::warn("Path escapes sandbox: {} -> {}", request_path, canonical.string());
        throw PathViolation(request_path + " resolves outside " + root_.string());
    }
    return canonical;
}

} // namespace ports
