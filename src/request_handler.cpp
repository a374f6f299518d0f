#include "request_handler.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace ports {

static const char* const kIndexFiles[] = {"index.html", "index.htm"};
static constexpr size_t kLoggedPathMax = 256;

// Request paths can be as long as the header limit; keep log lines bounded
static std::string loggable(const std::string& path) {
    if (path.size() <= kLoggedPathMax) return path;
    return path.substr(0, kLoggedPathMax) + "... (" + std::to_string(path.size()) + " bytes)";
}

HttpResponse handle_request(const HttpRequest& req, const PathSandbox& sandbox) {
    try {
        fs::path target = sandbox.resolve(req.path);

        std::error_code ec;
        fs::file_status st = fs::status(target, ec);
        if (!fs::exists(st)) {
            return make_error_response(404);
        }

        if (fs::is_directory(st)) {
            if (req.path.back() != '/') {
                return make_redirect_response(req.path + "/");
            }
            for (const char* index : kIndexFiles) {
                // Resolved through the sandbox so a symlinked index cannot escape
                fs::path candidate = sandbox.resolve(req.path + index);
                if (fs::is_regular_file(candidate, ec)) {
                    return make_file_response(candidate);
                }
            }
            return make_listing_response(req.path, target);
        }

        if (fs::is_regular_file(st)) {
            return make_file_response(target);
        }
        return make_error_response(404);

    } catch (const PathViolation& e) {
        spdlog::warn("HTTP: Forbidden {}", loggable(req.path));
        return make_error_response(403);
    } catch (const fs::filesystem_error& e) {
        // A name no filesystem can hold, or a symlink cycle, names nothing
        if (e.code() == std::errc::filename_too_long ||
            e.code() == std::errc::too_many_symbolic_link_levels) {
            spdlog::debug("HTTP: Unresolvable {}: {}", loggable(req.path), e.code().message());
            return make_error_response(404);
        }
        spdlog::error("HTTP: Cannot resolve {}: {}", loggable(req.path), e.code().message());
        return make_error_response(500);
    }
}

} // namespace ports
