#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace ports {

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;  // emitted in order
    std::string body;

    // Status line, headers, blank line, body
    std::string serialize() const;
};

// 200 with the file's bytes, or 500 when it cannot be read
HttpResponse make_file_response(const std::filesystem::path& file);

// 200 with an HTML index of `dir`, or 500 when it cannot be listed.
// `request_path` is the decoded path the client asked for, ending in '/'.
HttpResponse make_listing_response(const std::string& request_path,
                                   const std::filesystem::path& dir);

// 301 to `target_path` (decoded), percent-encoded and scrubbed of CR/LF/NUL
HttpResponse make_redirect_response(const std::string& target_path);

// Short HTML page for 400/403/404/405/413/500/503
HttpResponse make_error_response(int status);

} // namespace ports
