#pragma once

#include <string>
#include <variant>

namespace ports {

struct HttpRequest {
    std::string method;
    std::string target;   // raw request-target
    std::string version;  // may be empty on HTTP/0.9-style lines
    std::string path;     // percent-decoded path component, never empty
};

// Parse a complete header block (request line + headers, without the body).
// Returns the request, or the HTTP status to answer with (400 or 405).
std::variant<HttpRequest, int> parse_request(const std::string& header_block);

} // namespace ports
