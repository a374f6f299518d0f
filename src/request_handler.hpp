#pragma once

#include "path_sandbox.hpp"
#include "request_parser.hpp"
#include "response_builder.hpp"

namespace ports {

// Map a parsed GET request onto the sandboxed directory tree:
// file, index file, directory listing, trailing-slash redirect, or error.
HttpResponse handle_request(const HttpRequest& req, const PathSandbox& sandbox);

} // namespace ports
