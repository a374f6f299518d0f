#include "request_parser.hpp"
#include "http_util.hpp"
#include <sstream>
#include <vector>

namespace ports {

static std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

std::variant<HttpRequest, int> parse_request(const std::string& header_block) {
    // First line: "GET /path HTTP/1.1"
    auto line_end = header_block.find("\r\n");
    std::string first_line = header_block.substr(0, line_end);

    auto parts = split_words(first_line);
    if (parts.size() < 2) {
        return 400;
    }
    if (parts[0] != "GET" || parts.size() > 3) {
        return 405;
    }

    HttpRequest req;
    req.method = parts[0];
    req.target = parts[1];
    if (parts.size() == 3) {
        req.version = parts[2];
    }

    // Only the path component is used; query and fragment are dropped
    std::string raw_path = req.target.substr(0, req.target.find_first_of("?#"));
    req.path = percent_decode(raw_path);
    if (req.path.empty()) {
        req.path = "/";
    }
    return req;
}

} // namespace ports
