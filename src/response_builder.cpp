#include "response_builder.hpp"
#include "http_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace ports {

static const char* kHtmlType = "text/html; charset=utf-8";

namespace {

enum class BodyKind { Opaque, Html, HtmlFramed };

HttpResponse build(int status, const std::string& content_type, std::string body,
                   BodyKind kind, const std::string& location = "") {
    HttpResponse res;
    res.status = status;
    res.headers.emplace_back("Content-Type", content_type);
    res.headers.emplace_back("Content-Length", std::to_string(body.size()));
    if (!location.empty()) {
        res.headers.emplace_back("Location", location);
    }
    res.headers.emplace_back("Connection", "close");
    if (kind != BodyKind::Opaque) {
        res.headers.emplace_back("X-Content-Type-Options", "nosniff");
    }
    if (kind == BodyKind::HtmlFramed) {
        res.headers.emplace_back("X-Frame-Options", "DENY");
    }
    res.body = std::move(body);
    return res;
}

std::string parent_of(const std::string& request_path) {
    std::string p = request_path;
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return "/";
    return p.substr(0, slash + 1);
}

} // namespace

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n" << body;
    return oss.str();
}

HttpResponse make_file_response(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        spdlog::error("HTTP: Cannot open {}", file.string());
        return make_error_response(500);
    }

    std::string body((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (in.bad()) {
        spdlog::error("HTTP: Read failed for {}", file.string());
        return make_error_response(500);
    }

    std::string mime = mime_type_for(file.string());
    BodyKind kind = mime.rfind("text/html", 0) == 0 ? BodyKind::Html : BodyKind::Opaque;
    return build(200, mime, std::move(body), kind);
}

HttpResponse make_listing_response(const std::string& request_path, const fs::path& dir) {
    struct Entry {
        std::string name;
        bool is_dir;
    };
    std::vector<Entry> entries;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::error("HTTP: Cannot list {}: {}", dir.string(), ec.message());
        return make_error_response(500);
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        entries.push_back({it->path().filename().string(), is_dir});
    }
    if (ec) {
        spdlog::error("HTTP: Listing {} failed: {}", dir.string(), ec.message());
        return make_error_response(500);
    }

    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });

    const std::string title = html_escape(request_path);
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>Index of " << title << "</title>\n"
         << "<style>body{font-family:system-ui,sans-serif;padding:20px}"
            "a{text-decoration:none;color:#007aff}a:hover{text-decoration:underline}"
            "li{padding:4px 0}</style>\n"
         << "</head>\n<body>\n"
         << "<h1>Index of " << title << "</h1>\n<ul>\n";

    if (request_path != "/") {
        html << "<li><a href=\"" << html_escape(percent_encode_path(parent_of(request_path)))
             << "\">../</a></li>\n";
    }

    std::string base = request_path;
    if (base.empty() || base.back() != '/') base += '/';

    for (const auto& e : entries) {
        std::string display = e.is_dir ? e.name + "/" : e.name;
        std::string href = percent_encode_path(base + display);
        html << "<li><a href=\"" << html_escape(href) << "\">"
             << html_escape(display) << "</a></li>\n";
    }

    html << "</ul>\n</body>\n</html>\n";
    return build(200, kHtmlType, html.str(), BodyKind::HtmlFramed);
}

HttpResponse make_redirect_response(const std::string& target_path) {
    std::string location = sanitize_header_value(percent_encode_path(target_path));
    std::string body = "<html><body><a href=\"" + html_escape(location) +
                       "\">Moved Permanently</a></body></html>";
    return build(301, kHtmlType, std::move(body), BodyKind::Html, location);
}

HttpResponse make_error_response(int status) {
    std::string message = html_escape(std::to_string(status) + " " + status_reason(status));
    std::string body = "<html><head><title>" + message + "</title></head>"
                       "<body><h1>" + message + "</h1></body></html>";
    return build(status, kHtmlType, std::move(body), BodyKind::HtmlFramed);
}

} // namespace ports
