#pragma once

#include <string>
#include <string_view>

namespace ports {

// Escape & < > " ' for safe inclusion in HTML text and attributes
std::string html_escape(std::string_view in);

// Decode %XX sequences. Malformed escapes are kept literally; '+' is not a space.
std::string percent_decode(std::string_view in);

// Encode everything outside the RFC 3986 path character set (keeps '/')
std::string percent_encode_path(std::string_view in);

// Drop CR, LF and NUL so a value cannot split a header or the response
std::string sanitize_header_value(std::string_view in);

// MIME type from the file extension, case-insensitive
std::string mime_type_for(const std::string& path);

std::string status_reason(int status);

bool is_valid_utf8(std::string_view in);

} // namespace ports
