#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ports {

struct SavedServer {
    uint16_t port = 0;
    std::string directory_path;
    bool expose_to_lan = false;
};

// JSON array of {"port", "directoryPath", "exposeToLAN"}.
// Malformed entries are skipped; a missing "exposeToLAN" reads as false.
std::vector<SavedServer> decode_saved_servers(const std::string& json_text);
std::string encode_saved_servers(const std::vector<SavedServer>& servers);

// File helpers: a missing or unreadable file yields an empty list
std::vector<SavedServer> load_saved_servers(const std::string& path);
bool save_saved_servers(const std::string& path, const std::vector<SavedServer>& servers);
void remove_saved_servers(const std::string& path);

} // namespace ports
