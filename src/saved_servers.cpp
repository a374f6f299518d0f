#include "saved_servers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ports {

std::vector<SavedServer> decode_saved_servers(const std::string& json_text) {
    std::vector<SavedServer> servers;

    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::exception& e) {
        spdlog::error("Saved servers: Invalid JSON: {}", e.what());
        return servers;
    }
    if (!doc.is_array()) {
        spdlog::error("Saved servers: Expected a JSON array");
        return servers;
    }

    for (const auto& entry : doc) {
        try {
            auto port = entry.at("port").get<int64_t>();
            if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                spdlog::warn("Saved servers: Skipping entry with port {}", port);
                continue;
            }
            SavedServer saved;
            saved.port = static_cast<uint16_t>(port);
            saved.directory_path = entry.at("directoryPath").get<std::string>();
            saved.expose_to_lan = entry.value("exposeToLAN", false);
            servers.push_back(saved);
        } catch (const json::exception& e) {
            spdlog::warn("Saved servers: Skipping malformed entry: {}", e.what());
        }
    }
    return servers;
}

std::string encode_saved_servers(const std::vector<SavedServer>& servers) {
    json doc = json::array();
    for (const auto& s : servers) {
        doc.push_back({
            {"port", s.port},
            {"directoryPath", s.directory_path},
            {"exposeToLAN", s.expose_to_lan},
        });
    }
    return doc.dump(2);
}

std::vector<SavedServer> load_saved_servers(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return {};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decode_saved_servers(text);
}

bool save_saved_servers(const std::string& path, const std::vector<SavedServer>& servers) {
    // Write a sibling file and rename it over the old one
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Saved servers: Cannot write {}", tmp);
            return false;
        }
        out << encode_saved_servers(servers) << "\n";
        if (!out.good()) {
            spdlog::error("Saved servers: Write to {} failed", tmp);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::error("Saved servers: Cannot replace {}: {}", path, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

void remove_saved_servers(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Saved servers: Cannot remove {}: {}", path, ec.message());
    }
}

} // namespace ports
