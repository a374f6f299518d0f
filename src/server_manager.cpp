#include "server_manager.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace ports {

static constexpr uint16_t kRestoreBandLow = 8080;
static constexpr uint16_t kRestoreBandHigh = 9000;
static constexpr uint16_t kFallbackLow = 8200;
static constexpr uint16_t kFallbackHigh = 9000;
static constexpr int kSearchSpan = 100;

ServerManager::ServerManager(const AppConfig& config, PortScanner& scanner)
    : http_config_(config.http)
    , config_(config.manager)
    , scanner_(scanner)
    , rng_(std::random_device{}())
{
}

ServerManager::~ServerManager() {
    shutdown();
}

ServerInfo ServerManager::info_of(ServerHandle handle, const HttpServer& server) {
    ServerInfo info;
    info.handle = handle;
    info.port = server.port();
    info.root = server.root();
    info.expose_to_lan = server.expose_to_lan();
    return info;
}

ServerHandle ServerManager::launch(uint16_t port, const fs::path& root, bool expose_to_lan) {
    ServerHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = next_handle_++;
    }

    auto server = std::make_unique<HttpServer>(port, root, expose_to_lan, http_config_);
    server->set_failure_callback([this, handle](const std::string& error) {
        std::lock_guard<std::mutex> lock(failed_mutex_);
        failed_.emplace_back(handle, error);
    });
    server->start();

    spdlog::info("Started server {} on port {} for {}{}", handle, server->port(),
                 server->root().string(), expose_to_lan ? " (LAN)" : "");
    std::lock_guard<std::mutex> lock(mutex_);
    servers_.emplace(handle, std::move(server));
    return handle;
}

ServerHandle ServerManager::start_server(uint16_t port, const fs::path& root, bool expose_to_lan) {
    ServerHandle handle = launch(port, root, expose_to_lan);
    save_servers();
    return handle;
}

bool ServerManager::stop_server(ServerHandle handle) {
    std::unique_ptr<HttpServer> server;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(handle);
        if (it == servers_.end()) {
            return false;
        }
        server = std::move(it->second);
        servers_.erase(it);
    }

    server->stop();
    spdlog::info("Stopped server {} on port {}", handle, server->port());
    save_servers();
    return true;
}

void ServerManager::stop_all() {
    shutdown();
    save_servers();
}

void ServerManager::shutdown() {
    std::map<ServerHandle, std::unique_ptr<HttpServer>> stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping.swap(servers_);
    }
    for (auto& [handle, server] : stopping) {
        server->stop();
    }
}

std::vector<ServerInfo> ServerManager::servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerInfo> out;
    out.reserve(servers_.size());
    for (const auto& [handle, server] : servers_) {
        out.push_back(info_of(handle, *server));
    }
    return out;
}

std::optional<ServerInfo> ServerManager::server(ServerHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(handle);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return info_of(handle, *it->second);
}

bool ServerManager::is_port_in_use(uint16_t port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [handle, server] : servers_) {
            if (server->port() == port) return true;
        }
    }
    auto records = scanner_.scan();
    return std::any_of(records.begin(), records.end(),
                       [port](const ListeningPortRecord& r) { return r.port == port; });
}

uint16_t ServerManager::find_available_port(uint16_t start) {
    int first = std::max<int>(start, 1);
    int last = std::min<int>(first + kSearchSpan, 65535);
    for (int port = first; port <= last; port++) {
        if (!is_port_in_use(static_cast<uint16_t>(port))) {
            return static_cast<uint16_t>(port);
        }
    }
    spdlog::warn("No free port in {}..{}, picking a random one", first, last);
    return random_port(kFallbackLow, kFallbackHigh);
}

uint16_t ServerManager::find_port_excluding(const std::set<uint16_t>& excluded) {
    for (int port = kRestoreBandLow; port <= kRestoreBandHigh; port++) {
        if (!excluded.count(static_cast<uint16_t>(port))) {
            return static_cast<uint16_t>(port);
        }
    }
    return random_port(kRestoreBandHigh + 1, 65535);
}

uint16_t ServerManager::random_port(uint16_t lo, uint16_t hi) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<int> dist(lo, hi);
    return static_cast<uint16_t>(dist(rng_));
}

RestoreResult ServerManager::restore_servers(const std::vector<SavedServer>& entries) {
    RestoreResult result;
    if (entries.empty()) {
        return result;
    }

    std::set<uint16_t> used;
    for (const auto& rec : scanner_.scan()) {
        used.insert(rec.port);
    }
    std::set<uint16_t> reserved;

    for (const auto& entry : entries) {
        std::error_code ec;
        if (!fs::is_directory(entry.directory_path, ec)) {
            spdlog::warn("Restore: Skipping {} (directory missing)", entry.directory_path);
            continue;
        }

        std::set<uint16_t> taken = used;
        taken.insert(reserved.begin(), reserved.end());
        for (const auto& info : servers()) {
            taken.insert(info.port);
        }

        uint16_t port = entry.port;
        if (port == 0 || taken.count(port)) {
            port = find_port_excluding(taken);
            spdlog::info("Restore: Port {} taken, using {} for {}", entry.port, port,
                         entry.directory_path);
        }
        reserved.insert(port);

        try {
            ServerHandle handle = launch(port, entry.directory_path, entry.expose_to_lan);
            result.restored.push_back(handle);
            if (entry.expose_to_lan) {
                result.lan_exposed.push_back(handle);
            }
        } catch (const BindError& e) {
            spdlog::error("Restore: Failed to restore server on port {}: {}", port, e.what());
        }
    }

    if (!servers().empty()) {
        save_servers();
    }
    return result;
}

RestoreResult ServerManager::restore_saved_servers() {
    auto entries = load_saved_servers(config_.saved_servers_file);
    spdlog::info("Restore: {} saved server(s) in {}", entries.size(), config_.saved_servers_file);
    return restore_servers(entries);
}

void ServerManager::save_servers() {
    if (!config_.persist_servers) {
        remove_saved_servers(config_.saved_servers_file);
        return;
    }

    std::vector<SavedServer> saved;
    for (const auto& info : servers()) {
        SavedServer s;
        s.port = info.port;
        s.directory_path = info.root.string();
        s.expose_to_lan = info.expose_to_lan;
        saved.push_back(s);
    }
    save_saved_servers(config_.saved_servers_file, saved);
}

size_t ServerManager::reap_failed() {
    std::vector<std::pair<ServerHandle, std::string>> failed;
    {
        std::lock_guard<std::mutex> lock(failed_mutex_);
        failed.swap(failed_);
    }

    size_t reaped = 0;
    for (const auto& [handle, error] : failed) {
        std::unique_ptr<HttpServer> server;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = servers_.find(handle);
            if (it == servers_.end()) continue;
            server = std::move(it->second);
            servers_.erase(it);
        }
        ServerInfo info = info_of(handle, *server);
        server->stop();
        reaped++;
        spdlog::error("Server {} on port {} failed: {}", handle, info.port, error);
        if (failure_cb_) {
            failure_cb_(info, error);
        }
    }

    if (reaped > 0) {
        save_servers();
    }
    return reaped;
}

} // namespace ports
