#pragma once

#include "config.hpp"
#include "http_server.hpp"
#include "port_scanner.hpp"
#include "saved_servers.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace ports {

using ServerHandle = uint64_t;

struct ServerInfo {
    ServerHandle handle = 0;
    uint16_t port = 0;
    std::filesystem::path root;
    bool expose_to_lan = false;
};

struct RestoreResult {
    std::vector<ServerHandle> restored;
    // Subset of `restored` that listens on every interface
    std::vector<ServerHandle> lan_exposed;
};

// Owns the running file servers, keyed by handle, and keeps the saved list in sync
class ServerManager {
public:
    using FailureCallback = std::function<void(const ServerInfo& server, const std::string& error)>;

    ServerManager(const AppConfig& config, PortScanner& scanner);
    ~ServerManager();

    // Non-copyable
    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // Throws BindError; the server is only registered once it is listening
    ServerHandle start_server(uint16_t port, const std::filesystem::path& root, bool expose_to_lan);

    // Returns false for an unknown handle
    bool stop_server(ServerHandle handle);

    // Stop everything and persist the now-empty list
    void stop_all();

    // Stop everything but leave the saved list untouched (process exit)
    void shutdown();

    std::vector<ServerInfo> servers() const;
    std::optional<ServerInfo> server(ServerHandle handle) const;

    // True if one of our servers or any other process listens on `port`
    bool is_port_in_use(uint16_t port);

    // First free port in [start, start + 100], else a random port in 8200..9000
    uint16_t find_available_port(uint16_t start);

    // Start the given entries, skipping missing directories and moving
    // entries whose port is taken to the lowest free port in 8080..9000
    // (random above 9000 if that band is full). Reports the started handles
    // and which of them are reachable from the local network.
    RestoreResult restore_servers(const std::vector<SavedServer>& entries);

    // restore_servers() over the configured saved-servers file
    RestoreResult restore_saved_servers();

    // Write the running set to the saved-servers file, or delete the file
    // when persistence is disabled
    void save_servers();

    // Invoked from reap_failed() for every listener that died
    void set_failure_callback(FailureCallback cb) { failure_cb_ = std::move(cb); }

    // Stop and drop listeners whose accept loop failed. Returns how many.
    size_t reap_failed();

private:
    // Start and register without touching the saved list
    ServerHandle launch(uint16_t port, const std::filesystem::path& root, bool expose_to_lan);
    uint16_t find_port_excluding(const std::set<uint16_t>& excluded);
    uint16_t random_port(uint16_t lo, uint16_t hi);
    static ServerInfo info_of(ServerHandle handle, const HttpServer& server);

    HttpConfig http_config_;
    ManagerConfig config_;
    PortScanner& scanner_;
    FailureCallback failure_cb_;

    mutable std::mutex mutex_;
    std::map<ServerHandle, std::unique_ptr<HttpServer>> servers_;
    ServerHandle next_handle_ = 1;

    // Listener failures are posted here by accept threads and handled in reap_failed()
    std::mutex failed_mutex_;
    std::vector<std::pair<ServerHandle, std::string>> failed_;

    std::mt19937 rng_;
};

} // namespace ports
