#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace ports {

struct HttpConfig {
    int max_connections = 50;
    size_t max_header_bytes = 64 * 1024;
    int request_timeout_ms = 30000;
};

struct ScannerConfig {
    std::vector<std::string> command = {
        "lsof", "-iTCP", "-sTCP:LISTEN", "-n", "-P", "-Fpcn", "+c0"};
    int cache_ttl_ms = 2000;
};

struct ManagerConfig {
    uint16_t default_port = 8080;
    bool persist_servers = true;
    std::string saved_servers_file = "saved_servers.json";
};

// A server to start at launch, from the `servers:` list or --serve
struct ServerEntry {
    uint16_t port = 0;
    std::string directory;
    bool expose_to_lan = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    HttpConfig http;
    ScannerConfig scanner;
    ManagerConfig manager;
    std::vector<ServerEntry> servers;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides.
// A missing file yields the defaults; a malformed one throws.
AppConfig load_config(const std::string& path);

} // namespace ports
