#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace ports {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + val);
    }
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    if (std::filesystem::exists(path)) {
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config: " + std::string(e.what()));
        }
    }

    try {
        // HTTP listener limits
        if (auto h = root["http"]) {
            cfg.http.max_connections = h["max_connections"].as<int>(cfg.http.max_connections);
            cfg.http.max_header_bytes = h["max_header_bytes"].as<size_t>(cfg.http.max_header_bytes);
            cfg.http.request_timeout_ms = h["request_timeout_ms"].as<int>(cfg.http.request_timeout_ms);
        }

        // Scanner
        if (auto s = root["scanner"]) {
            if (auto cmd = s["command"]) {
                cfg.scanner.command = cmd.as<std::vector<std::string>>();
            }
            cfg.scanner.cache_ttl_ms = s["cache_ttl_ms"].as<int>(cfg.scanner.cache_ttl_ms);
        }

        // Server manager
        if (auto m = root["manager"]) {
            cfg.manager.default_port = m["default_port"].as<uint16_t>(cfg.manager.default_port);
            cfg.manager.persist_servers = m["persist_servers"].as<bool>(cfg.manager.persist_servers);
            cfg.manager.saved_servers_file =
                m["saved_servers_file"].as<std::string>(cfg.manager.saved_servers_file);
        }

        // Servers started at launch
        if (auto list = root["servers"]) {
            for (const auto& node : list) {
                ServerEntry entry;
                entry.port = node["port"].as<uint16_t>(cfg.manager.default_port);
                entry.directory = node["directory"].as<std::string>();
                entry.expose_to_lan = node["expose_to_lan"].as<bool>(false);
                cfg.servers.push_back(entry);
            }
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value: " + std::string(e.what()));
    }

    // Environment variable overrides (systemd / launchers)
    cfg.manager.default_port = static_cast<uint16_t>(
        env_int_or("PORTS_DEFAULT_PORT", cfg.manager.default_port));
    cfg.manager.saved_servers_file = env_or("PORTS_SAVED_SERVERS", cfg.manager.saved_servers_file);
    cfg.http.max_connections = env_int_or("PORTS_MAX_CONNECTIONS", cfg.http.max_connections);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    if (cfg.http.max_connections <= 0) {
        throw std::runtime_error("http.max_connections must be positive");
    }
    if (cfg.http.request_timeout_ms <= 0) {
        throw std::runtime_error("http.request_timeout_ms must be positive");
    }
    if (cfg.scanner.command.empty()) {
        throw std::runtime_error("scanner.command must not be empty");
    }

    return cfg;
}

} // namespace ports
