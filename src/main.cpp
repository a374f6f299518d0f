#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "net_util.hpp"
#include "port_scanner.hpp"
#include "server_manager.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

#ifndef PORTS_VERSION
#define PORTS_VERSION "dev"
#endif

using json = nlohmann::json;

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: portsd [options]\n"
              << "Options:\n"
              << "  -c, --config <path>        Config file (default: config.yaml)\n"
              << "  -s, --serve PORT:DIR[:lan] Serve DIR on PORT (repeatable)\n"
              << "  -l, --list-ports           Print listening TCP ports and exit\n"
              << "      --json                 With --list-ports, print JSON\n"
              << "      --no-restore           Do not restore saved servers\n"
              << "  -v, --version              Print version\n"
              << "  -h, --help                 Show this help\n"
              << "\nEnvironment variables:\n"
              << "  PORTS_DEFAULT_PORT         First port tried for new servers\n"
              << "  PORTS_SAVED_SERVERS        Saved servers file\n"
              << "  PORTS_MAX_CONNECTIONS      Concurrent connections per server\n"
              << "  LOG_LEVEL                  Log level (trace/debug/info/warn/error)\n";
}

// "8080:/srv/www" or "8080:/srv/www:lan"; port 0 picks a free one
static std::optional<ports::ServerEntry> parse_serve_arg(const std::string& arg) {
    auto colon = arg.find(':');
    if (colon == std::string::npos) return std::nullopt;

    ports::ServerEntry entry;
    try {
        int port = std::stoi(arg.substr(0, colon));
        if (port < 0 || port > 65535) return std::nullopt;
        entry.port = static_cast<uint16_t>(port);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string dir = arg.substr(colon + 1);
    const std::string lan_suffix = ":lan";
    if (dir.size() > lan_suffix.size() &&
        dir.compare(dir.size() - lan_suffix.size(), lan_suffix.size(), lan_suffix) == 0) {
        entry.expose_to_lan = true;
        dir.resize(dir.size() - lan_suffix.size());
    }
    if (dir.empty()) return std::nullopt;
    entry.directory = dir;
    return entry;
}

static void list_ports(ports::PortScanner& scanner, bool as_json) {
    auto records = scanner.force_scan();
    if (as_json) {
        json out = json::array();
        for (const auto& r : records) {
            out.push_back({{"port", r.port}, {"pid", r.pid},
                           {"processName", r.process_name}, {"address", r.address}});
        }
        std::cout << out.dump(2) << std::endl;
        return;
    }
    for (const auto& r : records) {
        std::cout << r.port << "\t" << r.pid << "\t" << r.process_name
                  << "\t" << r.address << "\n";
    }
}

static void print_status(const ports::ServerManager& manager) {
    auto servers = manager.servers();
    spdlog::info("──── Status ────");
    spdlog::info("  Servers running : {}", servers.size());
    for (const auto& s : servers) {
        auto urls = ports::server_urls(s.port, s.expose_to_lan);
        spdlog::info("  [{}] {} -> {}", s.handle, urls.front(), s.root.string());
        for (size_t i = 1; i < urls.size(); i++) {
            spdlog::info("        {} (LAN)", urls[i]);
        }
    }
    spdlog::info("────────────────");
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "config.yaml";
    std::vector<ports::ServerEntry> cli_servers;
    bool list_only = false;
    bool as_json = false;
    bool restore = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--serve" || arg == "-s") && i + 1 < argc) {
            auto entry = parse_serve_arg(argv[++i]);
            if (!entry) {
                std::cerr << "ERROR: invalid --serve value: " << argv[i] << std::endl;
                return 1;
            }
            cli_servers.push_back(*entry);
        } else if (arg == "--list-ports" || arg == "-l") {
            list_only = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--no-restore") {
            restore = false;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "portsd " << PORTS_VERSION << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "ERROR: unknown argument: " << arg << std::endl;
            print_usage();
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    ports::AppConfig config;
    try {
        config = ports::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    ports::init_logger(config.logging);

    ports::PortScanner scanner(config.scanner);
    if (list_only) {
        list_ports(scanner, as_json);
        return 0;
    }

    spdlog::info("portsd v{}", PORTS_VERSION);
    spdlog::info("  Max connections : {}", config.http.max_connections);
    spdlog::info("  Request timeout : {} ms", config.http.request_timeout_ms);
    spdlog::info("  Saved servers   : {}", config.manager.persist_servers
                                             ? config.manager.saved_servers_file
                                             : "(not persisted)");

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    ports::ServerManager manager(config, scanner);
    manager.set_failure_callback([](const ports::ServerInfo& server, const std::string& error) {
        spdlog::warn("Server for {} on port {} is gone: {}", server.root.string(), server.port, error);
    });

    // ─── Start servers ────────────────────────────────────────────────────────
    if (restore) {
        auto result = manager.restore_saved_servers();
        for (auto handle : result.lan_exposed) {
            auto info = manager.server(handle);
            if (!info) continue;
            auto urls = ports::server_urls(info->port, true);
            spdlog::warn("Restored {} on port {} is reachable from the local network{}{}",
                         info->root.string(), info->port,
                         urls.size() > 1 ? " at " : "",
                         urls.size() > 1 ? urls[1] : "");
        }
    }

    std::vector<ports::ServerEntry> wanted = config.servers;
    wanted.insert(wanted.end(), cli_servers.begin(), cli_servers.end());
    for (const auto& entry : wanted) {
        // Restored entries already cover directories served on a previous run
        std::error_code ec;
        auto dir = std::filesystem::weakly_canonical(entry.directory, ec);
        auto running = manager.servers();
        bool already = std::any_of(running.begin(), running.end(), [&](const ports::ServerInfo& s) {
            return !ec && s.root == dir && s.expose_to_lan == entry.expose_to_lan;
        });
        if (already) {
            spdlog::info("{} is already being served", entry.directory);
            continue;
        }

        uint16_t port = entry.port;
        if (port == 0 || manager.is_port_in_use(port)) {
            uint16_t start = port == 0 ? config.manager.default_port : port;
            port = manager.find_available_port(start);
            if (entry.port != 0) {
                spdlog::warn("Port {} in use, using {} for {}", entry.port, port, entry.directory);
            }
        }
        try {
            manager.start_server(port, entry.directory, entry.expose_to_lan);
        } catch (const ports::BindError& e) {
            spdlog::error("Cannot serve {}: {}", entry.directory, e.what());
        }
    }

    if (manager.servers().empty()) {
        spdlog::warn("No servers running; add one with --serve PORT:DIR");
    }
    print_status(manager);

    // ─── Main watchdog loop ───────────────────────────────────────────────────
    auto last_status_time = std::chrono::steady_clock::now();
    constexpr auto status_interval = std::chrono::seconds(60);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        if (manager.reap_failed() > 0) {
            print_status(manager);
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_status_time >= status_interval) {
            last_status_time = now;
            print_status(manager);
        }
    }

    // ─── Shutdown ─────────────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    manager.shutdown();
    spdlog::info("Shutdown complete. Goodbye!");

    return 0;
}
