#pragma once

#include "command_runner.hpp"
#include "config.hpp"
#include "port_record_parser.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace ports {

// Enumerates listening TCP sockets through an external command,
// with a short-lived cache shared by all callers.
class PortScanner {
public:
    // Produces the raw command result; replaceable for tests
    using CaptureFn = std::function<CommandResult()>;

    explicit PortScanner(const ScannerConfig& config);
    PortScanner(const ScannerConfig& config, CaptureFn capture);

    // Non-copyable
    PortScanner(const PortScanner&) = delete;
    PortScanner& operator=(const PortScanner&) = delete;

    // Cached result if younger than the TTL, else a fresh capture
    std::vector<ListeningPortRecord> scan();

    // Always captures and refreshes the cache
    std::vector<ListeningPortRecord> force_scan();

private:
    struct CacheEntry {
        std::vector<ListeningPortRecord> records;
        std::chrono::steady_clock::time_point captured_at;
    };

    // Caller holds cache_mutex_
    std::vector<ListeningPortRecord> capture_locked();

    ScannerConfig config_;
    CaptureFn capture_;

    std::mutex cache_mutex_;
    std::optional<CacheEntry> cache_;
};

} // namespace ports
