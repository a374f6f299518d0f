#include "port_scanner.hpp"
#include <spdlog/spdlog.h>

namespace ports {

PortScanner::PortScanner(const ScannerConfig& config)
    : PortScanner(config, nullptr)
{
}

PortScanner::PortScanner(const ScannerConfig& config, CaptureFn capture)
    : config_(config)
    , capture_(std::move(capture))
{
    if (!capture_) {
        capture_ = [command = config_.command]() { return run_command(command); };
    }
}

std::vector<ListeningPortRecord> PortScanner::scan() {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    if (cache_) {
        auto age = std::chrono::steady_clock::now() - cache_->captured_at;
        if (age < std::chrono::milliseconds(config_.cache_ttl_ms)) {
            return cache_->records;
        }
    }
    return capture_locked();
}

std::vector<ListeningPortRecord> PortScanner::force_scan() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return capture_locked();
}

std::vector<ListeningPortRecord> PortScanner::capture_locked() {
    CommandResult result = capture_();

    std::vector<ListeningPortRecord> records;
    if (!result.spawned) {
        spdlog::error("Scanner: Failed to run {}: {}", config_.command.front(), result.spawn_error);
    } else if (result.exit_status != 0 && result.out.empty()) {
        spdlog::error("Scanner: {} exited with status {}: {}", config_.command.front(),
                      result.exit_status, result.err);
    } else {
        if (result.exit_status != 0) {
            spdlog::warn("Scanner: {} exited with status {}: {}", config_.command.front(),
                         result.exit_status, result.err);
        }
        records = parse_listening_ports(result.out);
    }

    cache_ = CacheEntry{records, std::chrono::steady_clock::now()};
    spdlog::debug("Scanner: {} listening ports", records.size());
    return records;
}

} // namespace ports
