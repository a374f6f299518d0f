#pragma once

#include "config.hpp"
#include "connection_session.hpp"
#include "path_sandbox.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ports {

// Static file server for one directory on one port
class HttpServer : private SessionOwner {
public:
    // Called from the accept thread if the listener dies unexpectedly
    using FailureCallback = std::function<void(const std::string& error)>;

    HttpServer(uint16_t port, std::filesystem::path root, bool expose_to_lan,
               const HttpConfig& config = HttpConfig{});
    ~HttpServer() override;

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Throws BindError; on failure nothing is left open
    void start();

    // Hard stop: cancels every open session and releases the socket. Idempotent.
    void stop();

    bool is_running() const { return running_.load(); }

    // Bound port once started (resolves port 0)
    uint16_t port() const { return port_; }
    const std::filesystem::path& root() const { return root_; }
    bool expose_to_lan() const { return expose_to_lan_; }

    size_t active_connections() const;

    void set_failure_callback(FailureCallback cb) { failure_cb_ = std::move(cb); }

private:
    struct SessionSlot {
        int fd = -1;
        std::chrono::steady_clock::time_point deadline;
        bool deadline_armed = true;
        bool cancelled = false;
    };

    void accept_loop();
    void reaper_loop();
    void reject_busy(int client_fd);

    bool cancel_deadline(uint64_t session_id) override;
    void close_session(uint64_t session_id) override;

    uint16_t port_;
    std::filesystem::path root_;
    bool expose_to_lan_;
    HttpConfig config_;

    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::thread reaper_thread_;
    std::unique_ptr<PathSandbox> sandbox_;
    std::unique_ptr<WorkerPool> pool_;
    FailureCallback failure_cb_;

    // Guards sessions_, next_session_id_, reaper_stop_ and all deadlines
    mutable std::mutex mutex_;
    std::condition_variable reaper_cv_;
    bool reaper_stop_ = true;
    std::unordered_map<uint64_t, SessionSlot> sessions_;
    uint64_t next_session_id_ = 1;
};

} // namespace ports
