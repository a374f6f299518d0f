#include "http_server.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>

namespace fs = std::filesystem;

namespace ports {

HttpServer::HttpServer(uint16_t port, fs::path root, bool expose_to_lan,
                       const HttpConfig& config)
    : port_(port)
    , root_(std::move(root))
    , expose_to_lan_(expose_to_lan)
    , config_(config)
{
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (server_fd_ >= 0) {
        spdlog::warn("HTTP: Server on port {} already running", port_);
        return;
    }

    std::unique_ptr<PathSandbox> sandbox;
    try {
        if (!fs::is_directory(root_)) {
            throw BindError("Not a directory: " + root_.string());
        }
        sandbox = std::make_unique<PathSandbox>(root_);
    } catch (const fs::filesystem_error& e) {
        throw BindError("Cannot use root " + root_.string() + ": " + e.what());
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::string err = std::strerror(errno);
        spdlog::error("HTTP: Failed to create socket: {}", err);
        throw BindError("socket: " + err);
    }

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: SO_REUSEADDR failed: {}", std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(expose_to_lan_ ? INADDR_ANY : INADDR_LOOPBACK);
    addr.sin_port = htons(port_);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        spdlog::error("HTTP: Failed to bind to port {}: {}", port_, err);
        throw BindError("Cannot bind port " + std::to_string(port_) + ": " + err);
    }

    if (::listen(fd, 128) < 0) {
        std::string err = std::strerror(errno);
        ::close(fd);
        spdlog::error("HTTP: Failed to listen on port {}: {}", port_, err);
        throw BindError("Cannot listen on port " + std::to_string(port_) + ": " + err);
    }

    if (port_ == 0) {
        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            port_ = ntohs(bound.sin_port);
        }
    }

    server_fd_ = fd;
    sandbox_ = std::move(sandbox);
    root_ = sandbox_->root();
    pool_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.max_connections));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reaper_stop_ = false;
    }

    running_.store(true);
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    reaper_thread_ = std::thread(&HttpServer::reaper_loop, this);
    spdlog::info("HTTP server bound to {}:{} (root: {})",
                 expose_to_lan_ ? "0.0.0.0" : "127.0.0.1", port_, root_.string());
}

void HttpServer::stop() {
    if (server_fd_ < 0) {
        return;
    }

    running_.store(false);
    ::shutdown(server_fd_, SHUT_RDWR);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Cancel every open session; each one deregisters itself on the pool
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : sessions_) {
            slot.cancelled = true;
            slot.deadline_armed = false;
            ::shutdown(slot.fd, SHUT_RDWR);
        }
        reaper_stop_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }

    pool_->stop();
    pool_.reset();

    ::close(server_fd_);
    server_fd_ = -1;
    spdlog::info("HTTP server on port {} stopped", port_);
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (!running_.load()) {
                break;
            }
            int err = errno;
            if (err == EINTR || err == ECONNABORTED || err == EAGAIN) {
                continue;
            }
            if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
                spdlog::warn("HTTP: Accept on port {} out of resources: {}", port_, std::strerror(err));
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }

            std::string msg = "accept failed: " + std::string(std::strerror(err));
            spdlog::error("HTTP: Listener on port {} failed: {}", port_, msg);
            running_.store(false);
            if (failure_cb_) {
                failure_cb_(msg);
            }
            break;
        }

        uint64_t id = 0;
        bool busy = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(sessions_.size()) >= config_.max_connections) {
                busy = true;
            } else {
                id = next_session_id_++;
                SessionSlot slot;
                slot.fd = client_fd;
                slot.deadline = std::chrono::steady_clock::now() +
                                std::chrono::milliseconds(config_.request_timeout_ms);
                sessions_.emplace(id, slot);
            }
        }

        if (busy) {
            reject_busy(client_fd);
            continue;
        }
        reaper_cv_.notify_one();

        bool queued = pool_->submit([this, id, client_fd]() {
            ConnectionSession session(id, client_fd, *sandbox_, config_, *this);
            session.run();
        });
        if (!queued) {
            close_session(id);
        }
    }
}

void HttpServer::reject_busy(int client_fd) {
    spdlog::warn("HTTP: Max connections ({}) reached on port {}, rejecting",
                 config_.max_connections, port_);
    send_all(client_fd, make_error_response(503).serialize());
    ::close(client_fd);
}

void HttpServer::reaper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!reaper_stop_) {
        auto now = std::chrono::steady_clock::now();
        std::optional<std::chrono::steady_clock::time_point> next;
        for (auto& [id, slot] : sessions_) {
            if (!slot.deadline_armed) continue;
            if (now >= slot.deadline) {
                slot.deadline_armed = false;
                slot.cancelled = true;
                ::shutdown(slot.fd, SHUT_RDWR);
                spdlog::debug("HTTP: Session {} on port {} timed out", id, port_);
            } else if (!next || slot.deadline < *next) {
                next = slot.deadline;
            }
        }

        // Sleep until the earliest armed deadline; a new session or stop() wakes us
        if (next) {
            reaper_cv_.wait_until(lock, *next);
        } else {
            reaper_cv_.wait(lock);
        }
    }
}

bool HttpServer::cancel_deadline(uint64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.cancelled) {
        return false;
    }
    it->second.deadline_armed = false;
    return true;
}

void HttpServer::close_session(uint64_t session_id) {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            fd = it->second.fd;
            sessions_.erase(it);
        }
    }
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace ports
