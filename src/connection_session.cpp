#include "connection_session.hpp"
#include "http_util.hpp"
#include "request_handler.hpp"
#include "request_parser.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <cerrno>
#include <exception>

namespace ports {

static const char kHeaderTerminator[] = "\r\n\r\n";

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

ConnectionSession::ConnectionSession(uint64_t id, int fd, const PathSandbox& sandbox,
                                     const HttpConfig& config, SessionOwner& owner)
    : id_(id)
    , fd_(fd)
    , sandbox_(sandbox)
    , config_(config)
    , owner_(owner)
{
}

void ConnectionSession::run() {
    try {
        serve();
    } catch (const std::exception& e) {
        spdlog::error("HTTP: Session {} failed: {}", id_, e.what());
    }
    owner_.close_session(id_);
}

void ConnectionSession::serve() {
    std::string buffer;
    char chunk[4096];
    size_t header_end = std::string::npos;

    // Frame the header block
    for (;;) {
        header_end = buffer.find(kHeaderTerminator);
        if (header_end != std::string::npos) {
            if (header_end + 4 > config_.max_header_bytes) {
                header_end = std::string::npos;
            } else {
                break;
            }
        }
        if (buffer.size() > config_.max_header_bytes) {
            if (owner_.cancel_deadline(id_)) {
                spdlog::warn("HTTP: Session {} header block over {} bytes", id_,
                             config_.max_header_bytes);
                respond(make_error_response(413));
            }
            return;
        }

        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // Deadline fired, listener stopped, client vanished or sent a partial request
            if (!owner_.cancel_deadline(id_)) {
                spdlog::debug("HTTP: Session {} cancelled", id_);
                return;
            }
            if (n == 0) {
                respond(make_error_response(400));
            }
            return;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }

    if (!owner_.cancel_deadline(id_)) {
        return;
    }

    std::string header_block = buffer.substr(0, header_end);
    if (!is_valid_utf8(header_block)) {
        respond(make_error_response(400));
        return;
    }

    auto parsed = parse_request(header_block);
    if (std::holds_alternative<int>(parsed)) {
        respond(make_error_response(std::get<int>(parsed)));
        return;
    }

    const auto& req = std::get<HttpRequest>(parsed);
    HttpResponse res = handle_request(req, sandbox_);
    spdlog::debug("HTTP: {} {} -> {}", req.method, req.target, res.status);
    respond(res);
}

void ConnectionSession::respond(const HttpResponse& res) {
    if (!send_all(fd_, res.serialize())) {
        spdlog::debug("HTTP: Session {} write failed (errno {})", id_, errno);
    }
}

} // namespace ports
