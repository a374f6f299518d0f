#pragma once

#include "config.hpp"
#include "path_sandbox.hpp"
#include "response_builder.hpp"
#include <cstdint>
#include <string>

namespace ports {

// Bookkeeping a session needs from the listener that accepted it.
// All calls are keyed by the session id and safe to repeat.
class SessionOwner {
public:
    virtual ~SessionOwner() = default;

    // Disarm the deadline. Returns false if it already fired or the
    // listener cancelled the session; the session must then close silently.
    virtual bool cancel_deadline(uint64_t session_id) = 0;

    // Deregister and close the socket. Idempotent.
    virtual void close_session(uint64_t session_id) = 0;
};

// One accepted connection: frame a request, answer it once, close.
class ConnectionSession {
public:
    ConnectionSession(uint64_t id, int fd, const PathSandbox& sandbox,
                      const HttpConfig& config, SessionOwner& owner);

    // Non-copyable
    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // Runs to completion on the calling thread; always ends with close_session()
    void run();

private:
    void serve();
    void respond(const HttpResponse& res);

    uint64_t id_;
    int fd_;
    const PathSandbox& sandbox_;
    const HttpConfig& config_;
    SessionOwner& owner_;
};

// Write all of `data`, retrying on short writes. Returns false on error.
bool send_all(int fd, const std::string& data);

} // namespace ports
