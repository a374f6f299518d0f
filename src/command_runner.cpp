#include "command_runner.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace ports {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drain both pipes until each reports EOF
void read_pipes(int& out_fd, int& err_fd, std::string& out, std::string& err) {
    char buf[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll on command output failed: {}", std::strerror(errno));
            close_fd(out_fd);
            close_fd(err_fd);
            return;
        }

        for (int i = 0; i < 2; i++) {
            int& fd = i == 0 ? out_fd : err_fd;
            std::string& sink = i == 0 ? out : err;
            if (fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);
            }
        }
    }
}

} // namespace

CommandResult run_command(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.spawn_error = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure errno back to the parent
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.spawn_error = std::string("pipe: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    std::vector<char*> av;
    for (const auto& a : argv) av.push_back(const_cast<char*>(a.c_str()));
    av.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(av[0], av.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    if (pid < 0) {
        result.spawn_error = std::string("fork: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        close_fd(exec_pipe[0]);
        return result;
    }

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    read_pipes(out_pipe[0], err_pipe[0], result.out, result.err);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.spawn_error = std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.spawn_error = argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }

    result.spawned = true;
    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace ports
