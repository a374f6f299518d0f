#pragma once

#include <string>
#include <vector>

namespace ports {

struct CommandResult {
    bool spawned = false;   // false if the process could not be started
    int exit_status = -1;   // exit code, or 128 + signal number
    std::string out;
    std::string err;
    std::string spawn_error;
};

// Run argv[0] (searched in PATH) and wait for it, capturing stdout and stderr.
// Blocking; call it off latency-sensitive threads.
CommandResult run_command(const std::vector<std::string>& argv);

} // namespace ports
