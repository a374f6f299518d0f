#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ports {

struct ListeningPortRecord {
    uint16_t port = 0;
    int32_t pid = 0;
    std::string process_name;
    std::string address;

    bool operator==(const ListeningPortRecord& other) const {
        return port == other.port && pid == other.pid &&
               process_name == other.process_name && address == other.address;
    }
};

// Parse lsof -F output ("p<pid>", "c<command>", "n<address:port>" lines).
// At most one record per port, first occurrence wins, input order kept.
std::vector<ListeningPortRecord> parse_field_output(const std::string& output);

// Parse default tabular lsof output (header line starting with COMMAND)
std::vector<ListeningPortRecord> parse_tabular_output(const std::string& output);

// Dispatch on the output shape; field-prefixed is the expected form
std::vector<ListeningPortRecord> parse_listening_ports(const std::string& output);

} // namespace ports
