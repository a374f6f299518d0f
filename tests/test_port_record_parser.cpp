#include "port_record_parser.hpp"
#include <gtest/gtest.h>

using namespace ports;

namespace {

ListeningPortRecord record(uint16_t port, int32_t pid, const std::string& name,
                           const std::string& address) {
    ListeningPortRecord r;
    r.port = port;
    r.pid = pid;
    r.process_name = name;
    r.address = address;
    return r;
}

} // namespace

TEST(FieldOutput, ParsesProcessGroups) {
    auto records = parse_field_output(
        "p100\nclistener\nn127.0.0.1:8080\np200\ncother\nn[::1]:9090");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], record(8080, 100, "listener", "127.0.0.1"));
    EXPECT_EQ(records[1], record(9090, 200, "other", "[::1]"));
}

TEST(FieldOutput, DropsRepeatedPorts) {
    auto records = parse_field_output(
        "p100\nclistener\nn127.0.0.1:8080\nn[::1]:8080\n"
        "p300\ncthird\nn*:8080\nn*:7000\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], record(8080, 100, "listener", "127.0.0.1"));
    EXPECT_EQ(records[1], record(7000, 300, "third", "*"));
}

TEST(FieldOutput, SeveralSocketsPerProcess) {
    auto records = parse_field_output("p42\ncnode\nn*:3000\nn127.0.0.1:3001\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], record(3001, 42, "node", "127.0.0.1"));
}

TEST(FieldOutput, MissingCommandIsUnknown) {
    auto records = parse_field_output("p7\nn*:5000\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].process_name, "unknown");
}

TEST(FieldOutput, CommandDoesNotLeakAcrossProcesses) {
    auto records = parse_field_output("p1\ncfirst\nn*:1000\np2\nn*:2000\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].process_name, "unknown");
}

TEST(FieldOutput, CommandWithSpaces) {
    auto records = parse_field_output("p9\ncGoogle Chrome Helper\nn127.0.0.1:9222\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].process_name, "Google Chrome Helper");
}

TEST(FieldOutput, SkipsUnusableLines) {
    auto records = parse_field_output(
        "n*:1111\n"             // no pid yet
        "pabc\nn*:2222\n"       // bad pid
        "p5\ncx\n"
        "nno-port\n"
        "n*:http\n"
        "n*:70000\n"
        "f12\n"                 // unknown field
        "\n"
        "n*:3333\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], record(3333, 5, "x", "*"));
}

TEST(FieldOutput, EmptyInput) {
    EXPECT_TRUE(parse_field_output("").empty());
    EXPECT_TRUE(parse_listening_ports("").empty());
}

TEST(TabularOutput, ParsesListenLines) {
    const std::string output =
        "COMMAND   PID USER   FD   TYPE DEVICE SIZE/OFF NODE NAME\n"
        "nginx    1234 root    6u  IPv4  12345      0t0  TCP *:80 (LISTEN)\n"
        "nginx    1234 root    7u  IPv6  12346      0t0  TCP [::]:80 (LISTEN)\n"
        "python3  5678 me      3u  IPv4  22222      0t0  TCP 127.0.0.1:8000 (LISTEN)\n"
        "short line\n";
    auto records = parse_tabular_output(output);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], record(80, 1234, "nginx", "*"));
    EXPECT_EQ(records[1], record(8000, 5678, "python3", "127.0.0.1"));
}

TEST(ListeningPorts, DispatchesOnShape) {
    auto tabular = parse_listening_ports(
        "COMMAND PID USER FD TYPE DEVICE SIZE/OFF NODE NAME\n"
        "sshd 1 root 3u IPv4 1 0t0 TCP *:22 (LISTEN)\n");
    ASSERT_EQ(tabular.size(), 1u);
    EXPECT_EQ(tabular[0].port, 22);

    auto fields = parse_listening_ports("p1\ncsshd\nn*:22\n");
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0], tabular[0]);
}
