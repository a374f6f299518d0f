#include "config.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace ports;
using ports::test::TempDir;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(Config, MissingFileGivesDefaults) {
    TempDir tmp;
    auto cfg = load_config((tmp.path() / "absent.yaml").string());
    EXPECT_EQ(cfg.http.max_connections, 50);
    EXPECT_EQ(cfg.http.max_header_bytes, 64u * 1024u);
    EXPECT_EQ(cfg.http.request_timeout_ms, 30000);
    EXPECT_EQ(cfg.scanner.command.front(), "lsof");
    EXPECT_EQ(cfg.scanner.cache_ttl_ms, 2000);
    EXPECT_EQ(cfg.manager.default_port, 8080);
    EXPECT_TRUE(cfg.manager.persist_servers);
    EXPECT_TRUE(cfg.servers.empty());
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST(Config, ReadsAllSections) {
    TempDir tmp;
    auto path = tmp.write("config.yaml", R"(
http:
  max_connections: 8
  max_header_bytes: 4096
  request_timeout_ms: 1500
scanner:
  command: [ss, -ltnp]
  cache_ttl_ms: 500
manager:
  default_port: 9100
  persist_servers: false
  saved_servers_file: /var/lib/ports/saved.json
servers:
  - port: 9200
    directory: /srv/site
    expose_to_lan: true
  - directory: /srv/docs
logging:
  level: debug
  file: /var/log/portsd.log
  max_file_size_mb: 5
  max_files: 2
)");

    auto cfg = load_config(path.string());
    EXPECT_EQ(cfg.http.max_connections, 8);
    EXPECT_EQ(cfg.http.max_header_bytes, 4096u);
    EXPECT_EQ(cfg.http.request_timeout_ms, 1500);
    EXPECT_EQ(cfg.scanner.command, (std::vector<std::string>{"ss", "-ltnp"}));
    EXPECT_EQ(cfg.scanner.cache_ttl_ms, 500);
    EXPECT_EQ(cfg.manager.default_port, 9100);
    EXPECT_FALSE(cfg.manager.persist_servers);
    EXPECT_EQ(cfg.manager.saved_servers_file, "/var/lib/ports/saved.json");

    ASSERT_EQ(cfg.servers.size(), 2u);
    EXPECT_EQ(cfg.servers[0].port, 9200);
    EXPECT_EQ(cfg.servers[0].directory, "/srv/site");
    EXPECT_TRUE(cfg.servers[0].expose_to_lan);
    EXPECT_EQ(cfg.servers[1].port, 9100);
    EXPECT_FALSE(cfg.servers[1].expose_to_lan);

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, "/var/log/portsd.log");
    EXPECT_EQ(cfg.logging.max_file_size_mb, 5);
    EXPECT_EQ(cfg.logging.max_files, 2);
}

TEST(Config, EnvironmentOverridesFile) {
    TempDir tmp;
    auto path = tmp.write("config.yaml", "manager:\n  default_port: 9100\n");
    EnvGuard port("PORTS_DEFAULT_PORT", "9300");
    EnvGuard saved("PORTS_SAVED_SERVERS", "/tmp/other.json");
    EnvGuard conns("PORTS_MAX_CONNECTIONS", "12");
    EnvGuard level("LOG_LEVEL", "warn");

    auto cfg = load_config(path.string());
    EXPECT_EQ(cfg.manager.default_port, 9300);
    EXPECT_EQ(cfg.manager.saved_servers_file, "/tmp/other.json");
    EXPECT_EQ(cfg.http.max_connections, 12);
    EXPECT_EQ(cfg.logging.level, "warn");
}

TEST(Config, InvalidEnvironmentValueThrows) {
    TempDir tmp;
    EnvGuard conns("PORTS_MAX_CONNECTIONS", "lots");
    EXPECT_THROW(load_config((tmp.path() / "absent.yaml").string()), std::runtime_error);
}

TEST(Config, MalformedYamlThrows) {
    TempDir tmp;
    auto path = tmp.write("config.yaml", "http: [unterminated\n");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);
}

TEST(Config, ServerWithoutDirectoryThrows) {
    TempDir tmp;
    auto path = tmp.write("config.yaml", "servers:\n  - port: 9000\n");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);
}

TEST(Config, RejectsNonPositiveLimits) {
    TempDir tmp;
    auto zero_conns = tmp.write("a.yaml", "http:\n  max_connections: 0\n");
    EXPECT_THROW(load_config(zero_conns.string()), std::runtime_error);

    auto zero_timeout = tmp.write("b.yaml", "http:\n  request_timeout_ms: -5\n");
    EXPECT_THROW(load_config(zero_timeout.string()), std::runtime_error);

    auto empty_cmd = tmp.write("c.yaml", "scanner:\n  command: []\n");
    EXPECT_THROW(load_config(empty_cmd.string()), std::runtime_error);
}
