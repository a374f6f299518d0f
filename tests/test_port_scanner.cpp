#include "port_scanner.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace ports;

namespace {

CommandResult ok_result(const std::string& out) {
    CommandResult r;
    r.spawned = true;
    r.exit_status = 0;
    r.out = out;
    return r;
}

} // namespace

TEST(PortScanner, CachesWithinTtl) {
    std::atomic<int> calls{0};
    ScannerConfig config;
    config.cache_ttl_ms = 60000;
    PortScanner scanner(config, [&]() {
        calls++;
        return ok_result("p100\nclistener\nn127.0.0.1:8080\n");
    });

    auto first = scanner.scan();
    auto second = scanner.scan();
    EXPECT_EQ(calls.load(), 1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first, second);
}

TEST(PortScanner, ForceScanAlwaysCaptures) {
    std::atomic<int> calls{0};
    ScannerConfig config;
    config.cache_ttl_ms = 60000;
    PortScanner scanner(config, [&]() {
        calls++;
        return ok_result("p" + std::to_string(calls.load()) + "\ncx\nn*:9000\n");
    });

    scanner.scan();
    auto forced = scanner.force_scan();
    EXPECT_EQ(calls.load(), 2);
    ASSERT_EQ(forced.size(), 1u);
    EXPECT_EQ(forced[0].pid, 2);

    // The forced result refreshes the cache
    auto cached = scanner.scan();
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(cached, forced);
}

TEST(PortScanner, ExpiredCacheIsRefreshed) {
    std::atomic<int> calls{0};
    ScannerConfig config;
    config.cache_ttl_ms = 30;
    PortScanner scanner(config, [&]() {
        calls++;
        return ok_result("");
    });

    scanner.scan();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    scanner.scan();
    EXPECT_EQ(calls.load(), 2);
}

TEST(PortScanner, SpawnFailureYieldsEmpty) {
    PortScanner scanner(ScannerConfig{}, []() {
        CommandResult r;
        r.spawn_error = "lsof: No such file or directory";
        return r;
    });
    EXPECT_TRUE(scanner.scan().empty());
}

TEST(PortScanner, FailureWithoutOutputYieldsEmpty) {
    PortScanner scanner(ScannerConfig{}, []() {
        CommandResult r;
        r.spawned = true;
        r.exit_status = 1;
        r.err = "permission denied";
        return r;
    });
    EXPECT_TRUE(scanner.scan().empty());
}

TEST(PortScanner, NonZeroExitWithOutputStillParses) {
    PortScanner scanner(ScannerConfig{}, []() {
        CommandResult r = ok_result("p1\ncsshd\nn*:22\n");
        r.exit_status = 1;
        r.err = "lsof: WARNING: can't stat() fuse file system";
        return r;
    });
    auto records = scanner.scan();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].port, 22);
}

TEST(PortScanner, ConcurrentScansShareOneCapture) {
    std::atomic<int> calls{0};
    ScannerConfig config;
    config.cache_ttl_ms = 60000;
    PortScanner scanner(config, [&]() {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return ok_result("p1\ncx\nn*:1234\n");
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() { EXPECT_EQ(scanner.scan().size(), 1u); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(calls.load(), 1);
}

TEST(PortScanner, MissingCommandBinary) {
    ScannerConfig config;
    config.command = {"/nonexistent/ports-test-lsof"};
    PortScanner scanner(config);
    EXPECT_TRUE(scanner.force_scan().empty());
}
