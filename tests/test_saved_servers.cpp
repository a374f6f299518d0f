#include "saved_servers.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace ports;
using ports::test::TempDir;

TEST(SavedServers, DecodesEntries) {
    auto servers = decode_saved_servers(R"([
        {"port": 8080, "directoryPath": "/srv/site", "exposeToLAN": true},
        {"port": 8081, "directoryPath": "/srv/docs", "exposeToLAN": false}
    ])");
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0].port, 8080);
    EXPECT_EQ(servers[0].directory_path, "/srv/site");
    EXPECT_TRUE(servers[0].expose_to_lan);
    EXPECT_FALSE(servers[1].expose_to_lan);
}

TEST(SavedServers, MissingLanFlagDefaultsToFalse) {
    auto servers = decode_saved_servers(R"([{"port": 9000, "directoryPath": "/tmp"}])");
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_FALSE(servers[0].expose_to_lan);
}

TEST(SavedServers, SkipsMalformedEntries) {
    auto servers = decode_saved_servers(R"([
        {"directoryPath": "/no/port"},
        {"port": "8080", "directoryPath": "/string/port"},
        {"port": 70000, "directoryPath": "/too/big"},
        {"port": -1, "directoryPath": "/negative"},
        {"port": 8082},
        42,
        {"port": 8083, "directoryPath": "/good"}
    ])");
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].port, 8083);
    EXPECT_EQ(servers[0].directory_path, "/good");
}

TEST(SavedServers, InvalidDocumentYieldsEmpty) {
    EXPECT_TRUE(decode_saved_servers("not json").empty());
    EXPECT_TRUE(decode_saved_servers(R"({"port": 8080})").empty());
    EXPECT_TRUE(decode_saved_servers("").empty());
}

TEST(SavedServers, EncodesWithPersistedKeys) {
    SavedServer s;
    s.port = 8123;
    s.directory_path = "/srv/x";
    s.expose_to_lan = true;

    auto doc = nlohmann::json::parse(encode_saved_servers({s}));
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc[0]["port"], 8123);
    EXPECT_EQ(doc[0]["directoryPath"], "/srv/x");
    EXPECT_EQ(doc[0]["exposeToLAN"], true);
}

TEST(SavedServers, FileSaveLoadRemove) {
    TempDir tmp;
    std::string path = (tmp.path() / "saved.json").string();
    EXPECT_TRUE(load_saved_servers(path).empty());

    SavedServer s;
    s.port = 8080;
    s.directory_path = tmp.path().string();
    ASSERT_TRUE(save_saved_servers(path, {s}));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    auto loaded = load_saved_servers(path);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].port, 8080);
    EXPECT_EQ(loaded[0].directory_path, tmp.path().string());

    remove_saved_servers(path);
    EXPECT_FALSE(std::filesystem::exists(path));
    remove_saved_servers(path);
}

TEST(SavedServers, SaveIntoMissingDirectoryFails) {
    TempDir tmp;
    EXPECT_FALSE(save_saved_servers((tmp.path() / "no" / "saved.json").string(), {}));
}
