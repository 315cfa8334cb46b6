#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE( "minimal config takes defaults", "[config]" ) {
    auto config = ParseConfig(R"({"bridge": {"host": "192.168.1.20"}})");

    REQUIRE(config.bridge.host == "192.168.1.20");
    REQUIRE(config.bridge.port == kDefaultBridgePort);
    REQUIRE(config.bridge.heartbeat == std::chrono::seconds{60});
    REQUIRE(config.bridge.name == "HEOS Bridge");
    REQUIRE(config.bridge.uid.empty());
    REQUIRE(config.log_level == "info");
    REQUIRE(config.snapshot_file == "system.json");
    REQUIRE(config.auto_approve);
}

TEST_CASE( "full config", "[config]" ) {
    auto config = ParseConfig(R"({
        "log_level": "debug",
        "snapshot_file": "/tmp/heos.json",
        "auto_approve": false,
        "bridge": {
            "uid": "bridge-7",
            "name": "Living Room Bridge",
            "host": "heos.local",
            "port": 1300,
            "heartbeat": 15
        }
    })");

    REQUIRE(config.log_level == "debug");
    REQUIRE(config.snapshot_file == "/tmp/heos.json");
    REQUIRE_FALSE(config.auto_approve);
    REQUIRE(config.bridge.uid == "bridge-7");
    REQUIRE(config.bridge.name == "Living Room Bridge");
    REQUIRE(config.bridge.host == "heos.local");
    REQUIRE(config.bridge.port == 1300);
    REQUIRE(config.bridge.heartbeat == std::chrono::seconds{15});
}

TEST_CASE( "invalid configs are rejected", "[config]" ) {
    REQUIRE_THROWS_AS(ParseConfig("{not json"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig("[]"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig("{}"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": 5})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": {}})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": {"host": "h", "port": 0}})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": {"host": "h", "port": 70000}})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": {"host": "h", "heartbeat": 0}})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"bridge": {"host": 12}})"), ConfigError);
    REQUIRE_THROWS_AS(ParseConfig(R"({"auto_approve": "yes", "bridge": {"host": "h"}})"), ConfigError);
}

TEST_CASE( "load config from file", "[config]" ) {
    auto path = std::filesystem::temp_directory_path() / "roomsync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"bridge": {"host": "10.0.0.2", "port": 1256}})";
    }

    auto config = LoadConfig(path.string());
    REQUIRE(config.bridge.host == "10.0.0.2");
    REQUIRE(config.bridge.port == 1256);

    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(LoadConfig(path.string()), ConfigError);
}
