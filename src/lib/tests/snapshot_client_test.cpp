#include "system_client.h"

#include <filesystem>
#include <fstream>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

constexpr const char* kSystem = R"({
    "players": [
        {"pid": "101", "name": "Living Room", "model": "HEOS 7", "ip": "192.168.1.31"},
        {"pid": "102", "name": "Kitchen", "model": "HEOS 1", "ip": "192.168.1.32"}
    ],
    "groups": [
        {"gid": "101", "name": "Living Room + Kitchen", "members": ["101", "102"]}
    ]
})";

struct TempFile {
    explicit TempFile(std::string const& name)
        : path(std::filesystem::temp_directory_path() / name) {}

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void Write(std::string const& text) const {
        std::ofstream out(path);
        out << text;
    }

    std::filesystem::path path;
};

} // namespace

TEST_CASE( "snapshot file is served as membership", "[snapshot]" ) {
    net::io_context io_context;
    TempFile file("roomsync_snapshot_test.json");
    file.Write(kSystem);
    auto client = CreateSnapshotClient(io_context.get_executor(), file.path.string());

    REQUIRE_FALSE(client->FetchPlayers());

    REQUIRE(client->EstablishConnection("127.0.0.1", 1255, false));

    auto players = client->FetchPlayers();
    REQUIRE(players);
    REQUIRE(players->size() == 2);
    REQUIRE(players->at("101") == Player{"101", "Living Room", "HEOS 7", "192.168.1.31"});

    auto groups = client->FetchGroups();
    REQUIRE(groups);
    REQUIRE(groups->size() == 1);
    REQUIRE(groups->at("101").members == std::vector<std::string>{"101", "102"});

    client->CloseConnection();
    REQUIRE_FALSE(client->FetchGroups());
    io_context.run();
}

TEST_CASE( "missing or malformed snapshot", "[snapshot]" ) {
    net::io_context io_context;
    TempFile file("roomsync_snapshot_bad.json");
    auto client = CreateSnapshotClient(io_context.get_executor(), file.path.string());

    REQUIRE_FALSE(client->EstablishConnection("127.0.0.1", 1255, false));

    file.Write(R"({"players": [ {"pid": "1")");
    REQUIRE_FALSE(client->EstablishConnection("127.0.0.1", 1255, false));

    file.Write(R"({"players": 5, "groups": []})");
    REQUIRE(client->EstablishConnection("127.0.0.1", 1255, true));
    REQUIRE_FALSE(client->FetchPlayers());
    auto groups = client->FetchGroups();
    REQUIRE(groups);
    REQUIRE(groups->empty());
}

TEST_CASE( "vanished snapshot reports connection lost", "[snapshot]" ) {
    net::io_context io_context;
    TempFile file("roomsync_snapshot_watch.json");
    file.Write(kSystem);
    auto client = CreateSnapshotClient(io_context.get_executor(), file.path.string());
    REQUIRE(client->EstablishConnection("127.0.0.1", 1255, false));

    std::vector<BridgeEventType> events;
    client->OnEvent([&](BridgeEvent const& event) {
        events.push_back(event.type);
        client->CloseConnection();
    });
    client->StartEventListener(std::chrono::seconds{1});
    io_context.poll();

    std::filesystem::remove(file.path);
    io_context.run();

    REQUIRE(events == std::vector<BridgeEventType>{BridgeEventType::connection_lost});
}

TEST_CASE( "event type names", "[snapshot]" ) {
    REQUIRE(std::string(ToString(BridgeEventType::players_changed)) == "players_changed");
    REQUIRE(std::string(ToString(BridgeEventType::connection_restored)) == "connection_restored");
}
