#pragma once

#include "entities.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <optional>
#include <string>

#include <boost/asio.hpp>

namespace net = boost::asio;

enum class BridgeEventType {
    players_changed,
    groups_changed,
    connection_lost,
    connection_restored,
};

struct BridgeEvent {
    BridgeEventType type;
};

const char* ToString(BridgeEventType type);

// Session with the audio system. Implementations own the wire protocol.
class ISystemClient {
public:
    // `delayed` gives the system time to recover after a restart.
    virtual bool EstablishConnection(std::string const& host, uint16_t port, bool delayed) = 0;
    virtual void CloseConnection() = 0;

    // Keyed by pid. nullopt when the system did not answer.
    virtual std::optional<PlayerMap> FetchPlayers() = 0;
    // Keyed by system group id. nullopt when the system did not answer.
    virtual std::optional<GroupMap> FetchGroups() = 0;

    // Replaces the previous callback; an empty function unregisters.
    virtual void OnEvent(std::function<void(BridgeEvent const&)> callback) = 0;
    virtual void StartEventListener(std::chrono::seconds heartbeat) = 0;

    virtual ~ISystemClient() = default;
};

// Serves the membership stored in a JSON document:
//   {"players": [{"pid", "name", "model", "ip"}],
//    "groups": [{"gid", "name", "members": [pid...]}]}
// The file is watched at the heartbeat pulse; a change is reported as
// players_changed, a vanished file as connection_lost.
std::shared_ptr<ISystemClient> CreateSnapshotClient(net::any_io_executor executor, std::string path);
