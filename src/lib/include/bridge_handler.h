#pragma once

#include "bridge.h"
#include "config.h"
#include "entities.h"
#include "event_bus.h"
#include "scheduler.h"
#include "system_client.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class ConnectionState { disconnected, connecting, connected, disposing };
enum class BridgeStatus { unknown, online, offline };

const char* ToString(ConnectionState state);

struct BridgeOptions {
    std::chrono::milliseconds startup_delay{std::chrono::seconds{10}};
    std::chrono::milliseconds initial_backoff{std::chrono::seconds{1}};
    std::chrono::milliseconds max_backoff{std::chrono::seconds{30}};
    int max_connect_attempts = 10;
};

// Wait before connection attempt `attempt + 1`: doubles from initial_backoff,
// capped at max_backoff.
std::chrono::milliseconds BackoffDelay(BridgeOptions const& options, int attempt);

// Entity adopted from a discovery result and managed under the bridge.
struct ManagedEntity {
    EntityUid uid;
    std::string name;
    // Player pid, or the member hash for a group.
    std::string pid;
};

// Switch channel on the bridge selecting one player or group.
struct Channel {
    std::string id;
    std::string label;
    std::map<std::string, std::string> properties;
};

// Published on the bridge's event bus when the system reports changed
// players or groups.
struct MembershipChanged {};

class IBridgeHandler : public IBridge {
public:
    // Connects with bounded retries, then schedules the start-up of the event
    // listener. No-op unless disconnected.
    virtual void Initialize() = 0;
    virtual void Dispose() = 0;

    virtual void ChildHandlerInitialized(ManagedEntity const& entity) = 0;
    virtual void ChildHandlerDisposed(EntityUid const& uid) = 0;

    virtual void HandleBridgeEvent(BridgeEvent const& event) = 0;

    virtual ConnectionState GetConnectionState() const = 0;
    virtual BridgeStatus GetStatus() const = 0;
    virtual std::vector<Channel> GetChannels() const = 0;
};

std::shared_ptr<IBridgeHandler> CreateBridgeHandler(BridgeConfig config,
                                                    std::shared_ptr<ISystemClient> client,
                                                    std::shared_ptr<IScheduler> scheduler,
                                                    EventBus& bus,
                                                    BridgeOptions options = {});
