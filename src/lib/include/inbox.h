#pragma once

#include "discovery_sink.h"
#include "entities.h"
#include "event_bus.h"

#include <map>
#include <mutex>
#include <optional>
#include <vector>

enum class ThingStatus { unknown, online, offline };

const char* ToString(ThingStatus status);

struct Thing {
    EntityUid uid;
    std::string label;
    std::map<std::string, std::string> properties;
    std::string bridge_uid;
    ThingStatus status{ThingStatus::unknown};
};

// Inbox notifications, published on the event bus.
struct ResultAdded { DiscoveryResult result; };
struct ResultRemoved { EntityUid uid; };
struct ThingAdded { Thing thing; };
struct ThingStatusChanged { EntityUid uid; ThingStatus status; };
struct ThingRemoved { EntityUid uid; };

// Pending discovery results plus the things adopted from them.
class DiscoveryInbox : public IDiscoverySink {
public:
    DiscoveryInbox(EventBus& bus, bool auto_approve);

    void EntityDiscovered(DiscoveryResult result) override;
    void EntityRemoved(EntityUid const& uid) override;
    void SetEntityStatusOnline(EntityUid const& uid) override;
    void SetEntityStatusOffline(EntityUid const& uid) override;
    void PurgeResultsOlderThan(Timestamp timestamp) override;

    // Adopts a pending result as a thing. False when no result is pending.
    bool Approve(EntityUid const& uid);
    bool RemoveThing(EntityUid const& uid);

    std::vector<DiscoveryResult> GetResults() const;
    std::vector<Thing> GetThings() const;
    std::optional<Thing> GetThing(EntityUid const& uid) const;

private:
    bool ApproveLocked(EntityUid const& uid);
    void SetStatus(EntityUid const& uid, ThingStatus status);

private:
    EventBus& bus_;
    bool auto_approve_;

    mutable std::mutex mutex_;
    std::map<EntityUid, DiscoveryResult> results_;
    std::map<EntityUid, Thing> things_;
};
