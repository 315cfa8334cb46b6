#pragma once

#include "entities.h"

class IDiscoverySink {
public:
    // Re-discovery of a known uid replaces the stored result.
    virtual void EntityDiscovered(DiscoveryResult result) = 0;
    virtual void EntityRemoved(EntityUid const& uid) = 0;

    // Only affect entities that were already adopted.
    virtual void SetEntityStatusOnline(EntityUid const& uid) = 0;
    virtual void SetEntityStatusOffline(EntityUid const& uid) = 0;

    // Drops pending results with a timestamp strictly before `timestamp`.
    virtual void PurgeResultsOlderThan(Timestamp timestamp) = 0;

    virtual ~IDiscoverySink() = default;
};
