#pragma once

#include "entities.h"

#include <functional>
#include <optional>
#include <string>

// Bridge side of the membership state. Each query is an atomic
// query-and-clear: a concurrent caller never sees the same addition or
// removal twice.
class IBridge {
public:
    // nullopt: no data available from the system right now.
    virtual std::optional<PlayerMap> QueryNewPlayers() = 0;

    // Keyed by group member hash. nullopt: no data available.
    virtual std::optional<GroupMap> QueryNewGroups() = 0;

    virtual GroupMap QueryRemovedGroups() = 0;
    virtual PlayerMap QueryRemovedPlayers() = 0;

    // Listener is called whenever the system reports changed players or groups.
    virtual int RegisterMembershipListener(std::function<void()> listener) = 0;
    virtual void UnregisterMembershipListener(int token) = 0;

    virtual std::string GetUid() const = 0;

    virtual ~IBridge() = default;
};
