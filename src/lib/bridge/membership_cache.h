#pragma once

#include "entities.h"

#include <mutex>

// Last observed membership of the system plus the removals not yet taken.
// Every method locks, so each update or take is one atomic step.
class MembershipCache {
public:
    // Returns players that are new or whose snapshot changed. Players missing
    // from `current` move to the removed set.
    PlayerMap UpdatePlayers(PlayerMap const& current);

    // `current` is keyed by system group id; the result by member hash.
    GroupMap UpdateGroups(GroupMap const& current);

    PlayerMap TakeRemovedPlayers();
    GroupMap TakeRemovedGroups();

    PlayerMap GetKnownPlayers() const;
    GroupMap GetKnownGroups() const;

    void Clear();

private:
    mutable std::mutex mutex_;
    PlayerMap known_players_;
    PlayerMap removed_players_;
    GroupMap known_groups_;
    GroupMap removed_groups_;
};
