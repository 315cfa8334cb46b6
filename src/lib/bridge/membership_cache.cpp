#include "membership_cache.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace {

bool SameSnapshot(Player const& lhs, Player const& rhs) {
    return lhs == rhs;
}

// Member order is not part of a group's snapshot; the member set is already
// the key.
bool SameSnapshot(Group const& lhs, Group const& rhs) {
    return lhs.gid == rhs.gid && lhs.name == rhs.name;
}

template <typename Map>
Map Diff(Map const& current, Map& known, Map& removed) {
    Map added;
    for (auto const& [key, entity] : current) {
        auto it = known.find(key);
        if (it == known.end()) {
            // Gone and back before anyone asked: the sink never saw it leave.
            if (auto pending = removed.find(key); pending != removed.end()) {
                bool unchanged = SameSnapshot(pending->second, entity);
                removed.erase(pending);
                if (unchanged) {
                    continue;
                }
            }
            added.emplace(key, entity);
        } else if (!SameSnapshot(it->second, entity)) {
            added.emplace(key, entity);
        }
    }
    for (auto const& [key, entity] : known) {
        if (!current.contains(key)) {
            removed.insert_or_assign(key, entity);
        }
    }
    known = current;
    return added;
}

} // namespace

PlayerMap MembershipCache::UpdatePlayers(PlayerMap const& current) {
    std::lock_guard lock{mutex_};
    auto added = Diff(current, known_players_, removed_players_);
    spdlog::trace("MembershipCache: {} players, {} new, {} pending removals",
                  current.size(), added.size(), removed_players_.size());
    return added;
}

GroupMap MembershipCache::UpdateGroups(GroupMap const& current) {
    GroupMap by_hash;
    for (auto const& [gid, group] : current) {
        by_hash.insert_or_assign(GroupMemberHash(group), group);
    }
    std::lock_guard lock{mutex_};
    auto added = Diff(by_hash, known_groups_, removed_groups_);
    spdlog::trace("MembershipCache: {} groups, {} new, {} pending removals",
                  by_hash.size(), added.size(), removed_groups_.size());
    return added;
}

PlayerMap MembershipCache::TakeRemovedPlayers() {
    std::lock_guard lock{mutex_};
    return std::exchange(removed_players_, {});
}

GroupMap MembershipCache::TakeRemovedGroups() {
    std::lock_guard lock{mutex_};
    return std::exchange(removed_groups_, {});
}

PlayerMap MembershipCache::GetKnownPlayers() const {
    std::lock_guard lock{mutex_};
    return known_players_;
}

GroupMap MembershipCache::GetKnownGroups() const {
    std::lock_guard lock{mutex_};
    return known_groups_;
}

void MembershipCache::Clear() {
    std::lock_guard lock{mutex_};
    known_players_.clear();
    removed_players_.clear();
    known_groups_.clear();
    removed_groups_.clear();
}
