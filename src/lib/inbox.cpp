#include "inbox.h"

#include <spdlog/spdlog.h>

const char* ToString(ThingStatus status) {
    switch (status) {
        case ThingStatus::unknown: return "unknown";
        case ThingStatus::online: return "online";
        case ThingStatus::offline: return "offline";
    }
    return "unknown";
}

DiscoveryInbox::DiscoveryInbox(EventBus& bus, bool auto_approve)
    : bus_(bus)
    , auto_approve_(auto_approve) {}

void DiscoveryInbox::EntityDiscovered(DiscoveryResult result) {
    std::lock_guard lock{mutex_};
    auto uid = result.uid;
    if (things_.contains(uid)) {
        spdlog::debug("Inbox: {} is already a thing, result ignored", uid.ToString());
        return;
    }
    results_.insert_or_assign(uid, result);
    bus_.Publish<ResultAdded>(ResultAdded{std::move(result)});
    if (auto_approve_) {
        ApproveLocked(uid);
    }
}

void DiscoveryInbox::EntityRemoved(EntityUid const& uid) {
    std::lock_guard lock{mutex_};
    if (results_.erase(uid) != 0) {
        bus_.Publish<ResultRemoved>(ResultRemoved{uid});
    }
}

void DiscoveryInbox::SetEntityStatusOnline(EntityUid const& uid) {
    SetStatus(uid, ThingStatus::online);
}

void DiscoveryInbox::SetEntityStatusOffline(EntityUid const& uid) {
    SetStatus(uid, ThingStatus::offline);
}

void DiscoveryInbox::PurgeResultsOlderThan(Timestamp timestamp) {
    std::lock_guard lock{mutex_};
    for (auto it = results_.begin(); it != results_.end();) {
        if (it->second.timestamp < timestamp) {
            spdlog::trace("Inbox: purge stale result {}", it->first.ToString());
            bus_.Publish<ResultRemoved>(ResultRemoved{it->first});
            it = results_.erase(it);
        } else {
            ++it;
        }
    }
}

bool DiscoveryInbox::Approve(EntityUid const& uid) {
    std::lock_guard lock{mutex_};
    return ApproveLocked(uid);
}

bool DiscoveryInbox::RemoveThing(EntityUid const& uid) {
    std::lock_guard lock{mutex_};
    if (things_.erase(uid) == 0) {
        return false;
    }
    bus_.Publish<ThingRemoved>(ThingRemoved{uid});
    return true;
}

std::vector<DiscoveryResult> DiscoveryInbox::GetResults() const {
    std::lock_guard lock{mutex_};
    std::vector<DiscoveryResult> res;
    for (auto const& [uid, result] : results_) {
        res.push_back(result);
    }
    return res;
}

std::vector<Thing> DiscoveryInbox::GetThings() const {
    std::lock_guard lock{mutex_};
    std::vector<Thing> res;
    for (auto const& [uid, thing] : things_) {
        res.push_back(thing);
    }
    return res;
}

std::optional<Thing> DiscoveryInbox::GetThing(EntityUid const& uid) const {
    std::lock_guard lock{mutex_};
    if (auto it = things_.find(uid); it != things_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool DiscoveryInbox::ApproveLocked(EntityUid const& uid) {
    auto it = results_.find(uid);
    if (it == results_.end()) {
        return false;
    }
    Thing thing{
        .uid = uid,
        .label = it->second.label,
        .properties = it->second.properties,
        .bridge_uid = it->second.bridge_uid,
        .status = ThingStatus::online,
    };
    results_.erase(it);
    things_.insert_or_assign(uid, thing);
    spdlog::debug("Inbox: approved {}", uid.ToString());
    bus_.Publish<ThingAdded>(ThingAdded{std::move(thing)});
    return true;
}

void DiscoveryInbox::SetStatus(EntityUid const& uid, ThingStatus status) {
    std::lock_guard lock{mutex_};
    auto it = things_.find(uid);
    if (it == things_.end()) {
        spdlog::debug("Inbox: no thing {}, status {} not applied", uid.ToString(), ToString(status));
        return;
    }
    if (it->second.status == status) {
        return;
    }
    it->second.status = status;
    bus_.Publish<ThingStatusChanged>(ThingStatusChanged{uid, status});
}
