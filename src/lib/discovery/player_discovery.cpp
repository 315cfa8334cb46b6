#include "player_discovery.h"

#include <atomic>
#include <mutex>
#include <optional>

#include <spdlog/spdlog.h>

namespace {

DiscoveryResult MakePlayerResult(Player const& player, std::string const& bridge_uid, Timestamp now) {
    return DiscoveryResult{
        .uid = PlayerUid(player),
        .label = player.name,
        .properties = {
            {kPropName, player.name},
            {kPropPid, player.pid},
            {kPropModel, player.model},
            {kPropHost, player.ip},
        },
        .bridge_uid = bridge_uid,
        .timestamp = now,
    };
}

DiscoveryResult MakeGroupResult(Group const& group, std::string const& bridge_uid, Timestamp now) {
    return DiscoveryResult{
        .uid = GroupUid(group),
        .label = group.name,
        .properties = {
            {kPropName, group.name},
            {kPropMembers, GroupMembersAsString(group)},
        },
        .bridge_uid = bridge_uid,
        .timestamp = now,
    };
}

} // namespace

class PlayerDiscovery : public IPlayerDiscovery, public std::enable_shared_from_this<PlayerDiscovery> {
public:
    PlayerDiscovery(std::shared_ptr<IBridge> bridge, std::shared_ptr<IDiscoverySink> sink,
                    std::shared_ptr<IScheduler> scheduler, DiscoveryOptions options)
        : bridge_(std::move(bridge))
        , sink_(std::move(sink))
        , scheduler_(std::move(scheduler))
        , options_(std::move(options)) {}

    ~PlayerDiscovery() override {
        if (listener_token_) {
            bridge_->UnregisterMembershipListener(*listener_token_);
        }
        StopBackgroundDiscovery();
        std::lock_guard lock{scan_mutex_};
        if (search_job_) {
            search_job_->Cancel();
        }
    }

    void RegisterWithBridge() {
        std::weak_ptr<PlayerDiscovery> weak = shared_from_this();
        listener_token_ = bridge_->RegisterMembershipListener([weak] {
            if (auto self = weak.lock()) {
                self->PlayerChanged();
            }
        });
    }

    void StartScan() override {
        std::lock_guard lock{scan_mutex_};
        spdlog::debug("Start manual scan for players on bridge {}", bridge_->GetUid());
        scanning_ = true;
        if (search_job_) {
            search_job_->Cancel();
        }
        std::weak_ptr<PlayerDiscovery> weak = shared_from_this();
        search_job_ = scheduler_->Schedule([weak] {
            if (auto self = weak.lock()) {
                self->StopScan();
            }
        }, options_.search_time);

        auto started = options_.now();
        sink_->PurgeResultsOlderThan(last_scan_);
        // Only a completed manual scan moves the purge mark.
        if (RunScanPass() && started > last_scan_) {
            last_scan_ = started;
        }
    }

    void StopScan() override {
        std::lock_guard lock{scan_mutex_};
        spdlog::debug("Stop scan for players on bridge {}", bridge_->GetUid());
        if (search_job_) {
            search_job_->Cancel();
            search_job_.reset();
        }
        scanning_ = false;
        sink_->PurgeResultsOlderThan(last_scan_);
    }

    void StartBackgroundDiscovery() override {
        std::lock_guard lock{job_mutex_};
        spdlog::trace("Start player background discovery");
        if (scanning_job_ && !scanning_job_->IsCancelled()) {
            return;
        }
        std::weak_ptr<PlayerDiscovery> weak = shared_from_this();
        scanning_job_ = scheduler_->ScheduleWithFixedDelay([weak] {
            if (auto self = weak.lock()) {
                self->ScanForNewPlayers();
            }
        }, options_.initial_delay, options_.scan_interval);
        spdlog::info("Player background discovery active, first scan in {} ms, then every {} ms",
                     options_.initial_delay.count(), options_.scan_interval.count());
    }

    void StopBackgroundDiscovery() override {
        std::lock_guard lock{job_mutex_};
        if (scanning_job_ && !scanning_job_->IsCancelled()) {
            spdlog::debug("Stop player background discovery");
            scanning_job_->Cancel();
        }
        scanning_job_.reset();
    }

    void ScanForNewPlayers() override {
        std::lock_guard lock{scan_mutex_};
        sink_->PurgeResultsOlderThan(last_scan_);
        RunScanPass();
    }

    void PlayerChanged() override {
        spdlog::debug("Bridge {} reports changed players or groups", bridge_->GetUid());
        ScanForNewPlayers();
    }

    bool IsBackgroundDiscoveryActive() const override {
        std::lock_guard lock{job_mutex_};
        return scanning_job_ && !scanning_job_->IsCancelled();
    }

    bool IsScanning() const override {
        return scanning_;
    }

    Timestamp GetTimestampOfLastScan() const override {
        std::lock_guard lock{scan_mutex_};
        return last_scan_;
    }

    std::vector<EntityKind> GetSupportedKinds() const override {
        return {EntityKind::player, EntityKind::group};
    }

private:
    // Caller holds scan_mutex_. False when the pass was aborted.
    bool RunScanPass() {
        auto bridge_uid = bridge_->GetUid();

        spdlog::debug("Start scan for players");
        auto players = bridge_->QueryNewPlayers();
        if (!players) {
            spdlog::debug("No player data from bridge {}, scan aborted", bridge_uid);
            return false;
        }
        spdlog::debug("Found: {} new players", players->size());
        for (auto const& [pid, player] : *players) {
            sink_->EntityDiscovered(MakePlayerResult(player, bridge_uid, options_.now()));
        }

        spdlog::debug("Start scan for groups");
        auto groups = bridge_->QueryNewGroups();
        if (!groups) {
            spdlog::debug("No group data from bridge {}, scan aborted", bridge_uid);
            return false;
        }
        if (groups->empty()) {
            spdlog::debug("No groups found");
        } else {
            spdlog::debug("Found: {} new groups", groups->size());
            for (auto const& [hash, group] : *groups) {
                auto result = MakeGroupResult(group, bridge_uid, options_.now());
                auto uid = result.uid;
                sink_->EntityDiscovered(std::move(result));
                sink_->SetEntityStatusOnline(uid);
            }
        }

        RemovedGroups();
        RemovedPlayers();
        return true;
    }

    void RemovedGroups() {
        for (auto const& [hash, group] : bridge_->QueryRemovedGroups()) {
            auto uid = GroupUid(group);
            spdlog::debug("Removed group: {}", uid.ToString());
            sink_->EntityRemoved(uid);
            sink_->SetEntityStatusOffline(uid);
        }
    }

    void RemovedPlayers() {
        for (auto const& [pid, player] : bridge_->QueryRemovedPlayers()) {
            auto uid = PlayerUid(player);
            spdlog::debug("Removed player: {}", uid.ToString());
            sink_->EntityRemoved(uid);
        }
    }

private:
    std::shared_ptr<IBridge> bridge_;
    std::shared_ptr<IDiscoverySink> sink_;
    std::shared_ptr<IScheduler> scheduler_;
    DiscoveryOptions options_;
    std::optional<int> listener_token_;

    mutable std::mutex scan_mutex_;
    Timestamp last_scan_{};
    std::shared_ptr<IScheduledJob> search_job_;
    std::atomic_bool scanning_{false};

    mutable std::mutex job_mutex_;
    std::shared_ptr<IScheduledJob> scanning_job_;
};

std::shared_ptr<IPlayerDiscovery> CreatePlayerDiscovery(std::shared_ptr<IBridge> bridge,
                                                        std::shared_ptr<IDiscoverySink> sink,
                                                        std::shared_ptr<IScheduler> scheduler,
                                                        DiscoveryOptions options) {
    auto discovery = std::make_shared<PlayerDiscovery>(std::move(bridge), std::move(sink),
                                                       std::move(scheduler), std::move(options));
    discovery->RegisterWithBridge();
    return discovery;
}
