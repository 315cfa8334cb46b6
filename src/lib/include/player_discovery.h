#pragma once

#include "bridge.h"
#include "discovery_sink.h"
#include "entities.h"
#include "scheduler.h"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

constexpr std::chrono::seconds kSearchTime{5};
constexpr std::chrono::seconds kInitialDelay{5};
constexpr std::chrono::seconds kScanInterval{20};

struct DiscoveryOptions {
    std::chrono::milliseconds search_time = kSearchTime;
    std::chrono::milliseconds initial_delay = kInitialDelay;
    std::chrono::milliseconds scan_interval = kScanInterval;
    std::function<Timestamp()> now = [] { return Clock::now(); };
};

// Discovers players and groups behind a bridge and keeps the sink in line with
// the bridge's membership.
class IPlayerDiscovery {
public:
    // Manual scan session: purge stale results, run one scan pass, and stop
    // the session after the search time.
    virtual void StartScan() = 0;
    virtual void StopScan() = 0;

    virtual void StartBackgroundDiscovery() = 0;
    virtual void StopBackgroundDiscovery() = 0;

    // Purge stale results and run one scan pass now.
    virtual void ScanForNewPlayers() = 0;

    // Membership change callback of the bridge.
    virtual void PlayerChanged() = 0;

    virtual bool IsBackgroundDiscoveryActive() const = 0;
    virtual bool IsScanning() const = 0;
    virtual Timestamp GetTimestampOfLastScan() const = 0;
    virtual std::vector<EntityKind> GetSupportedKinds() const = 0;

    virtual ~IPlayerDiscovery() = default;
};

// Registers the discovery with the bridge as a membership listener.
std::shared_ptr<IPlayerDiscovery> CreatePlayerDiscovery(std::shared_ptr<IBridge> bridge,
                                                        std::shared_ptr<IDiscoverySink> sink,
                                                        std::shared_ptr<IScheduler> scheduler,
                                                        DiscoveryOptions options = {});
