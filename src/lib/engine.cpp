#include "engine.h"
#include "bridge_handler.h"
#include "event_bus.h"
#include "inbox.h"
#include "player_discovery.h"
#include "scheduler.h"
#include "system_client.h"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <atomic>

namespace net = boost::asio;

class InboxPrinter {
public:
    InboxPrinter(EventBus& bus) : bus_(bus) {
        logger_ = spdlog::get("inbox");
        if (!logger_) {
            logger_ = spdlog::default_logger();
        }
        tokens_.push_back(bus_.Subscribe<ResultAdded>([this] (ResultAdded const& msg) {
            logger_->info("discovered {} '{}' on bridge {}", msg.result.uid.ToString(), msg.result.label,
                          msg.result.bridge_uid);
        }));
        tokens_.push_back(bus_.Subscribe<ResultRemoved>([this] (ResultRemoved const& msg) {
            logger_->info("removed {}", msg.uid.ToString());
        }));
        tokens_.push_back(bus_.Subscribe<ThingAdded>([this] (ThingAdded const& msg) {
            logger_->info("adopted {} '{}'", msg.thing.uid.ToString(), msg.thing.label);
        }));
        tokens_.push_back(bus_.Subscribe<ThingStatusChanged>([this] (ThingStatusChanged const& msg) {
            logger_->info("{} is {}", msg.uid.ToString(), ToString(msg.status));
        }));
    }

    ~InboxPrinter() {
        for (int token : tokens_) {
            bus_.Unsubscribe(token);
        }
    }

private:
    EventBus& bus_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<int> tokens_;
};

class Engine : public IEngine {
public:
    Engine(net::io_context& io_context, AppConfig config)
        : io_context_(io_context)
        , config_(std::move(config))
        , printer_(bus_)
    {
        scheduler_ = CreateScheduler(io_context_.get_executor());
        bus_.SetSchedulerCallback([this] (auto callback) { scheduler_->Post(std::move(callback)); });

        client_ = CreateSnapshotClient(io_context_.get_executor(), config_.snapshot_file);
        bridge_ = CreateBridgeHandler(config_.bridge, client_, scheduler_, bus_);
        inbox_ = std::make_shared<DiscoveryInbox>(bus_, config_.auto_approve);
        discovery_ = CreatePlayerDiscovery(bridge_, inbox_, scheduler_);

        bus_.Subscribe<ThingAdded>([this] (ThingAdded const& msg) {
            bridge_->ChildHandlerInitialized(ToManagedEntity(msg.thing));
        });
        // Refreshes the channel, a group leader may have changed.
        bus_.Subscribe<ThingStatusChanged>([this] (ThingStatusChanged const& msg) {
            if (msg.status != ThingStatus::online) {
                return;
            }
            if (auto thing = inbox_->GetThing(msg.uid)) {
                bridge_->ChildHandlerInitialized(ToManagedEntity(*thing));
            }
        });
        bus_.Subscribe<ThingRemoved>([this] (ThingRemoved const& msg) {
            bridge_->ChildHandlerDisposed(msg.uid);
        });
    }

    ~Engine() override {
        Stop();
    }

    void Start() override {
        spdlog::info("Start discovery on bridge {} ({}:{})", config_.bridge.uid, config_.bridge.host,
                     config_.bridge.port);
        scheduler_->Post([bridge = bridge_] { bridge->Initialize(); });
        discovery_->StartBackgroundDiscovery();
    }

    void Stop() override {
        if (stopped_.exchange(true)) {
            return;
        }
        discovery_->StopBackgroundDiscovery();
        discovery_->StopScan();
        bridge_->Dispose();
        spdlog::info("Discovery stopped, {} pending results, {} things", inbox_->GetResults().size(),
                     inbox_->GetThings().size());
    }

    std::vector<DiscoveryResult> GetResults() const override {
        return inbox_->GetResults();
    }

    std::vector<Thing> GetThings() const override {
        return inbox_->GetThings();
    }

private:
    static ManagedEntity ToManagedEntity(Thing const& thing) {
        std::string pid = thing.uid.id;
        if (auto it = thing.properties.find(kPropPid); it != thing.properties.end()) {
            pid = it->second;
        }
        return ManagedEntity{thing.uid, thing.label, pid};
    }

private:
    net::io_context& io_context_;
    AppConfig config_;
    EventBus bus_;
    InboxPrinter printer_;

    std::shared_ptr<IScheduler> scheduler_;
    std::shared_ptr<ISystemClient> client_;
    std::shared_ptr<IBridgeHandler> bridge_;
    std::shared_ptr<DiscoveryInbox> inbox_;
    std::shared_ptr<IPlayerDiscovery> discovery_;
    std::atomic_bool stopped_{false};
};

std::shared_ptr<IEngine> CreateEngine(net::io_context& io_context, AppConfig config) {
    return std::make_shared<Engine>(io_context, std::move(config));
}
