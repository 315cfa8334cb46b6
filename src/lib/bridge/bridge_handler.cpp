#include "bridge_handler.h"

#include "channel_manager.h"
#include "membership_cache.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::disconnected: return "disconnected";
        case ConnectionState::connecting: return "connecting";
        case ConnectionState::connected: return "connected";
        case ConnectionState::disposing: return "disposing";
    }
    return "unknown";
}

std::chrono::milliseconds BackoffDelay(BridgeOptions const& options, int attempt) {
    auto delay = options.initial_backoff;
    for (int i = 1; i < attempt && delay < options.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, options.max_backoff);
}

class BridgeHandler : public IBridgeHandler, public std::enable_shared_from_this<BridgeHandler> {
public:
    BridgeHandler(BridgeConfig config, std::shared_ptr<ISystemClient> client,
                  std::shared_ptr<IScheduler> scheduler, EventBus& bus, BridgeOptions options)
        : config_(std::move(config))
        , client_(std::move(client))
        , scheduler_(std::move(scheduler))
        , bus_(bus)
        , options_(options) {}

    ~BridgeHandler() override {
        std::shared_ptr<IScheduledJob> job;
        {
            std::lock_guard lock{mutex_};
            job = std::exchange(startup_job_, nullptr);
        }
        if (job) {
            job->Cancel();
        }
    }

    void Initialize() override {
        {
            std::lock_guard lock{mutex_};
            if (state_ != ConnectionState::disconnected) {
                spdlog::debug("Bridge '{}' is {}, skip initialize", config_.name, ToString(state_));
                return;
            }
            state_ = ConnectionState::connecting;
            connect_in_progress_ = true;
        }
        // The delay gives the system time to recover after a restart.
        bool delayed = connection_delay_.exchange(false);
        spdlog::info("Initialize bridge '{}' with host '{}'", config_.name, config_.host);

        bool connected = Connect(delayed);

        std::unique_lock lock{mutex_};
        connect_in_progress_ = false;
        cv_.notify_all();
        if (state_ == ConnectionState::disposing) {
            return;
        }
        if (!connected) {
            state_ = ConnectionState::disconnected;
            status_ = BridgeStatus::offline;
            spdlog::warn("Bridge '{}': no connection to {}:{} after {} attempts", config_.name, config_.host,
                         config_.port, options_.max_connect_attempts);
            return;
        }
        state_ = ConnectionState::connected;

        if (!registered_for_events_) {
            std::weak_ptr<BridgeHandler> weak = shared_from_this();
            client_->OnEvent([weak](BridgeEvent const& event) {
                if (auto self = weak.lock()) {
                    self->HandleBridgeEvent(event);
                }
            });
            registered_for_events_ = true;
        }
        ScheduledStartUp();
    }

    void Dispose() override {
        std::shared_ptr<IScheduledJob> job;
        {
            std::unique_lock lock{mutex_};
            disposal_ongoing_ = true;
            state_ = ConnectionState::disposing;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !connect_in_progress_; });
            job = std::exchange(startup_job_, nullptr);
            registered_for_events_ = false;
        }
        if (job) {
            job->Cancel();
        }
        client_->OnEvent({});
        spdlog::debug("Bridge '{}' removed from change notifications", config_.name);
        client_->CloseConnection();

        std::lock_guard lock{mutex_};
        state_ = ConnectionState::disconnected;
        status_ = BridgeStatus::offline;
        spdlog::debug("Dispose bridge '{}'", config_.name);
    }

    std::optional<PlayerMap> QueryNewPlayers() override {
        if (GetConnectionState() != ConnectionState::connected) {
            return std::nullopt;
        }
        auto players = client_->FetchPlayers();
        if (!players) {
            return std::nullopt;
        }
        return cache_.UpdatePlayers(*players);
    }

    std::optional<GroupMap> QueryNewGroups() override {
        if (GetConnectionState() != ConnectionState::connected) {
            return std::nullopt;
        }
        auto groups = client_->FetchGroups();
        if (!groups) {
            return std::nullopt;
        }
        return cache_.UpdateGroups(*groups);
    }

    GroupMap QueryRemovedGroups() override {
        return cache_.TakeRemovedGroups();
    }

    PlayerMap QueryRemovedPlayers() override {
        return cache_.TakeRemovedPlayers();
    }

    int RegisterMembershipListener(std::function<void()> listener) override {
        return bus_.Subscribe<MembershipChanged>([listener = std::move(listener)](MembershipChanged const&) {
            listener();
        });
    }

    void UnregisterMembershipListener(int token) override {
        bus_.Unsubscribe(token);
    }

    std::string GetUid() const override {
        return config_.uid;
    }

    void ChildHandlerInitialized(ManagedEntity const& entity) override {
        Channel channel{
            .id = ChannelId(entity.uid),
            .label = entity.name,
            .properties = {{kPropName, entity.name}, {kPropPid, entity.pid}},
        };
        channels_.AddSingleChannel(std::move(channel));
        spdlog::debug("Initialize child handler for: {}", entity.uid.ToString());
    }

    void ChildHandlerDisposed(EntityUid const& uid) override {
        {
            std::lock_guard lock{mutex_};
            // Keep the channels while the bridge itself goes away.
            if (disposal_ongoing_) {
                return;
            }
        }
        channels_.RemoveSingleChannel(ChannelId(uid));
        spdlog::debug("Dispose child handler for: {}", uid.ToString());
    }

    void HandleBridgeEvent(BridgeEvent const& event) override {
        switch (event.type) {
            case BridgeEventType::players_changed:
            case BridgeEventType::groups_changed:
                bus_.Publish<MembershipChanged>(MembershipChanged{});
                break;
            case BridgeEventType::connection_lost: {
                std::lock_guard lock{mutex_};
                if (state_ == ConnectionState::connected) {
                    state_ = ConnectionState::disconnected;
                }
                status_ = BridgeStatus::offline;
                spdlog::warn("Bridge '{}' offline: connection lost", config_.name);
                break;
            }
            case BridgeEventType::connection_restored: {
                connection_delay_ = true;
                std::weak_ptr<BridgeHandler> weak = shared_from_this();
                scheduler_->Post([weak] {
                    if (auto self = weak.lock()) {
                        self->Initialize();
                    }
                });
                break;
            }
        }
    }

    ConnectionState GetConnectionState() const override {
        std::lock_guard lock{mutex_};
        return state_;
    }

    BridgeStatus GetStatus() const override {
        std::lock_guard lock{mutex_};
        return status_;
    }

    std::vector<Channel> GetChannels() const override {
        return channels_.GetChannels();
    }

private:
    bool Connect(bool delayed) {
        for (int attempt = 1; attempt <= options_.max_connect_attempts; ++attempt) {
            if (client_->EstablishConnection(config_.host, config_.port, delayed)) {
                return true;
            }
            client_->CloseConnection();
            spdlog::debug("Could not initialize connection to the system (attempt {}/{})", attempt,
                          options_.max_connect_attempts);
            if (attempt == options_.max_connect_attempts) {
                break;
            }
            std::unique_lock lock{mutex_};
            if (cv_.wait_for(lock, BackoffDelay(options_, attempt),
                             [this] { return state_ == ConnectionState::disposing; })) {
                spdlog::debug("Bridge '{}': connection wait interrupted by dispose", config_.name);
                return false;
            }
        }
        return false;
    }

    // Caller holds mutex_.
    void ScheduledStartUp() {
        std::weak_ptr<BridgeHandler> weak = shared_from_this();
        startup_job_ = scheduler_->Schedule([weak] {
            if (auto self = weak.lock()) {
                self->StartUp();
            }
        }, options_.startup_delay);
    }

    void StartUp() {
        {
            std::lock_guard lock{mutex_};
            if (state_ != ConnectionState::connected) {
                return;
            }
            disposal_ongoing_ = false;
        }
        client_->StartEventListener(config_.heartbeat);
        spdlog::debug("System heart beat started. Pulse time is {}s", config_.heartbeat.count());

        std::lock_guard lock{mutex_};
        status_ = BridgeStatus::online;
        spdlog::info("Bridge '{}' online", config_.name);
    }

private:
    BridgeConfig config_;
    std::shared_ptr<ISystemClient> client_;
    std::shared_ptr<IScheduler> scheduler_;
    EventBus& bus_;
    BridgeOptions options_;

    MembershipCache cache_;
    ChannelManager channels_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConnectionState state_{ConnectionState::disconnected};
    BridgeStatus status_{BridgeStatus::unknown};
    bool connect_in_progress_{false};
    bool registered_for_events_{false};
    bool disposal_ongoing_{false};
    std::shared_ptr<IScheduledJob> startup_job_;
    std::atomic_bool connection_delay_{false};
};

std::shared_ptr<IBridgeHandler> CreateBridgeHandler(BridgeConfig config,
                                                    std::shared_ptr<ISystemClient> client,
                                                    std::shared_ptr<IScheduler> scheduler,
                                                    EventBus& bus,
                                                    BridgeOptions options) {
    return std::make_shared<BridgeHandler>(std::move(config), std::move(client), std::move(scheduler), bus,
                                           options);
}
